#include <cmath>
#include "SQLiteStore.hpp"
#include "DepartureResolver.hpp"

DepartureResolver::DepartureResolver(SQLiteStore& store)
    : db(store)
{
}

std::int64_t DepartureResolver::etaMinutes(EpochSeconds departure, EpochSeconds now)
{
    return static_cast<std::int64_t>(std::llround(static_cast<double>(departure - now) / 60.0));
}

std::vector<StationDeparture> DepartureResolver::stationDepartures(std::string const& stopId, EpochSeconds now)
{
    std::vector<StationDeparture> results;

    // Bare columns next to MIN() come from the row holding the minimum.
    SQLiteStore::Statement stmt(db,
        "SELECT t.route_id, MIN(stu.departure_time) "
        "FROM trips_real_time AS t "
        "INNER JOIN stop_time_update AS stu ON t.trip_id = stu.trip_id "
        "INNER JOIN stops AS s ON stu.stop_id = s.stop_id "
        "WHERE s.stop_id = ? AND stu.departure_time > ? "
        "GROUP BY t.route_id "
        "ORDER BY t.route_id ASC;");
    stmt.bind(1, stopId);
    stmt.bind(2, now);

    while (stmt.step())
    {
        StationDeparture d;
        d.routeId       = stmt.text(0);
        d.departureTime = stmt.int64(1);
        d.etaMinutes    = etaMinutes(d.departureTime, now);
        results.push_back(std::move(d));
    }

    return results;
}

std::vector<StationDeparture> DepartureResolver::routeDepartures(std::string const& stopId, std::string const& routeId, EpochSeconds now)
{
    std::vector<StationDeparture> results;

    SQLiteStore::Statement stmt(db,
        "SELECT t.route_id, stu.departure_time "
        "FROM trips_real_time AS t "
        "INNER JOIN stop_time_update AS stu ON t.trip_id = stu.trip_id "
        "INNER JOIN stops AS s ON stu.stop_id = s.stop_id "
        "WHERE s.stop_id = ? AND t.route_id = ? AND stu.departure_time > ? "
        "ORDER BY stu.departure_time ASC "
        "LIMIT ?;");
    stmt.bind(1, stopId);
    stmt.bind(2, routeId);
    stmt.bind(3, now);
    stmt.bind(4, static_cast<std::int64_t>(ROUTE_DEPARTURE_LIMIT));

    while (stmt.step())
    {
        StationDeparture d;
        d.routeId       = stmt.text(0);
        d.departureTime = stmt.int64(1);
        d.etaMinutes    = etaMinutes(d.departureTime, now);
        results.push_back(std::move(d));
    }

    return results;
}
