#include "SQLiteStore.hpp"
#include "StopManager.hpp"

StopManager::StopManager(SQLiteStore& store)
    : db(store)
{
}

std::vector<Station> StopManager::stations()
{
    std::vector<Station> results;

    // MIN(stop_id) picks one row when several stations share a name and address.
    SQLiteStore::Statement stmt(db,
        "SELECT MIN(stop_id), stop_name, address, trains "
        "FROM stops "
        "WHERE substr(stop_id, -1) NOT IN ('N', 'S') "
        "GROUP BY stop_name, address "
        "ORDER BY stop_name, address, MIN(stop_id);");

    while (stmt.step())
    {
        Station s;
        s.stopId  = stmt.text(0);
        s.name    = stmt.text(1);
        s.address = stmt.text(2);
        s.trains  = stmt.text(3);
        results.push_back(std::move(s));
    }

    return results;
}

std::vector<Route> StopManager::routes()
{
    std::vector<Route> results;

    SQLiteStore::Statement stmt(db,
        "SELECT route_id, route_short_name, route_long_name "
        "FROM routes "
        "ORDER BY route_id ASC;");

    while (stmt.step())
    {
        Route r;
        r.routeId   = stmt.text(0);
        r.shortName = stmt.text(1);
        r.longName  = stmt.text(2);
        results.push_back(std::move(r));
    }

    return results;
}

std::optional<std::string> StopManager::trainsAt(std::string const& stopId)
{
    SQLiteStore::Statement stmt(db, "SELECT trains FROM stops WHERE stop_id = ?;");
    stmt.bind(1, stopId);
    if (stmt.step())
        return stmt.optionalText(0);
    return std::nullopt;
}

std::string StopManager::platformId(std::string const& stationId, Direction direction)
{
    return stationId + (direction == Direction::North ? "N" : "S");
}

std::string StopManager::stationOf(std::string const& stopId)
{
    if (stopId.size() > 1)
    {
        char last = stopId.back();
        if (last == 'N' || last == 'S')
            return stopId.substr(0, stopId.size() - 1);
    }

    return stopId;
}

std::optional<Direction> StopManager::parseDirection(std::string const& text)
{
    if (text == "N" || text == "n" || text == "north" || text == "Northbound")
        return Direction::North;
    if (text == "S" || text == "s" || text == "south" || text == "Southbound")
        return Direction::South;
    return std::nullopt;
}
