#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include "Types.hpp"

class SQLiteStore;

// Answers "when does the next train leave" from the live state. Stop ids are
// platform ids ("127N"); callers attach the direction suffix.
class DepartureResolver
{
private:
    SQLiteStore& db;

public:
    static constexpr std::size_t ROUTE_DEPARTURE_LIMIT = 3;

    explicit DepartureResolver(SQLiteStore& store);

    // Earliest departure after `now` for every route serving the platform,
    // ordered by route id.
    std::vector<StationDeparture> stationDepartures(std::string const& stopId, EpochSeconds now);

    // The next few departures of one route at the platform, soonest first.
    std::vector<StationDeparture> routeDepartures(std::string const& stopId, std::string const& routeId, EpochSeconds now);

    static std::int64_t etaMinutes(EpochSeconds departure, EpochSeconds now);
};
