#pragma once
#include <string>
#include <vector>
#include <optional>
#include "Types.hpp"

class SQLiteStore;

enum class Direction
{
    North,
    South
};

// Read side of the static schedule tables.
class StopManager
{
private:
    SQLiteStore& db;

public:
    explicit StopManager(SQLiteStore& store);

    // Parent stations only, one per (name, address).
    std::vector<Station> stations();
    std::vector<Route> routes();
    std::optional<std::string> trainsAt(std::string const& stopId);

    static std::string platformId(std::string const& stationId, Direction direction);
    static std::string stationOf(std::string const& stopId);
    static std::optional<Direction> parseDirection(std::string const& text);
};
