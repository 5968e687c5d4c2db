#pragma once
#include <string>
#include <cstdint>
#include "SQLiteStore.hpp"

inline void insertStop(SQLiteStore& db, std::string const& stopId, std::string const& name = "",
                       std::string const& address = "", std::string const& trains = "")
{
    SQLiteStore::Statement stmt(db, "INSERT INTO stops (stop_id, stop_name, address, trains) VALUES (?, ?, ?, ?);");
    stmt.bind(1, stopId);
    stmt.bind(2, name);
    stmt.bind(3, address);
    stmt.bind(4, trains);
    stmt.run();
}

inline void insertRoute(SQLiteStore& db, std::string const& routeId, std::string const& shortName, std::string const& longName)
{
    SQLiteStore::Statement stmt(db, "INSERT INTO routes (route_id, route_short_name, route_long_name) VALUES (?, ?, ?);");
    stmt.bind(1, routeId);
    stmt.bind(2, shortName);
    stmt.bind(3, longName);
    stmt.run();
}

inline std::int64_t countRows(SQLiteStore& db, std::string const& sql)
{
    SQLiteStore::Statement stmt(db, sql);
    if (!stmt.step())
        return -1;
    return stmt.int64(0);
}
