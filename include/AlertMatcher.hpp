#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include "Types.hpp"

class SQLiteStore;

class AlertMatcher
{
private:
    SQLiteStore& db;

public:
    explicit AlertMatcher(SQLiteStore& store);

    // Alerts touching any stop or route the user subscribes to, one row per
    // (alert, active period, matched entity). Rows of every status are
    // returned, ordered by entity id, then status name descending, then
    // period start (open starts last).
    std::vector<UserAlert> fetchUserAlerts(std::int64_t userId, EpochSeconds now);

    static AlertStatus classify(std::optional<EpochSeconds> start, std::optional<EpochSeconds> end, EpochSeconds now);
    static std::string statusName(AlertStatus status);
};
