#include <algorithm>
#include "SQLiteStore.hpp"
#include "AlertMatcher.hpp"

AlertMatcher::AlertMatcher(SQLiteStore& store)
    : db(store)
{
}

AlertStatus AlertMatcher::classify(std::optional<EpochSeconds> start, std::optional<EpochSeconds> end, EpochSeconds now)
{
    if (start && *start > now)
        return AlertStatus::Upcoming;
    if (end && *end < now)
        return AlertStatus::Past;
    return AlertStatus::Active;
}

std::string AlertMatcher::statusName(AlertStatus status)
{
    switch (status)
    {
        case AlertStatus::Upcoming: return "upcoming";
        case AlertStatus::Past:     return "past";
        case AlertStatus::Active:   return "active";
    }
    return "active";
}

std::vector<UserAlert> AlertMatcher::fetchUserAlerts(std::int64_t userId, EpochSeconds now)
{
    std::vector<UserAlert> results;

    SQLiteStore::Statement stmt(db,
        "SELECT DISTINCT a.alert_id, a.header_text, a.description_text, "
        "       ap.start_time, ap.end_time, "
        "       COALESCE(ie.route_id, ie.stop_id) AS entity_id "
        "FROM alerts a "
        "JOIN active_periods ap ON a.alert_id = ap.alert_id "
        "JOIN informed_entities ie ON a.alert_id = ie.alert_id "
        "JOIN subscriptions s ON (s.route_id = ie.route_id OR s.stop_id = ie.stop_id) "
        "WHERE s.user_id = ?;");
    stmt.bind(1, userId);

    while (stmt.step())
    {
        UserAlert a;
        a.alertId         = stmt.text(0);
        a.headerText      = stmt.optionalText(1);
        a.descriptionText = stmt.optionalText(2);
        a.start           = stmt.optionalInt64(3);
        a.end             = stmt.optionalInt64(4);
        a.entityId        = stmt.text(5);
        a.status          = classify(a.start, a.end, now);
        results.push_back(std::move(a));
    }

    std::stable_sort(results.begin(), results.end(), [](UserAlert const& lhs, UserAlert const& rhs)
    {
        if (lhs.entityId != rhs.entityId)
            return lhs.entityId < rhs.entityId;

        std::string lhsStatus = statusName(lhs.status);
        std::string rhsStatus = statusName(rhs.status);
        if (lhsStatus != rhsStatus)
            return lhsStatus > rhsStatus;

        // Null starts sort after every bounded start.
        if (lhs.start.has_value() != rhs.start.has_value())
            return lhs.start.has_value();
        if (lhs.start && *lhs.start != *rhs.start)
            return *lhs.start < *rhs.start;

        return lhs.alertId < rhs.alertId;
    });

    return results;
}
