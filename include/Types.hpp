#pragma once
#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <cstdint>

// Seconds since the Unix epoch, UTC.
using EpochSeconds = std::int64_t;

// One scheduled trip as last reported by a feed.
struct TripUpdate
{
    std::string tripId;
    std::optional<EpochSeconds> startTime;  // Null unless both start_date and start_time were sent
    std::string routeId;
};

// Realtime estimate for one trip at one stop ("A12S").
struct StopTimeUpdate
{
    std::string tripId;
    std::string stopId;
    std::optional<EpochSeconds> arrivalTime;
    std::optional<EpochSeconds> departureTime;
};

struct ActivePeriod
{
    std::optional<EpochSeconds> start;  // Null = unbounded past
    std::optional<EpochSeconds> end;    // Null = unbounded future
};

struct InformedEntity
{
    std::optional<std::string> agencyId;
    std::optional<std::string> routeId;
    std::optional<std::string> stopId;
};

struct AlertRecord
{
    std::string alertId;
    std::optional<std::string> headerText;
    std::optional<std::string> descriptionText;
    std::vector<ActivePeriod> activePeriods;
    std::vector<InformedEntity> informedEntities;
};

// Everything one decoding pass extracted from a set of feeds.
struct DecodedBatch
{
    std::vector<TripUpdate> tripUpdates;
    std::vector<StopTimeUpdate> stopTimeUpdates;
    std::vector<AlertRecord> alerts;
};

struct StationDeparture
{
    std::string routeId;
    EpochSeconds departureTime;
    std::int64_t etaMinutes;
};

enum class AlertStatus
{
    Active,
    Upcoming,
    Past
};

struct UserAlert
{
    std::string alertId;
    std::optional<std::string> headerText;
    std::optional<std::string> descriptionText;
    std::optional<EpochSeconds> start;
    std::optional<EpochSeconds> end;
    AlertStatus status;
    std::string entityId;  // Route id of the matched entity, or its stop id when it has no route
};

struct StopTarget
{
    std::string stopId;
};

struct RouteTarget
{
    std::string routeId;
};

// A subscription watches exactly one stop or exactly one route.
using SubscriptionTarget = std::variant<StopTarget, RouteTarget>;

struct Subscription
{
    std::int64_t subscriptionId;
    std::int64_t userId;
    SubscriptionTarget target;
};

struct Station
{
    std::string stopId;
    std::string name;
    std::string address;
    std::string trains;  // Comma-joined route ids, e.g. "1,2,3"
};

struct Route
{
    std::string routeId;
    std::string shortName;
    std::string longName;
};
