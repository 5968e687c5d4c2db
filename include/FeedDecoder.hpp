#pragma once
#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <date/tz.h>
#include "gtfs-realtime.pb.h"
#include "Types.hpp"
#include "FeedFetcher.hpp"

struct TripUpdateEntity
{
    TripUpdate trip;
    std::vector<StopTimeUpdate> stopTimes;
};

struct AlertEntity
{
    AlertRecord alert;
};

// A feed entity carries either a trip update or an alert; everything else
// (vehicle positions) is dropped during classification.
using FeedEntity = std::variant<TripUpdateEntity, AlertEntity>;

class FeedDecoder
{
private:
    date::time_zone const* zone;

    TripUpdateEntity decodeTripUpdate(transit_realtime::TripUpdate const& tu) const;
    static AlertEntity decodeAlert(std::string const& entityId, transit_realtime::Alert const& alert);
    static std::optional<std::string> firstTranslation(transit_realtime::TranslatedString const& text);
    static std::optional<EpochSeconds> eventTime(bool present, transit_realtime::TripUpdate::StopTimeEvent const& event);

public:
    // Throws if the time zone is not in the tz database.
    explicit FeedDecoder(std::string const& timeZone);

    std::optional<FeedEntity> classify(transit_realtime::FeedEntity const& entity) const;

    // Combines a GTFS start_date ("YYYYMMDD") and start_time ("HH:MM:SS",
    // hours may run past 24 for trips that belong to the previous service
    // day) in the agency time zone. Null when either part is missing or
    // unparseable.
    std::optional<EpochSeconds> startTimestamp(std::string const& startDate, std::string const& startTime) const;

    // A payload that does not parse yields an empty batch.
    DecodedBatch decodePayload(std::string const& payload, std::string const& source) const;
    DecodedBatch decode(std::vector<FetchedFeed> const& feeds) const;
};
