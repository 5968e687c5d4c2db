#include <iostream>
#include <sstream>
#include <cctype>
#include <charconv>
#include <stdexcept>
#include <iterator>
#include <algorithm>
#include "FeedDecoder.hpp"

namespace {

// Digits only: no sign, no padding, no overflow past the field width.
bool readField(std::string const& text, std::size_t pos, std::size_t len, int& out)
{
    for (std::size_t i = pos; i < pos + len; ++i)
    {
        if (!std::isdigit(static_cast<unsigned char>(text[i])))
            return false;
    }

    char const* first = text.data() + pos;
    char const* last = first + len;
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

// "H:MM:SS" or "HH:MM:SS".
bool parseClock(std::string const& text, int& h, int& m, int& s)
{
    std::size_t colon = text.find(':');
    if (colon == std::string::npos || colon == 0 || colon > 2)
        return false;
    if (text.size() != colon + 6 || text[colon + 3] != ':')
        return false;

    return readField(text, 0, colon, h)
        && readField(text, colon + 1, 2, m)
        && readField(text, colon + 4, 2, s);
}

}  // namespace

FeedDecoder::FeedDecoder(std::string const& timeZone)
    : zone(date::locate_zone(timeZone))
{
}

std::optional<EpochSeconds> FeedDecoder::startTimestamp(std::string const& startDate, std::string const& startTime) const
{
    if (startDate.empty() || startTime.empty())
        return std::nullopt;

    if (startDate.size() != 8)
        return std::nullopt;

    std::istringstream in(startDate);
    date::local_days serviceDay;
    in >> date::parse("%Y%m%d", serviceDay);
    if (in.fail() || in.peek() != std::char_traits<char>::eof())
        return std::nullopt;

    int h = 0, m = 0, s = 0;
    if (!parseClock(startTime, h, m, s))
        return std::nullopt;
    if (h >= 48 || m >= 60 || s >= 60)
        return std::nullopt;

    auto local = serviceDay + std::chrono::hours(h) + std::chrono::minutes(m) + std::chrono::seconds(s);
    auto utc = zone->to_sys(local, date::choose::earliest);
    return static_cast<EpochSeconds>(utc.time_since_epoch().count());
}

std::optional<EpochSeconds> FeedDecoder::eventTime(bool present, transit_realtime::TripUpdate::StopTimeEvent const& event)
{
    if (!present || !event.has_time())
        return std::nullopt;
    return static_cast<EpochSeconds>(event.time());
}

TripUpdateEntity FeedDecoder::decodeTripUpdate(transit_realtime::TripUpdate const& tu) const
{
    const auto& trip = tu.trip();
    if (trip.trip_id().empty())
        throw std::invalid_argument("trip update without trip_id");

    TripUpdateEntity out;
    out.trip.tripId  = trip.trip_id();
    out.trip.routeId = trip.route_id();

    if (trip.has_start_date() && trip.has_start_time())
        out.trip.startTime = startTimestamp(trip.start_date(), trip.start_time());

    out.stopTimes.reserve(tu.stop_time_update_size());
    for (const auto& st : tu.stop_time_update())
    {
        if (st.stop_id().empty())
            continue;

        StopTimeUpdate update;
        update.tripId        = out.trip.tripId;
        update.stopId        = st.stop_id();
        update.arrivalTime   = eventTime(st.has_arrival(), st.arrival());
        update.departureTime = eventTime(st.has_departure(), st.departure());
        out.stopTimes.push_back(std::move(update));
    }

    return out;
}

std::optional<std::string> FeedDecoder::firstTranslation(transit_realtime::TranslatedString const& text)
{
    if (text.translation_size() == 0)
        return std::nullopt;
    return text.translation(0).text();
}

AlertEntity FeedDecoder::decodeAlert(std::string const& entityId, transit_realtime::Alert const& alert)
{
    if (entityId.empty())
        throw std::invalid_argument("alert without entity id");

    AlertEntity out;
    out.alert.alertId = entityId;

    if (alert.has_header_text())
        out.alert.headerText = firstTranslation(alert.header_text());
    if (alert.has_description_text())
        out.alert.descriptionText = firstTranslation(alert.description_text());

    for (const auto& period : alert.active_period())
    {
        ActivePeriod p;
        if (period.has_start()) p.start = static_cast<EpochSeconds>(period.start());
        if (period.has_end())   p.end   = static_cast<EpochSeconds>(period.end());
        out.alert.activePeriods.push_back(p);
    }

    for (const auto& selector : alert.informed_entity())
    {
        InformedEntity e;
        if (selector.has_agency_id()) e.agencyId = selector.agency_id();
        if (selector.has_route_id())  e.routeId  = selector.route_id();
        if (selector.has_stop_id())   e.stopId   = selector.stop_id();
        out.alert.informedEntities.push_back(std::move(e));
    }

    return out;
}

std::optional<FeedEntity> FeedDecoder::classify(transit_realtime::FeedEntity const& entity) const
{
    if (entity.has_trip_update())
        return FeedEntity{decodeTripUpdate(entity.trip_update())};
    if (entity.has_alert())
        return FeedEntity{decodeAlert(entity.id(), entity.alert())};
    return std::nullopt;
}

DecodedBatch FeedDecoder::decodePayload(std::string const& payload, std::string const& source) const
{
    DecodedBatch batch;
    transit_realtime::FeedMessage feed;
    if (!feed.ParseFromString(payload))
    {
        std::cerr << "[Decoder] " << source << ": payload is not a GTFS-realtime FeedMessage." << std::endl;
        return batch;
    }

    int skipped = 0;
    for (const auto& entity : feed.entity())
    {
        try
        {
            std::optional<FeedEntity> decoded = classify(entity);
            if (!decoded)
                continue;

            if (auto* tu = std::get_if<TripUpdateEntity>(&*decoded))
            {
                batch.tripUpdates.push_back(std::move(tu->trip));
                for (auto& st : tu->stopTimes)
                    batch.stopTimeUpdates.push_back(std::move(st));
            }
            else if (auto* alert = std::get_if<AlertEntity>(&*decoded))
            {
                batch.alerts.push_back(std::move(alert->alert));
            }
        }
        catch (std::exception const& e)
        {
            ++skipped;
            std::cerr << "[Decoder] " << source << ": skipping entity '" << entity.id() << "': " << e.what() << std::endl;
        }
    }

    if (skipped > 0)
        std::cerr << "[Decoder] " << source << ": " << skipped << " entities skipped." << std::endl;

    return batch;
}

DecodedBatch FeedDecoder::decode(std::vector<FetchedFeed> const& feeds) const
{
    DecodedBatch batch;
    for (const auto& feed : feeds)
    {
        try
        {
            DecodedBatch part = decodePayload(feed.payload, feed.group);
            std::move(part.tripUpdates.begin(), part.tripUpdates.end(), std::back_inserter(batch.tripUpdates));
            std::move(part.stopTimeUpdates.begin(), part.stopTimeUpdates.end(), std::back_inserter(batch.stopTimeUpdates));
            std::move(part.alerts.begin(), part.alerts.end(), std::back_inserter(batch.alerts));
        }
        catch (std::exception const& e)
        {
            std::cerr << "[Decoder] Error decoding " << feed.group << ": " << e.what() << std::endl;
        }
    }

    std::cout << "[Decoder] " << batch.tripUpdates.size() << " trips, "
              << batch.stopTimeUpdates.size() << " stop time updates, "
              << batch.alerts.size() << " alerts." << std::endl;
    return batch;
}
