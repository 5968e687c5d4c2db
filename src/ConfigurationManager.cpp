#include <cstdlib>
#include <stdexcept>
#include "ConfigurationManager.hpp"

ConfigurationManager::ConfigurationManager()
{
    const char* envAPIKey = std::getenv("MTA_API_KEY");
    if(!envAPIKey) throw std::runtime_error("MTA_API_KEY not set.");
    apiKey = envAPIKey;

    databasePath = readOptional("NEXTRIDE_DB_PATH", DEFAULT_DB_PATH);
    timeZone     = readOptional("NEXTRIDE_TIMEZONE", DEFAULT_TIMEZONE);

    std::string timeoutText = readOptional("NEXTRIDE_FETCH_TIMEOUT", std::to_string(DEFAULT_FETCH_TIMEOUT_SEC));
    std::size_t consumed = 0;
    int timeoutSec = 0;
    try
    {
        timeoutSec = std::stoi(timeoutText, &consumed);
    }
    catch (std::exception const&)
    {
        throw std::runtime_error("NEXTRIDE_FETCH_TIMEOUT is not a number: " + timeoutText);
    }
    if (consumed != timeoutText.size() || timeoutSec <= 0)
        throw std::runtime_error("NEXTRIDE_FETCH_TIMEOUT must be a positive number of seconds: " + timeoutText);
    fetchTimeout = std::chrono::seconds(timeoutSec);

    subwayFeeds = {
        {"Lines 1-7",   "/Dataservice/mtagtfsfeeds/nyct%2Fgtfs"},
        {"Lines A-E",   "/Dataservice/mtagtfsfeeds/nyct%2Fgtfs-ace"},
        {"Lines N-W",   "/Dataservice/mtagtfsfeeds/nyct%2Fgtfs-nqrw"},
        {"Lines B-M",   "/Dataservice/mtagtfsfeeds/nyct%2Fgtfs-bdfm"},
        {"Line L",      "/Dataservice/mtagtfsfeeds/nyct%2Fgtfs-l"},
        {"Line G",      "/Dataservice/mtagtfsfeeds/nyct%2Fgtfs-g"},
        {"Lines J/Z",   "/Dataservice/mtagtfsfeeds/nyct%2Fgtfs-jz"},
        {"Staten Isl",  "/Dataservice/mtagtfsfeeds/nyct%2Fgtfs-si"}
    };

    alertFeed = {"Subway Alerts", "/Dataservice/mtagtfsfeeds/camsys%2Fsubway-alerts"};
}

std::string ConfigurationManager::readOptional(char const* name, std::string fallback)
{
    const char* value = std::getenv(name);
    if (!value || !*value) return fallback;
    return value;
}

std::string ConfigurationManager::getAPIKey() const noexcept { return apiKey; }
std::string const& ConfigurationManager::getDatabasePath() const noexcept { return databasePath; }
std::string const& ConfigurationManager::getTimeZone() const noexcept { return timeZone; }
std::chrono::seconds ConfigurationManager::getFetchTimeout() const noexcept { return fetchTimeout; }
const std::vector<FeedEndpoint>& ConfigurationManager::getFeeds() const noexcept { return subwayFeeds; }
FeedEndpoint const& ConfigurationManager::getAlertFeed() const noexcept { return alertFeed; }
