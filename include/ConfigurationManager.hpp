#pragma once
#include <string>
#include <vector>
#include <chrono>

struct FeedEndpoint
{
    std::string name;
    std::string url;
};


class ConfigurationManager
{
private:
    std::string apiKey;
    std::string databasePath;
    std::string timeZone;
    std::chrono::seconds fetchTimeout;
    std::vector<FeedEndpoint> subwayFeeds;
    FeedEndpoint alertFeed;

    static std::string readOptional(char const* name, std::string fallback);

public:
    ConfigurationManager();
    static inline const std::string MTA_HOST   = "api-endpoint.mta.info";
    static inline const std::string MTA_PORT   = "443";
    static inline const std::string DEFAULT_DB_PATH  = "nextride.db";
    static inline const std::string DEFAULT_TIMEZONE = "America/New_York";
    static constexpr int DEFAULT_FETCH_TIMEOUT_SEC = 10;

    [[nodiscard]] std::string getAPIKey() const noexcept;
    [[nodiscard]] std::string const& getDatabasePath() const noexcept;
    [[nodiscard]] std::string const& getTimeZone() const noexcept;
    [[nodiscard]] std::chrono::seconds getFetchTimeout() const noexcept;
    [[nodiscard]] std::vector<FeedEndpoint> const& getFeeds() const noexcept;
    [[nodiscard]] FeedEndpoint const& getAlertFeed() const noexcept;
};
