#include "gtest/gtest.h"

#include <cstdlib>
#include <stdexcept>

#include "ConfigurationManager.hpp"

namespace {

struct configuration_fixture : public ::testing::Test
{
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear()
    {
        unsetenv("MTA_API_KEY");
        unsetenv("NEXTRIDE_DB_PATH");
        unsetenv("NEXTRIDE_TIMEZONE");
        unsetenv("NEXTRIDE_FETCH_TIMEOUT");
    }
};

}  // namespace

TEST_F(configuration_fixture, api_key_required)
{
    EXPECT_THROW(ConfigurationManager(), std::runtime_error);
}

TEST_F(configuration_fixture, defaults)
{
    setenv("MTA_API_KEY", "secret", 1);

    ConfigurationManager config;

    EXPECT_EQ("secret", config.getAPIKey());
    EXPECT_EQ(ConfigurationManager::DEFAULT_DB_PATH, config.getDatabasePath());
    EXPECT_EQ("America/New_York", config.getTimeZone());
    EXPECT_EQ(std::chrono::seconds(10), config.getFetchTimeout());
    EXPECT_EQ(8U, config.getFeeds().size());
    EXPECT_EQ("/Dataservice/mtagtfsfeeds/nyct%2Fgtfs", config.getFeeds()[0].url);
    EXPECT_EQ("/Dataservice/mtagtfsfeeds/camsys%2Fsubway-alerts", config.getAlertFeed().url);
}

TEST_F(configuration_fixture, overrides)
{
    setenv("MTA_API_KEY", "", 1);
    setenv("NEXTRIDE_DB_PATH", "/tmp/other.db", 1);
    setenv("NEXTRIDE_TIMEZONE", "UTC", 1);
    setenv("NEXTRIDE_FETCH_TIMEOUT", "3", 1);

    ConfigurationManager config;

    EXPECT_EQ("", config.getAPIKey());
    EXPECT_EQ("/tmp/other.db", config.getDatabasePath());
    EXPECT_EQ("UTC", config.getTimeZone());
    EXPECT_EQ(std::chrono::seconds(3), config.getFetchTimeout());
}

TEST_F(configuration_fixture, bad_timeout_rejected)
{
    setenv("MTA_API_KEY", "secret", 1);

    setenv("NEXTRIDE_FETCH_TIMEOUT", "soon", 1);
    EXPECT_THROW(ConfigurationManager(), std::runtime_error);

    setenv("NEXTRIDE_FETCH_TIMEOUT", "10s", 1);
    EXPECT_THROW(ConfigurationManager(), std::runtime_error);

    setenv("NEXTRIDE_FETCH_TIMEOUT", "0", 1);
    EXPECT_THROW(ConfigurationManager(), std::runtime_error);
}
