#include "gtest/gtest.h"

#include <chrono>

#include "FeedFetcher.hpp"
#include "FeedDecoder.hpp"
#include "fake_feed_client.hpp"
#include "feed_builder.hpp"

TEST(feed_fetcher, failed_group_does_not_stop_others)
{
    auto feed = makeFeed();
    addTrip(feed, "A1", "1");

    FakeFeedClient client;
    client.payloads["/ok"] = feed.SerializeAsString();

    FeedFetcher fetcher(client, std::chrono::seconds(5));
    std::vector<FeedEndpoint> endpoints = {{"Down", "/down"}, {"Up", "/ok"}};

    FetchResult result = runAwaitable(fetcher.fetchAll(endpoints));

    EXPECT_EQ((std::vector<std::string>{"/down", "/ok"}), client.requested);
    ASSERT_EQ(1U, result.feeds.size());
    EXPECT_EQ("Up", result.feeds[0].group);
    EXPECT_EQ((std::vector<std::string>{"Down"}), result.failedGroups);

    FeedDecoder decoder("America/New_York");
    DecodedBatch batch = decoder.decode(result.feeds);
    ASSERT_EQ(1U, batch.tripUpdates.size());
    EXPECT_EQ("A1", batch.tripUpdates[0].tripId);
}

TEST(feed_fetcher, empty_and_html_bodies_count_as_failures)
{
    FakeFeedClient client;
    client.payloads["/empty"] = "";
    client.payloads["/html"] = "<html><body>Service Unavailable</body></html>";

    FeedFetcher fetcher(client, std::chrono::seconds(5));
    std::vector<FeedEndpoint> endpoints = {{"Empty", "/empty"}, {"Html", "/html"}};

    FetchResult result = runAwaitable(fetcher.fetchAll(endpoints));

    EXPECT_TRUE(result.feeds.empty());
    EXPECT_EQ((std::vector<std::string>{"Empty", "Html"}), result.failedGroups);
}

TEST(feed_fetcher, no_endpoints)
{
    FakeFeedClient client;
    FeedFetcher fetcher(client, std::chrono::seconds(5));
    std::vector<FeedEndpoint> endpoints;

    FetchResult result = runAwaitable(fetcher.fetchAll(endpoints));

    EXPECT_TRUE(result.feeds.empty());
    EXPECT_TRUE(result.failedGroups.empty());
}

TEST(feed_fetcher, hanging_group_times_out_and_others_proceed)
{
    auto feed = makeFeed();
    addTrip(feed, "L1", "L");

    FakeFeedClient client;
    client.payloads["/hang"] = feed.SerializeAsString();
    client.payloads["/ok"] = feed.SerializeAsString();
    client.hanging.insert("/hang");
    client.hangFor = std::chrono::seconds(30);

    FeedFetcher fetcher(client, std::chrono::milliseconds(100));
    std::vector<FeedEndpoint> endpoints = {{"Hang", "/hang"}, {"Other", "/ok"}};

    auto started = std::chrono::steady_clock::now();
    FetchResult result = runAwaitable(fetcher.fetchAll(endpoints));
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_EQ((std::vector<std::string>{"/hang", "/ok"}), client.requested);
    EXPECT_EQ((std::vector<std::string>{"Hang"}), result.failedGroups);
    ASSERT_EQ(1U, result.feeds.size());
    EXPECT_EQ("Other", result.feeds[0].group);
}
