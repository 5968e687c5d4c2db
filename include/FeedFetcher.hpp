#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include "ConfigurationManager.hpp"
#include "FeedClient.hpp"

struct FetchedFeed
{
    std::string group;
    std::string payload;
};

struct FetchResult
{
    std::vector<FetchedFeed> feeds;
    std::vector<std::string> failedGroups;
};

// Pulls every feed group once. A group that fails or outlives the per-group
// timeout is logged and reported in failedGroups; the remaining groups are
// still fetched.
class FeedFetcher
{
private:
    FeedClient& client;
    std::chrono::milliseconds timeout;

    static bool looksLikeFeed(std::string const& payload);
    boost::asio::awaitable<std::string> fetchWithDeadline(std::string const& target);

public:
    FeedFetcher(FeedClient& feedClient, std::chrono::milliseconds groupTimeout);

    boost::asio::awaitable<FetchResult> fetchAll(std::vector<FeedEndpoint> const& endpoints);
};
