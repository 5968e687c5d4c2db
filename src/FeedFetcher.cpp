#include <iostream>
#include <memory>
#include <exception>
#include <stdexcept>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "FeedFetcher.hpp"

namespace {

// Shared between the waiting fetcher and the spawned client call, which may
// finish after the fetcher has given up on it.
struct PendingFetch
{
    explicit PendingFetch(boost::asio::any_io_executor executor)
        : deadline(executor)
    {
    }

    boost::asio::steady_timer deadline;
    bool done = false;
    std::exception_ptr error;
    std::string payload;
};

}  // namespace

FeedFetcher::FeedFetcher(FeedClient& feedClient, std::chrono::milliseconds groupTimeout)
    : client(feedClient)
    , timeout(groupTimeout)
{
}

bool FeedFetcher::looksLikeFeed(std::string const& payload)
{
    // Gateways answer outages with an HTML page and a 200.
    return !payload.empty() && payload[0] != '<';
}

boost::asio::awaitable<std::string> FeedFetcher::fetchWithDeadline(std::string const& target)
{
    auto executor = co_await boost::asio::this_coro::executor;
    auto pending = std::make_shared<PendingFetch>(executor);
    pending->deadline.expires_after(timeout);

    boost::asio::co_spawn(executor, client.fetch(target),
        [pending](std::exception_ptr e, std::string payload)
        {
            pending->done    = true;
            pending->error   = e;
            pending->payload = std::move(payload);
            pending->deadline.cancel();
        });

    // Cancelled when the client finishes, expires otherwise.
    if (!pending->done)
    {
        boost::system::error_code ec;
        co_await pending->deadline.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    if (!pending->done)
        throw std::runtime_error("timed out after " + std::to_string(timeout.count()) + " ms");
    if (pending->error)
        std::rethrow_exception(pending->error);

    co_return std::move(pending->payload);
}

boost::asio::awaitable<FetchResult> FeedFetcher::fetchAll(std::vector<FeedEndpoint> const& endpoints)
{
    FetchResult result;

    for (const auto& feed : endpoints)
    {
        try
        {
            std::string data = co_await fetchWithDeadline(feed.url);

            if (!looksLikeFeed(data))
                throw std::runtime_error("malformed payload (" + std::to_string(data.size()) + " bytes)");

            std::cout << "   | " << feed.name << ": " << data.size() << " bytes." << std::endl;
            result.feeds.push_back({feed.name, std::move(data)});
        }
        catch (std::exception const& e)
        {
            std::cerr << "[Fetcher] Error fetching " << feed.name << ": " << e.what() << std::endl;
            result.failedGroups.push_back(feed.name);
        }
    }

    co_return result;
}
