#pragma once
#include <map>
#include <set>
#include <chrono>
#include <future>
#include <string>
#include <vector>
#include <stdexcept>
#include <boost/asio/io_context.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include "FeedClient.hpp"

// Serves canned payloads per target; targets without one fail like a
// network error would. Targets in `hanging` stall for `hangFor` before
// answering.
class FakeFeedClient : public FeedClient
{
public:
    std::map<std::string, std::string> payloads;
    std::set<std::string> hanging;
    std::chrono::milliseconds hangFor{std::chrono::seconds(30)};
    std::vector<std::string> requested;

    boost::asio::awaitable<std::string> fetch(std::string target) override
    {
        requested.push_back(target);

        if (hanging.count(target) > 0)
        {
            boost::asio::steady_timer stall(co_await boost::asio::this_coro::executor);
            stall.expires_after(hangFor);
            co_await stall.async_wait(boost::asio::use_awaitable);
        }

        auto it = payloads.find(target);
        if (it == payloads.end())
            throw std::runtime_error("connection refused: " + target);
        co_return it->second;
    }
};

// Drives a coroutine to completion on a private io_context. Work the
// coroutine abandoned (a fetch that outlived its deadline) is dropped with
// the io_context instead of being waited for.
template <typename T>
T runAwaitable(boost::asio::awaitable<T> task)
{
    boost::asio::io_context io;
    auto result = boost::asio::co_spawn(io, std::move(task), boost::asio::use_future);
    while (result.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
    {
        if (io.run_one() == 0)
            break;
    }
    return result.get();
}
