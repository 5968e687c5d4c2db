#pragma once
#include <string>
#include <utility>
#include <boost/asio/awaitable.hpp>

// Transport for one feed request. Implementations throw on network errors,
// timeouts and non-success HTTP statuses.
class FeedClient
{
public:
    virtual ~FeedClient() = default;
    virtual boost::asio::awaitable<std::string> fetch(std::string target) = 0;
};
