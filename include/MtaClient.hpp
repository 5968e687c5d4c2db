#pragma once
#include <string>
#include <chrono>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include "FeedClient.hpp"

class MtaClient : public FeedClient
{
private:
    boost::asio::io_context& ioContext;
    boost::asio::ssl::context sslContext;
    std::string apiKey;
    std::chrono::seconds timeout;
    void configureTlsStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);
    boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> resolve(boost::asio::ip::tcp::resolver& resolver, std::chrono::steady_clock::time_point expiry);
    boost::asio::awaitable<void> connect(boost::asio::ip::tcp::resolver::results_type results, boost::beast::ssl_stream<boost::beast::tcp_stream>& stream, std::chrono::steady_clock::time_point expiry);
    boost::beast::http::request<boost::beast::http::string_body> buildGetRequest(std::string const& target) const;
    boost::asio::awaitable<void> sendRequest(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream, boost::beast::http::request<boost::beast::http::string_body> const& request);
    boost::asio::awaitable<boost::beast::http::response<boost::beast::http::string_body>> readResponse(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);
    boost::asio::awaitable<void> shutdownStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);


public:
    MtaClient(boost::asio::io_context& ioc, std::string key, std::chrono::seconds fetchTimeout);
    boost::asio::awaitable<std::string> fetch(std::string target) override;
};
