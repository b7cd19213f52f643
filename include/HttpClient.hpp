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
#include "FeedTransport.hpp"

struct FeedUrl
{
    bool secure = false;
    std::string host;
    std::string port;
    std::string target;

    // Accepts http://host[:port]/path and https://host[:port]/path.
    // Throws TransportError for anything else.
    static FeedUrl parse(std::string const& url);

    // Target of a Location header, absolute or relative to this URL.
    [[nodiscard]] FeedUrl redirect(std::string const& location) const;
};

// Blocking HTTP(S) GET. Each call resolves, connects, sends one request and
// reads one response on a private io_context, then closes the connection.
// One redirect is followed.
class HttpClient : public FeedTransport
{
private:
    boost::asio::io_context ioContext;
    boost::asio::ssl::context sslContext;
    std::chrono::seconds timeout;

    void configureTlsStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream, FeedUrl const& url);
    boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> resolve(boost::asio::ip::tcp::resolver& resolver, FeedUrl const& url);
    boost::asio::awaitable<void> connect(boost::asio::ip::tcp::resolver::results_type results, boost::beast::tcp_stream& stream);
    boost::asio::awaitable<void> connect(boost::asio::ip::tcp::resolver::results_type results, boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);
    boost::beast::http::request<boost::beast::http::string_body> buildGetRequest(FeedUrl const& url) const;

    template <typename Stream>
    boost::asio::awaitable<boost::beast::http::response<boost::beast::http::string_body>> exchange(Stream& stream, boost::beast::http::request<boost::beast::http::string_body> const& request);

    boost::asio::awaitable<void> shutdownStream(boost::beast::tcp_stream& stream);
    boost::asio::awaitable<void> shutdownStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);
    boost::asio::awaitable<std::string> fetch(FeedUrl url, int redirectsLeft);

public:
    explicit HttpClient(std::chrono::seconds requestTimeout = std::chrono::seconds(30));

    std::string get(std::string const& url) override;
};
