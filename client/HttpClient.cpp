#include <exception>
#include <utility>
#include <boost/asio/redirect_error.hpp>
#include "HttpClient.hpp"
#include "Errors.hpp"

FeedUrl FeedUrl::parse(std::string const& url)
{
    FeedUrl parsed;
    std::string rest;

    if (url.rfind("https://", 0) == 0)
    {
        parsed.secure = true;
        rest = url.substr(8);
    }
    else if (url.rfind("http://", 0) == 0)
    {
        rest = url.substr(7);
    }
    else
    {
        throw TransportError("Unsupported feed URL (expected http:// or https://): " + url);
    }

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    parsed.target = (slash == std::string::npos) ? "/" : rest.substr(slash);

    auto colon = authority.rfind(':');
    if (colon != std::string::npos)
    {
        parsed.host = authority.substr(0, colon);
        parsed.port = authority.substr(colon + 1);
    }
    else
    {
        parsed.host = authority;
        parsed.port = parsed.secure ? "443" : "80";
    }

    if (parsed.host.empty() || parsed.port.empty())
        throw TransportError("Feed URL has no host: " + url);

    return parsed;
}

FeedUrl FeedUrl::redirect(std::string const& location) const
{
    if (location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0)
        return parse(location);

    if (location.empty() || location[0] != '/')
        throw TransportError("Unsupported redirect location: " + location);

    FeedUrl next = *this;
    next.target = location;
    return next;
}

HttpClient::HttpClient(std::chrono::seconds requestTimeout)
    : sslContext(boost::asio::ssl::context::tlsv12_client)
    , timeout(requestTimeout)
{
    sslContext.set_options(
        boost::asio::ssl::context::default_workarounds
        | boost::asio::ssl::context::no_sslv2
        | boost::asio::ssl::context::single_dh_use
    );

    sslContext.set_default_verify_paths();
    sslContext.set_verify_mode(boost::asio::ssl::verify_peer);
}

void HttpClient::configureTlsStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream, FeedUrl const& url)
{
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str()))
    {
        throw boost::beast::system_error(boost::system::error_code(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()), "Failed to set SNI");
    }
    stream.set_verify_callback(boost::asio::ssl::host_name_verification(url.host));
}

boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> HttpClient::resolve(boost::asio::ip::tcp::resolver& resolver, FeedUrl const& url)
{
    boost::asio::ip::tcp::resolver::results_type results = co_await resolver.async_resolve(url.host, url.port, boost::asio::use_awaitable);
    co_return results;
}

boost::asio::awaitable<void> HttpClient::connect(boost::asio::ip::tcp::resolver::results_type results, boost::beast::tcp_stream& stream)
{
    stream.expires_after(timeout);
    co_await stream.async_connect(results, boost::asio::use_awaitable);
}

boost::asio::awaitable<void> HttpClient::connect(boost::asio::ip::tcp::resolver::results_type results, boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    boost::beast::get_lowest_layer(stream).expires_after(timeout);
    co_await boost::beast::get_lowest_layer(stream).async_connect(results, boost::asio::use_awaitable);

    co_await stream.async_handshake(boost::asio::ssl::stream_base::client, boost::asio::use_awaitable);
}

boost::beast::http::request<boost::beast::http::string_body> HttpClient::buildGetRequest(FeedUrl const& url) const
{
    boost::beast::http::request<boost::beast::http::string_body> request(boost::beast::http::verb::get, url.target, 11);
    request.set(boost::beast::http::field::host, url.host);
    request.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request.set(boost::beast::http::field::accept, "application/x-protobuf, application/octet-stream");

    return request;
}

template <typename Stream>
boost::asio::awaitable<boost::beast::http::response<boost::beast::http::string_body>> HttpClient::exchange(Stream& stream, boost::beast::http::request<boost::beast::http::string_body> const& request)
{
    boost::beast::get_lowest_layer(stream).expires_after(timeout);
    co_await boost::beast::http::async_write(stream, request, boost::asio::use_awaitable);

    // Trip update feeds of large agencies exceed Beast's 8 MB default.
    boost::beast::http::response_parser<boost::beast::http::string_body> parser;
    parser.body_limit(64 * 1024 * 1024);

    boost::beast::flat_buffer buffer;
    co_await boost::beast::http::async_read(stream, buffer, parser, boost::asio::use_awaitable);
    co_return parser.release();
}

boost::asio::awaitable<void> HttpClient::shutdownStream(boost::beast::tcp_stream& stream)
{
    boost::system::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    co_return;
}

boost::asio::awaitable<void> HttpClient::shutdownStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    boost::system::error_code ec;
    co_await stream.async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    co_return;
}

boost::asio::awaitable<std::string> HttpClient::fetch(FeedUrl url, int redirectsLeft)
{
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::ip::tcp::resolver resolver(executor);
    boost::asio::ip::tcp::resolver::results_type results = co_await resolve(resolver, url);
    boost::beast::http::request<boost::beast::http::string_body> request = buildGetRequest(url);
    boost::beast::http::response<boost::beast::http::string_body> response;

    if (url.secure)
    {
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(executor, sslContext);
        configureTlsStream(stream, url);
        co_await connect(results, stream);
        response = co_await exchange(stream, request);
        co_await shutdownStream(stream);
    }
    else
    {
        boost::beast::tcp_stream stream(executor);
        co_await connect(results, stream);
        response = co_await exchange(stream, request);
        co_await shutdownStream(stream);
    }

    if (boost::beast::http::to_status_class(response.result()) == boost::beast::http::status_class::redirection
        && redirectsLeft > 0)
    {
        auto const location = response.find(boost::beast::http::field::location);
        if (location != response.end())
        {
            FeedUrl next = url.redirect(std::string(location->value()));
            co_return co_await fetch(std::move(next), redirectsLeft - 1);
        }
    }

    if (boost::beast::http::to_status_class(response.result()) != boost::beast::http::status_class::successful)
    {
        throw TransportError("HTTP " + std::to_string(response.result_int()) + " "
                             + std::string(response.reason()) + " from " + url.host + url.target);
    }

    co_return std::move(response.body());
}

std::string HttpClient::get(std::string const& url)
{
    FeedUrl target = FeedUrl::parse(url);

    std::exception_ptr failure;
    std::string body;

    boost::asio::co_spawn(ioContext, fetch(std::move(target), 1),
        [&failure, &body](std::exception_ptr e, std::string result)
        {
            failure = e;
            body = std::move(result);
        });

    ioContext.restart();
    ioContext.run();

    if (failure)
    {
        try
        {
            std::rethrow_exception(failure);
        }
        catch (boost::system::system_error const& e)
        {
            throw TransportError("GET " + url + " failed: " + e.what());
        }
        catch (TransportError const&)
        {
            throw;
        }
        catch (std::exception const& e)
        {
            throw TransportError("GET " + url + " failed: " + e.what());
        }
    }

    return body;
}
