#include <agentd/rpc/http_push_sender.h>
#include <agentd/rpc/json_codec.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace agentd::rpc {

namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

Result<HttpEndpoint> parseHttpUrl(const std::string& url) {
    constexpr std::string_view scheme = "http://";
    if (url.rfind(scheme, 0) != 0) {
        return Error{ErrorCode::NotSupported, "Only http:// push URLs are supported: " + url};
    }
    auto rest = url.substr(scheme.size());
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    HttpEndpoint endpoint;
    endpoint.target = slash == std::string::npos ? "/" : rest.substr(slash);
    if (authority.empty()) {
        return Error{ErrorCode::InvalidArgument, "Push URL has no host: " + url};
    }
    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        endpoint.host = authority.substr(0, colon);
        endpoint.port = authority.substr(colon + 1);
        if (endpoint.port.empty() ||
            !std::all_of(endpoint.port.begin(), endpoint.port.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return Error{ErrorCode::InvalidArgument, "Push URL has an invalid port: " + url};
        }
    } else {
        endpoint.host = authority;
        endpoint.port = "80";
    }
    return endpoint;
}

HttpPushNotificationSender::HttpPushNotificationSender(boost::asio::any_io_executor executor,
                                                       std::chrono::milliseconds timeout)
    : executor_(std::move(executor)), timeout_(timeout) {}

boost::asio::awaitable<void> HttpPushNotificationSender::send(PushNotificationConfig config,
                                                              Task task) {
    auto endpoint = parseHttpUrl(config.url);
    if (!endpoint) {
        throw ProtocolError(endpoint.error());
    }
    const auto& ep = endpoint.value();

    http::request<http::string_body> req{http::verb::post, ep.target, 11};
    req.set(http::field::host, ep.host);
    req.set(http::field::user_agent, "agentd-push");
    req.set(http::field::content_type, "application/json");
    if (config.token) {
        req.set("X-A2A-Notification-Token", *config.token);
    }
    if (config.authentication && config.authentication->credentials) {
        const auto& schemes = config.authentication->schemes;
        if (std::find(schemes.begin(), schemes.end(), "Bearer") != schemes.end()) {
            req.set(http::field::authorization, "Bearer " + *config.authentication->credentials);
        }
    }
    req.body() = json(task).dump();
    req.prepare_payload();

    beast::tcp_stream stream(executor_);
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    try {
        tcp::resolver resolver(executor_);
        auto results =
            co_await resolver.async_resolve(ep.host, ep.port, boost::asio::use_awaitable);
        stream.expires_after(timeout_);
        co_await stream.async_connect(results, boost::asio::use_awaitable);
        stream.expires_after(timeout_);
        co_await http::async_write(stream, req, boost::asio::use_awaitable);
        co_await http::async_read(stream, buffer, res, boost::asio::use_awaitable);
    } catch (const boost::system::system_error& e) {
        const auto code = e.code() == beast::error::timeout ? ErrorCode::Timeout
                                                             : ErrorCode::NetworkError;
        throw ProtocolError(code, "Push notification to " + config.url + " failed: " +
                                      e.code().message());
    }

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    if (res.result_int() < 200 || res.result_int() >= 300) {
        throw ProtocolError(ErrorCode::NetworkError,
                            "Push notification to " + config.url + " rejected with status " +
                                std::to_string(res.result_int()));
    }
    spdlog::debug("[HttpPushNotificationSender] Delivered task {} to {}", task.id, config.url);
}

} // namespace agentd::rpc
