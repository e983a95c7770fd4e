#pragma once

#include <agentd/core/types.h>
#include <agentd/server/storage/push_notification_storage.h>

#include <chrono>
#include <optional>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

namespace agentd::rpc {

struct HttpEndpoint {
    std::string host;
    std::string port;
    std::string target;
};

// Accepts http://host[:port][/path]; other schemes yield NotSupported.
Result<HttpEndpoint> parseHttpUrl(const std::string& url);

/**
 * @brief Posts the task snapshot as JSON to the push notification URL.
 *
 * The config token is sent as X-A2A-Notification-Token. A Bearer credential from the
 * authentication block becomes the Authorization header. Non-2xx replies, timeouts and
 * connection failures throw ProtocolError(NetworkError / Timeout).
 */
class HttpPushNotificationSender : public PushNotificationSender {
public:
    HttpPushNotificationSender(boost::asio::any_io_executor executor,
                               std::chrono::milliseconds timeout);

    boost::asio::awaitable<void> send(PushNotificationConfig config, Task task) override;

private:
    boost::asio::any_io_executor executor_;
    std::chrono::milliseconds timeout_;
};

} // namespace agentd::rpc
