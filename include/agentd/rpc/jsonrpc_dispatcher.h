#pragma once

#include <agentd/core/types.h>
#include <agentd/rpc/json_codec.h>
#include <agentd/server/protocol_server.h>

#include <functional>
#include <string>
#include <string_view>

#include <boost/asio/awaitable.hpp>

namespace agentd::rpc {

namespace protocol {
constexpr std::string_view JSONRPC_VERSION = "2.0";

constexpr std::string_view METHOD_MESSAGE_SEND = "message/send";
constexpr std::string_view METHOD_MESSAGE_STREAM = "message/stream";
constexpr std::string_view METHOD_TASKS_GET = "tasks/get";
constexpr std::string_view METHOD_TASKS_CANCEL = "tasks/cancel";
constexpr std::string_view METHOD_TASKS_RESUBSCRIBE = "tasks/resubscribe";
constexpr std::string_view METHOD_PUSH_CONFIG_SET = "tasks/pushNotificationConfig/set";
constexpr std::string_view METHOD_PUSH_CONFIG_GET = "tasks/pushNotificationConfig/get";
constexpr std::string_view METHOD_PUSH_CONFIG_LIST = "tasks/pushNotificationConfig/list";
constexpr std::string_view METHOD_PUSH_CONFIG_DELETE = "tasks/pushNotificationConfig/delete";
constexpr std::string_view METHOD_AGENT_EXTENDED_CARD = "agent/getAuthenticatedExtendedCard";
constexpr std::string_view METHOD_AGENT_CARD = "agent/getCard";

// Error codes defined by JSON-RPC 2.0
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Agent protocol error codes
constexpr int TASK_NOT_FOUND = -32001;
constexpr int TASK_NOT_CANCELABLE = -32002;
constexpr int PUSH_NOTIFICATION_NOT_SUPPORTED = -32003;
constexpr int UNSUPPORTED_OPERATION = -32004;
constexpr int CONTENT_TYPE_NOT_SUPPORTED = -32005;
constexpr int INVALID_AGENT_RESPONSE = -32006;
constexpr int EXTENDED_CARD_NOT_CONFIGURED = -32007;
} // namespace protocol

int toJsonRpcCode(ErrorCode code) noexcept;

/**
 * @brief Routes JSON-RPC requests onto ProtocolServer.
 *
 * Every outgoing frame goes through the sink. Unary methods produce one frame; streaming
 * methods (message/stream, tasks/resubscribe) produce one result frame per event, all
 * tagged with the request id, and an error frame if the stream ends with a failure.
 * Notifications (requests without id) get no response.
 */
class JsonRpcDispatcher {
public:
    using Sink = std::function<void(const json&)>;

    explicit JsonRpcDispatcher(ProtocolServer& server) : server_(server) {}

    boost::asio::awaitable<void> dispatchLine(std::string_view line, ServerCallContext ctx,
                                              Sink sink);

    boost::asio::awaitable<void> dispatch(const json& request, ServerCallContext ctx,
                                          Sink sink);

    static json createResponse(const json& id, json result);
    static json createError(const json& id, int code, const std::string& message);

private:
    boost::asio::awaitable<void> route(const std::string& method, const json& id,
                                       RequestId requestId, const json& params,
                                       ServerCallContext ctx, const Sink& sink);
    boost::asio::awaitable<void> pumpStream(EventStream stream, const json& id,
                                            const Sink& sink);

    ProtocolServer& server_;
};

} // namespace agentd::rpc
