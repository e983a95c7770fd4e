#include <agentd/rpc/jsonrpc_dispatcher.h>

#include <spdlog/spdlog.h>

namespace agentd::rpc {

int toJsonRpcCode(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidParams:
        case ErrorCode::InvalidArgument:
        case ErrorCode::NotFound:
            return protocol::INVALID_PARAMS;
        case ErrorCode::TaskNotFound:
            return protocol::TASK_NOT_FOUND;
        case ErrorCode::TaskNotCancelable:
            return protocol::TASK_NOT_CANCELABLE;
        case ErrorCode::PushNotificationNotSupported:
            return protocol::PUSH_NOTIFICATION_NOT_SUPPORTED;
        case ErrorCode::UnsupportedOperation:
        case ErrorCode::SessionAlreadyExists:
        case ErrorCode::NotSupported:
            return protocol::UNSUPPORTED_OPERATION;
        case ErrorCode::ContentTypeNotSupported:
            return protocol::CONTENT_TYPE_NOT_SUPPORTED;
        case ErrorCode::InvalidAgentResponse:
        case ErrorCode::InvalidEvent:
        case ErrorCode::SessionClosed:
            return protocol::INVALID_AGENT_RESPONSE;
        case ErrorCode::AuthenticatedExtendedCardNotConfigured:
            return protocol::EXTENDED_CARD_NOT_CONFIGURED;
        default:
            return protocol::INTERNAL_ERROR;
    }
}

json JsonRpcDispatcher::createResponse(const json& id, json result) {
    return json{{"jsonrpc", protocol::JSONRPC_VERSION}, {"id", id}, {"result", std::move(result)}};
}

json JsonRpcDispatcher::createError(const json& id, int code, const std::string& message) {
    return json{{"jsonrpc", protocol::JSONRPC_VERSION},
                {"id", id},
                {"error", {{"code", code}, {"message", message}}}};
}

boost::asio::awaitable<void> JsonRpcDispatcher::dispatchLine(std::string_view line,
                                                             ServerCallContext ctx, Sink sink) {
    auto request = json::parse(line, nullptr, false);
    if (request.is_discarded()) {
        spdlog::debug("[JsonRpc] Rejecting unparsable frame ({} bytes)", line.size());
        sink(createError(nullptr, protocol::PARSE_ERROR, "Parse error"));
        co_return;
    }
    co_await dispatch(request, std::move(ctx), std::move(sink));
}

boost::asio::awaitable<void> JsonRpcDispatcher::dispatch(const json& request, ServerCallContext ctx,
                                                         Sink sink) {
    if (!request.is_object() || request.value("jsonrpc", "") != protocol::JSONRPC_VERSION ||
        !request.contains("method") || !request["method"].is_string()) {
        sink(createError(request.is_object() ? request.value("id", json()) : json(),
                         protocol::INVALID_REQUEST, "Invalid Request"));
        co_return;
    }

    const bool isNotification = !request.contains("id");
    const json id = isNotification ? json() : request["id"];
    auto requestId = requestIdFromJson(id);
    if (!isNotification && !requestId) {
        sink(createError(nullptr, protocol::INVALID_REQUEST, "Request id must be a string or integer"));
        co_return;
    }

    Sink out = isNotification ? Sink([](const json&) {}) : std::move(sink);
    const auto method = request["method"].get<std::string>();
    const json params = request.value("params", json::object());

    try {
        co_await route(method, id, requestId.value_or(RequestId{std::string{}}), params,
                       std::move(ctx), out);
    } catch (const ProtocolError& e) {
        spdlog::debug("[JsonRpc] {} failed: {} ({})", method, e.what(), e.code());
        out(createError(id, toJsonRpcCode(e.code()), e.what()));
    } catch (const json::exception& e) {
        spdlog::debug("[JsonRpc] {} has malformed params: {}", method, e.what());
        out(createError(id, protocol::INVALID_PARAMS, std::string("Invalid params: ") + e.what()));
    } catch (const std::exception& e) {
        spdlog::error("[JsonRpc] {} failed: {}", method, e.what());
        out(createError(id, protocol::INTERNAL_ERROR, e.what()));
    } catch (...) {
        spdlog::error("[JsonRpc] {} failed with a non-standard exception", method);
        out(createError(id, protocol::INTERNAL_ERROR, "Internal error"));
    }
}

boost::asio::awaitable<void> JsonRpcDispatcher::route(const std::string& method, const json& id,
                                                      RequestId requestId, const json& params,
                                                      ServerCallContext ctx, const Sink& sink) {
    if (method == protocol::METHOD_MESSAGE_SEND) {
        auto response = co_await server_.sendMessage(
            {std::move(requestId), params.get<MessageSendParams>()}, std::move(ctx));
        sink(createResponse(id, sendMessageResultToJson(response.data)));
        co_return;
    }

    if (method == protocol::METHOD_MESSAGE_STREAM) {
        auto stream = co_await server_.sendMessageStreaming(
            {std::move(requestId), params.get<MessageSendParams>()}, std::move(ctx));
        co_await pumpStream(std::move(stream), id, sink);
        co_return;
    }

    if (method == protocol::METHOD_TASKS_GET) {
        auto response = co_await server_.getTask(
            {std::move(requestId), params.get<TaskQueryParams>()}, std::move(ctx));
        sink(createResponse(id, response.data));
        co_return;
    }

    if (method == protocol::METHOD_TASKS_CANCEL) {
        auto response = co_await server_.cancelTask(
            {std::move(requestId), params.get<TaskIdParams>()}, std::move(ctx));
        sink(createResponse(id, response.data));
        co_return;
    }

    if (method == protocol::METHOD_TASKS_RESUBSCRIBE) {
        auto stream = co_await server_.resubscribeTask(
            {std::move(requestId), params.get<TaskIdParams>()}, std::move(ctx));
        co_await pumpStream(std::move(stream), id, sink);
        co_return;
    }

    if (method == protocol::METHOD_PUSH_CONFIG_SET) {
        auto response = co_await server_.setTaskPushNotificationConfig(
            {std::move(requestId), params.get<TaskPushNotificationConfig>()}, std::move(ctx));
        sink(createResponse(id, response.data));
        co_return;
    }

    if (method == protocol::METHOD_PUSH_CONFIG_GET) {
        auto response = co_await server_.getTaskPushNotificationConfig(
            {std::move(requestId), params.get<TaskPushNotificationConfigParams>()},
            std::move(ctx));
        sink(createResponse(id, response.data));
        co_return;
    }

    if (method == protocol::METHOD_PUSH_CONFIG_LIST) {
        auto response = co_await server_.listTaskPushNotificationConfig(
            {std::move(requestId), params.get<TaskIdParams>()}, std::move(ctx));
        sink(createResponse(id, response.data));
        co_return;
    }

    if (method == protocol::METHOD_PUSH_CONFIG_DELETE) {
        co_await server_.deleteTaskPushNotificationConfig(
            {std::move(requestId), params.get<TaskPushNotificationConfigParams>()},
            std::move(ctx));
        sink(createResponse(id, nullptr));
        co_return;
    }

    if (method == protocol::METHOD_AGENT_EXTENDED_CARD) {
        auto response = co_await server_.getAuthenticatedExtendedAgentCard(
            {std::move(requestId), NoParams{}}, std::move(ctx));
        sink(createResponse(id, response.data));
        co_return;
    }

    if (method == protocol::METHOD_AGENT_CARD) {
        sink(createResponse(id, server_.getAgentCard()));
        co_return;
    }

    spdlog::debug("[JsonRpc] Unknown method '{}'", method);
    sink(createError(id, protocol::METHOD_NOT_FOUND, "Method not found: " + method));
}

boost::asio::awaitable<void> JsonRpcDispatcher::pumpStream(EventStream stream, const json& id,
                                                           const Sink& sink) {
    // Failures after the first frame still reach the client as an error frame with the same id.
    for (;;) {
        auto event = co_await stream.next();
        if (!event)
            break;
        sink(createResponse(id, eventToJson(event->data)));
    }
}

} // namespace agentd::rpc
