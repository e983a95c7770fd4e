#pragma once

#include <agentd/model/params.h>
#include <agentd/server/agent_executor.h>
#include <agentd/server/components/SessionManager.h>
#include <agentd/server/event_stream.h>
#include <agentd/server/storage/message_storage.h>
#include <agentd/server/storage/push_notification_storage.h>
#include <agentd/server/storage/task_storage.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

namespace agentd {

/**
 * @brief Implements the agent protocol operations on top of SessionManager.
 *
 * Each message send creates a Session whose job runs AgentExecutor::execute. Structural
 * validation (running task, missing task, conversation mismatch, duplicate session)
 * happens before the session is registered, so a failed call leaves no state behind.
 * Once running, agent failures end the event stream instead of failing the call.
 *
 * Errors are reported as ProtocolError; agent exceptions propagate unchanged.
 */
class ProtocolServer {
public:
    struct Dependencies {
        boost::asio::any_io_executor executor;
        std::shared_ptr<AgentExecutor> agentExecutor;
        std::shared_ptr<TaskStorage> taskStorage;
        std::shared_ptr<MessageStorage> messageStorage;
        // Optional; without it push notification operations fail with
        // PushNotificationNotSupported.
        std::shared_ptr<PushNotificationConfigStorage> pushConfigStorage;
        std::shared_ptr<PushNotificationSender> pushSender;
    };

    struct Config {
        AgentCard agentCard;
        std::optional<AgentCard> extendedAgentCard;
        std::size_t eventBufferSize = SessionEventProcessor::kDefaultBufferSize;
    };

    ProtocolServer(Dependencies deps, Config config);

    ProtocolServer(const ProtocolServer&) = delete;
    ProtocolServer& operator=(const ProtocolServer&) = delete;

    const AgentCard& getAgentCard() const noexcept { return config_.agentCard; }

    boost::asio::awaitable<Response<AgentCard>>
    getAuthenticatedExtendedAgentCard(Request<NoParams> request, ServerCallContext ctx);

    boost::asio::awaitable<Response<SendMessageResult>>
    sendMessage(Request<MessageSendParams> request, ServerCallContext ctx);

    boost::asio::awaitable<EventStream> sendMessageStreaming(Request<MessageSendParams> request,
                                                             ServerCallContext ctx);

    boost::asio::awaitable<Response<Task>> getTask(Request<TaskQueryParams> request,
                                                   ServerCallContext ctx);

    boost::asio::awaitable<Response<Task>> cancelTask(Request<TaskIdParams> request,
                                                      ServerCallContext ctx);

    boost::asio::awaitable<EventStream> resubscribeTask(Request<TaskIdParams> request,
                                                        ServerCallContext ctx);

    boost::asio::awaitable<Response<TaskPushNotificationConfig>>
    setTaskPushNotificationConfig(Request<TaskPushNotificationConfig> request,
                                  ServerCallContext ctx);

    boost::asio::awaitable<Response<TaskPushNotificationConfig>>
    getTaskPushNotificationConfig(Request<TaskPushNotificationConfigParams> request,
                                  ServerCallContext ctx);

    boost::asio::awaitable<Response<std::vector<TaskPushNotificationConfig>>>
    listTaskPushNotificationConfig(Request<TaskIdParams> request, ServerCallContext ctx);

    boost::asio::awaitable<Response<NoParams>>
    deleteTaskPushNotificationConfig(Request<TaskPushNotificationConfigParams> request,
                                     ServerCallContext ctx);

    SessionManager& sessionManager() noexcept { return sessionManager_; }
    const SessionManager& sessionManager() const noexcept { return sessionManager_; }

private:
    PushNotificationConfigStorage& requirePushStorage() const;
    // Writes a final Canceled status for a task that is not terminal yet.
    void settleCanceled(const Task& task);

    Dependencies deps_;
    Config config_;
    SessionManager sessionManager_;
};

} // namespace agentd
