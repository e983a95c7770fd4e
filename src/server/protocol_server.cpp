#include <agentd/core/uuid.h>
#include <agentd/server/protocol_server.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>

namespace agentd {

ProtocolServer::ProtocolServer(Dependencies deps, Config config)
    : deps_([&] {
          if (!deps.executor) {
              throw std::invalid_argument("ProtocolServer: executor cannot be null");
          }
          if (!deps.agentExecutor) {
              throw std::invalid_argument("ProtocolServer: agentExecutor cannot be null");
          }
          if (!deps.taskStorage) {
              deps.taskStorage = std::make_shared<InMemoryTaskStorage>();
          }
          if (!deps.messageStorage) {
              deps.messageStorage = std::make_shared<InMemoryMessageStorage>();
          }
          return std::move(deps);
      }()),
      config_(std::move(config)),
      sessionManager_(SessionManager::Dependencies{deps_.executor, deps_.taskStorage,
                                                   deps_.pushConfigStorage, deps_.pushSender}) {
    spdlog::debug("[ProtocolServer] Serving agent '{}' (push notifications {})",
                  config_.agentCard.name, deps_.pushConfigStorage ? "enabled" : "disabled");
}

boost::asio::awaitable<Response<AgentCard>>
ProtocolServer::getAuthenticatedExtendedAgentCard(Request<NoParams> request,
                                                  ServerCallContext ctx) {
    (void)ctx;
    // No authentication at this layer: the extended card is returned when configured.
    co_return Response<AgentCard>{std::move(request.id),
                                  config_.extendedAgentCard.value_or(config_.agentCard)};
}

boost::asio::awaitable<Response<SendMessageResult>>
ProtocolServer::sendMessage(Request<MessageSendParams> request, ServerCallContext ctx) {
    const auto& configuration = request.data.configuration;
    const bool blocking = configuration && configuration->blocking;
    const std::optional<int> historyLength =
        configuration ? configuration->historyLength : std::nullopt;

    auto stream = co_await sendMessageStreaming(std::move(request), std::move(ctx));

    if (blocking) {
        // Wait until the agent finishes or yields, keeping only the last event.
        std::optional<Response<Event>> last;
        for (;;) {
            auto response = co_await stream.next();
            if (!response)
                break;
            last = std::move(response);
        }
        if (!last) {
            throw ProtocolError(ErrorCode::InternalError,
                                "Agent finished without emitting any event");
        }

        if (auto* message = std::get_if<Message>(&last->data)) {
            co_return Response<SendMessageResult>{std::move(last->id), std::move(*message)};
        }
        const auto taskId = eventTaskId(last->data).value_or("");
        auto task = deps_.taskStorage->get(taskId, historyLength, true);
        if (!task) {
            throw ProtocolError(ErrorCode::TaskNotFound,
                                "Task '" + taskId + "' not found after the agent execution");
        }
        co_return Response<SendMessageResult>{std::move(last->id), std::move(*task)};
    }

    auto first = co_await stream.next();
    stream.cancel();
    if (!first) {
        throw ProtocolError(ErrorCode::InternalError, "Agent finished without emitting any event");
    }
    switch (kindOf(first->data)) {
        case EventKind::Message:
            co_return Response<SendMessageResult>{std::move(first->id),
                                                  std::get<Message>(std::move(first->data))};
        case EventKind::Task:
            co_return Response<SendMessageResult>{std::move(first->id),
                                                  std::get<Task>(std::move(first->data))};
        case EventKind::StatusUpdate:
        case EventKind::ArtifactUpdate:
            break;
    }
    throw ProtocolError(ErrorCode::InternalError,
                        std::string("Got unexpected event type from the agent '") +
                            toString(kindOf(first->data)) + "'");
}

boost::asio::awaitable<EventStream>
ProtocolServer::sendMessageStreaming(Request<MessageSendParams> request, ServerCallContext ctx) {
    auto& message = request.data.message;

    std::string conversationId;
    std::string taskId;
    std::optional<Task> currentTask;
    if (message.taskId) {
        taskId = *message.taskId;
        if (sessionManager_.sessionForTask(taskId)) {
            throw ProtocolError(ErrorCode::UnsupportedOperation,
                                "Task '" + taskId +
                                    "' is still running, can't send messages to the task that "
                                    "has not yielded control");
        }
        currentTask = deps_.taskStorage->get(taskId, std::nullopt, true);
        if (!currentTask) {
            throw ProtocolError(ErrorCode::TaskNotFound, "Task '" + taskId + "' not found");
        }
        if (message.conversationId != currentTask->conversationId) {
            throw ProtocolError(ErrorCode::InvalidParams,
                                "Message conversation id '" +
                                    message.conversationId.value_or("") +
                                    "' doesn't match task conversation id '" +
                                    currentTask->conversationId + "'");
        }
        if (isTerminal(currentTask->status.state)) {
            throw ProtocolError(ErrorCode::UnsupportedOperation,
                                "Task '" + taskId + "' is already in terminal state " +
                                    toString(currentTask->status.state));
        }
        conversationId = currentTask->conversationId;
    } else {
        conversationId = message.conversationId.value_or(core::generateUUID());
        taskId = core::generateUUID();
    }
    message.conversationId = conversationId;

    const auto& configuration = request.data.configuration;
    const bool withPushConfig = configuration && configuration->pushNotificationConfig;
    if (withPushConfig) {
        requirePushStorage();
    }

    auto processor = std::make_shared<SessionEventProcessor>(
        conversationId, taskId, deps_.taskStorage, std::move(currentTask),
        config_.eventBufferSize);
    auto context = std::make_shared<const RequestContext<MessageSendParams>>(
        conversationId, taskId, std::move(ctx), request.data, deps_.taskStorage,
        deps_.messageStorage);

    Session::Job job = [agent = deps_.agentExecutor, context,
                        processor]() -> boost::asio::awaitable<void> {
        std::exception_ptr failure;
        try {
            co_await agent->execute(context, processor);
        } catch (...) {
            failure = std::current_exception();
        }
        // Subscribers drain the remaining events, then observe the failure.
        processor->close(failure);
        if (failure) {
            std::rethrow_exception(failure);
        }
    };
    auto session = std::make_shared<Session>(deps_.executor, processor, std::move(job));

    sessionManager_.addSession(session);

    // Saved only once this request owns the task.
    if (withPushConfig) {
        auto saved =
            deps_.pushConfigStorage->save(taskId, *request.data.configuration->pushNotificationConfig);
        if (!saved) {
            co_await session->close();
            throw ProtocolError(ErrorCode::InvalidParams, saved.error().message);
        }
    }

    auto subscription = processor->subscribe();
    session->start();
    spdlog::debug("[ProtocolServer] Started session for task {} in conversation {}", taskId,
                  conversationId);
    co_return EventStream(std::move(request.id), std::move(subscription));
}

boost::asio::awaitable<Response<Task>> ProtocolServer::getTask(Request<TaskQueryParams> request,
                                                               ServerCallContext ctx) {
    (void)ctx;
    auto task = deps_.taskStorage->get(request.data.id, request.data.historyLength, true);
    if (!task) {
        throw ProtocolError(ErrorCode::TaskNotFound, "Task '" + request.data.id + "' not found");
    }
    co_return Response<Task>{std::move(request.id), std::move(*task)};
}

boost::asio::awaitable<Response<Task>> ProtocolServer::cancelTask(Request<TaskIdParams> request,
                                                                  ServerCallContext ctx) {
    const std::string taskId = request.data.id;

    std::shared_ptr<Session> running;
    co_await sessionManager_.withTaskLock(taskId, [&]() -> boost::asio::awaitable<void> {
        auto session = sessionManager_.sessionForTask(taskId);
        // A finished session is only waiting for its monitor; treat the task as stored.
        if (session && !session->isFinished()) {
            running = std::move(session);
            co_return;
        }
        auto task = deps_.taskStorage->get(taskId, 0, true);
        if (!task) {
            throw ProtocolError(ErrorCode::TaskNotFound, "Task '" + taskId + "' not found");
        }
        if (task->status.state == TaskState::Canceled) {
            co_return;
        }
        if (isTerminal(task->status.state)) {
            throw ProtocolError(ErrorCode::UnsupportedOperation,
                                "Task '" + taskId + "' is already in terminal state " +
                                    toString(task->status.state));
        }
        settleCanceled(*task);
        spdlog::info("[ProtocolServer] Canceled stored task {}", taskId);
    });

    if (running) {
        // Outside the task lock: the hook may wait for the session's monitor to finalize it.
        auto context = std::make_shared<const RequestContext<TaskIdParams>>(
            running->conversationId(), taskId, ctx, request.data, deps_.taskStorage,
            deps_.messageStorage);
        co_await deps_.agentExecutor->cancel(context, running);

        // The monitor finalizes after this block, so its notification sees the settled task.
        co_await sessionManager_.withTaskLock(taskId, [&]() -> boost::asio::awaitable<void> {
            co_await running->close();
            // The closed processor accepts no more events; settle a task the agent left open
            // unless a follow-up session already took the task over.
            auto current = sessionManager_.sessionForTask(taskId);
            if (current && current != running) {
                co_return;
            }
            if (auto task = deps_.taskStorage->get(taskId, 0, false);
                task && !isTerminal(task->status.state)) {
                settleCanceled(*task);
            }
        });
        spdlog::info("[ProtocolServer] Canceled running task {}", taskId);
    }

    auto task = deps_.taskStorage->get(taskId, 0, true);
    if (!task) {
        throw ProtocolError(ErrorCode::TaskNotFound, "Task '" + taskId + "' not found");
    }
    co_return Response<Task>{std::move(request.id), std::move(*task)};
}

void ProtocolServer::settleCanceled(const Task& task) {
    throwIfError(deps_.taskStorage->update(TaskStatusUpdateEvent{
        task.id, task.conversationId,
        TaskStatus{TaskState::Canceled, std::nullopt, std::chrono::system_clock::now()}, true,
        {}}));
}

boost::asio::awaitable<EventStream> ProtocolServer::resubscribeTask(Request<TaskIdParams> request,
                                                                    ServerCallContext ctx) {
    (void)ctx;
    auto session = sessionManager_.sessionForTask(request.data.id);
    if (!session || session->isClosed()) {
        throw ProtocolError(ErrorCode::UnsupportedOperation,
                            "Task '" + request.data.id +
                                "' is not currently running or does not exist");
    }
    co_return EventStream(std::move(request.id), session->eventProcessor()->subscribe());
}

boost::asio::awaitable<Response<TaskPushNotificationConfig>>
ProtocolServer::setTaskPushNotificationConfig(Request<TaskPushNotificationConfig> request,
                                              ServerCallContext ctx) {
    (void)ctx;
    auto& storage = requirePushStorage();
    const auto& taskId = request.data.taskId;
    if (!deps_.taskStorage->get(taskId, 0, false)) {
        throw ProtocolError(ErrorCode::TaskNotFound, "Task '" + taskId + "' not found");
    }
    auto saved = storage.save(taskId, request.data.pushNotificationConfig);
    if (!saved) {
        throw ProtocolError(ErrorCode::InvalidParams, saved.error().message);
    }
    co_return Response<TaskPushNotificationConfig>{
        std::move(request.id), TaskPushNotificationConfig{taskId, saved.value()}};
}

boost::asio::awaitable<Response<TaskPushNotificationConfig>>
ProtocolServer::getTaskPushNotificationConfig(Request<TaskPushNotificationConfigParams> request,
                                              ServerCallContext ctx) {
    (void)ctx;
    auto config = requirePushStorage().get(request.data.id, request.data.pushNotificationConfigId);
    if (!config) {
        throw ProtocolError(config.error());
    }
    co_return Response<TaskPushNotificationConfig>{
        std::move(request.id), TaskPushNotificationConfig{request.data.id, config.value()}};
}

boost::asio::awaitable<Response<std::vector<TaskPushNotificationConfig>>>
ProtocolServer::listTaskPushNotificationConfig(Request<TaskIdParams> request,
                                               ServerCallContext ctx) {
    (void)ctx;
    std::vector<TaskPushNotificationConfig> out;
    for (auto& config : requirePushStorage().getAll(request.data.id)) {
        out.push_back(TaskPushNotificationConfig{request.data.id, std::move(config)});
    }
    co_return Response<std::vector<TaskPushNotificationConfig>>{std::move(request.id),
                                                                std::move(out)};
}

boost::asio::awaitable<Response<NoParams>>
ProtocolServer::deleteTaskPushNotificationConfig(Request<TaskPushNotificationConfigParams> request,
                                                 ServerCallContext ctx) {
    (void)ctx;
    const auto configId = request.data.pushNotificationConfigId.value_or(request.data.id);
    throwIfError(requirePushStorage().remove(request.data.id, configId));
    co_return Response<NoParams>{std::move(request.id), NoParams{}};
}

PushNotificationConfigStorage& ProtocolServer::requirePushStorage() const {
    if (!deps_.pushConfigStorage) {
        throw ProtocolError(ErrorCode::PushNotificationNotSupported);
    }
    return *deps_.pushConfigStorage;
}

} // namespace agentd
