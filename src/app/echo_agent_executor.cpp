#include <agentd/app/echo_agent_executor.h>
#include <agentd/core/uuid.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <string>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace agentd::app {

namespace {

std::string userText(const Message& message) {
    std::string text;
    for (const auto& part : message.parts) {
        if (part.kind != Part::Kind::Text)
            continue;
        if (!text.empty())
            text += ' ';
        text += part.text;
    }
    return text;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Message agentMessage(const std::string& text, const std::string& conversationId,
                     std::optional<std::string> taskId) {
    Message m;
    m.messageId = core::generateUUID();
    m.role = Role::Agent;
    m.parts.push_back(Part::fromText(text));
    m.conversationId = conversationId;
    m.taskId = std::move(taskId);
    return m;
}

TaskStatus statusOf(TaskState state, Message message) {
    return TaskStatus{state, std::move(message), std::chrono::system_clock::now()};
}

template <typename Context> TaskStatusUpdateEvent statusUpdate(const Context& ctx, TaskState state,
                                                               const std::string& text) {
    return TaskStatusUpdateEvent{
        ctx.taskId(), ctx.conversationId(),
        statusOf(state, agentMessage(text, ctx.conversationId(), ctx.taskId())),
        isTerminal(state) || state == TaskState::InputRequired, {}};
}

Task newTask(const RequestContext<MessageSendParams>& ctx, TaskState state,
             const std::string& text) {
    Task task;
    task.id = ctx.taskId();
    task.conversationId = ctx.conversationId();
    task.status = statusOf(state, agentMessage(text, ctx.conversationId(), ctx.taskId()));
    task.history.push_back(ctx.params().message);
    return task;
}

} // namespace

boost::asio::awaitable<void>
EchoAgentExecutor::execute(std::shared_ptr<const RequestContext<MessageSendParams>> context,
                           std::shared_ptr<SessionEventProcessor> eventProcessor) {
    const auto& ctx = *context;
    const auto& incoming = ctx.params().message;
    const auto text = userText(incoming);
    const auto input = lowercase(text);

    // A follow-up on an existing task answers the pending input request.
    if (incoming.taskId) {
        spdlog::debug("[EchoAgent] Resuming task {}", ctx.taskId());
        co_await eventProcessor->sendTaskEvent(
            statusUpdate(ctx, TaskState::Completed, "Received: " + text));
        co_return;
    }

    if (input.find("hello world") != std::string::npos) {
        co_await eventProcessor->sendMessage(
            agentMessage("Hello World", ctx.conversationId(), ctx.taskId()));
        co_return;
    }

    if (input.find("do task") != std::string::npos) {
        co_await eventProcessor->sendTaskEvent(newTask(ctx, TaskState::Working, "Task created"));
        co_await eventProcessor->sendTaskEvent(
            statusUpdate(ctx, TaskState::Working, "Working on task"));
        co_await eventProcessor->sendTaskEvent(
            statusUpdate(ctx, TaskState::Completed, "Task completed"));
        co_return;
    }

    if (input.find("do cancelable task") != std::string::npos) {
        co_await eventProcessor->sendTaskEvent(
            newTask(ctx, TaskState::Working, "Cancelable task created"));
        co_return;
    }

    if (input.find("do long-running task") != std::string::npos) {
        co_await eventProcessor->sendTaskEvent(
            newTask(ctx, TaskState::Working, "Long running task started"));
        boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
        for (int i = 0; i < progressSteps_; ++i) {
            timer.expires_after(progressInterval_);
            co_await timer.async_wait(boost::asio::use_awaitable);
            if (eventProcessor->isClosed())
                co_return;
            co_await eventProcessor->sendTaskEvent(
                statusUpdate(ctx, TaskState::Working, "Still working " + std::to_string(i)));
        }
        co_return;
    }

    if (input.find("need input") != std::string::npos) {
        co_await eventProcessor->sendTaskEvent(
            newTask(ctx, TaskState::Submitted, "Task submitted"));
        co_await eventProcessor->sendTaskEvent(
            statusUpdate(ctx, TaskState::InputRequired, "Please provide more details"));
        co_return;
    }

    const auto reply = text.empty() ? std::string("Sorry, I don't understand you") : text;
    co_await eventProcessor->sendMessage(agentMessage(reply, ctx.conversationId(), std::nullopt));
}

boost::asio::awaitable<void>
EchoAgentExecutor::cancel(std::shared_ptr<const RequestContext<TaskIdParams>> context,
                          std::shared_ptr<Session> session) {
    spdlog::info("[EchoAgent] Canceling task {}", context->taskId());
    co_await session->eventProcessor()->sendTaskEvent(
        statusUpdate(*context, TaskState::Canceled, "Task canceled"));
    co_await session->close();
}

} // namespace agentd::app
