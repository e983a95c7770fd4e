#pragma once

#include <agentd/server/agent_executor.h>

#include <chrono>

namespace agentd::app {

/**
 * @brief Built-in demonstration agent served by the agentd executable.
 *
 * Reacts to phrases in the user's text parts (case-insensitive):
 * - "hello world"           replies with a single message;
 * - "do task"               creates a task and drives it Working -> Completed;
 * - "do cancelable task"    creates a Working task and yields;
 * - "do long-running task"  creates a task and reports progress a few times;
 * - "need input"            creates a task that ends in InputRequired, a follow-up message
 *                           on the same task completes it;
 * - anything else           echoes the text back as a message.
 *
 * cancel() publishes a final Canceled status and closes the session.
 */
class EchoAgentExecutor : public AgentExecutor {
public:
    explicit EchoAgentExecutor(std::chrono::milliseconds progressInterval =
                                   std::chrono::milliseconds(200),
                               int progressSteps = 4)
        : progressInterval_(progressInterval), progressSteps_(progressSteps) {}

    boost::asio::awaitable<void>
    execute(std::shared_ptr<const RequestContext<MessageSendParams>> context,
            std::shared_ptr<SessionEventProcessor> eventProcessor) override;

    boost::asio::awaitable<void> cancel(std::shared_ptr<const RequestContext<TaskIdParams>> context,
                                        std::shared_ptr<Session> session) override;

private:
    std::chrono::milliseconds progressInterval_;
    int progressSteps_;
};

} // namespace agentd::app
