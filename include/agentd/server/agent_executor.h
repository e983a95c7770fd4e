#pragma once

#include <agentd/model/params.h>
#include <agentd/server/components/Session.h>
#include <agentd/server/components/SessionEventProcessor.h>
#include <agentd/server/request_context.h>

#include <memory>

#include <boost/asio/awaitable.hpp>

namespace agentd {

/**
 * @brief The agent logic served by ProtocolServer.
 *
 * execute() reads the request from the context and publishes a Message or task events to
 * the processor. It returns once the agent finished or yields (e.g. in InputRequired).
 * Any exception ends the client's event stream with that exception; prefer
 * ProtocolError with a specific code (ContentTypeNotSupported, UnsupportedOperation, ...).
 *
 * cancel() is called for a task whose session is running. The default does nothing, and
 * the server closes the session afterwards. An implementation may publish a final
 * Canceled status through `session->eventProcessor()` or close the session itself, and
 * throws to refuse cancellation. It runs outside the task lock, so it may wait for the
 * execution to finish with `session->join()`.
 */
class AgentExecutor {
public:
    virtual ~AgentExecutor() = default;

    virtual boost::asio::awaitable<void>
    execute(std::shared_ptr<const RequestContext<MessageSendParams>> context,
            std::shared_ptr<SessionEventProcessor> eventProcessor) = 0;

    virtual boost::asio::awaitable<void>
    cancel(std::shared_ptr<const RequestContext<TaskIdParams>> context,
           std::shared_ptr<Session> session) {
        (void)context;
        (void)session;
        co_return;
    }
};

} // namespace agentd
