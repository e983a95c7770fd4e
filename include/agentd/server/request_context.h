#pragma once

#include <agentd/model/params.h>
#include <agentd/server/storage/message_storage.h>
#include <agentd/server/storage/task_storage.h>

#include <memory>
#include <string>

namespace agentd {

/**
 * @brief Immutable bundle describing one request, handed to the AgentExecutor.
 *
 * Storage access is scoped to the request's conversation.
 */
template <typename Params> class RequestContext {
public:
    RequestContext(std::string conversationId, std::string taskId, ServerCallContext callContext,
                   Params params, std::shared_ptr<TaskStorage> taskStorage,
                   std::shared_ptr<MessageStorage> messageStorage)
        : conversationId_(std::move(conversationId)), taskId_(std::move(taskId)),
          callContext_(std::move(callContext)), params_(std::move(params)),
          taskStorage_(conversationId_, std::move(taskStorage)),
          messageStorage_(conversationId_, std::move(messageStorage)) {}

    const std::string& conversationId() const noexcept { return conversationId_; }
    const std::string& taskId() const noexcept { return taskId_; }
    const ServerCallContext& callContext() const noexcept { return callContext_; }
    const Params& params() const noexcept { return params_; }

    // Views are const-qualified on the context but writable: the context itself never
    // changes, the storage behind it does.
    ConversationTaskStorage& taskStorage() const noexcept { return taskStorage_; }
    ConversationMessageStorage& messageStorage() const noexcept { return messageStorage_; }

private:
    const std::string conversationId_;
    const std::string taskId_;
    const ServerCallContext callContext_;
    const Params params_;
    mutable ConversationTaskStorage taskStorage_;
    mutable ConversationMessageStorage messageStorage_;
};

} // namespace agentd
