#include <agentd/server/storage/task_storage.h>

namespace agentd {

ConversationTaskStorage::ConversationTaskStorage(std::string conversationId,
                                                 std::shared_ptr<TaskStorage> storage)
    : conversationId_(std::move(conversationId)), storage_(std::move(storage)) {}

std::optional<Task> ConversationTaskStorage::get(const std::string& taskId,
                                                 std::optional<int> historyLength,
                                                 bool includeArtifacts) const {
    auto task = storage_->get(taskId, historyLength, includeArtifacts);
    if (!task || task->conversationId != conversationId_)
        return std::nullopt;
    return task;
}

std::vector<Task> ConversationTaskStorage::getAll(std::optional<int> historyLength,
                                                  bool includeArtifacts) const {
    return storage_->getByConversation(conversationId_, historyLength, includeArtifacts);
}

Result<void> ConversationTaskStorage::update(const TaskEvent& event) {
    if (eventConversationId(event) != conversationId_) {
        return Error{ErrorCode::InvalidArgument,
                     "Task '" + eventTaskId(event) + "' belongs to another conversation"};
    }
    return storage_->update(event);
}

Result<void> ConversationTaskStorage::remove(const std::string& taskId) {
    if (!get(taskId, 0, false))
        return Error{ErrorCode::NotFound, "Task '" + taskId + "' not found in conversation"};
    return storage_->remove(taskId);
}

} // namespace agentd
