#include <agentd/server/storage/message_storage.h>

#include <mutex>

namespace agentd {

Result<void> InMemoryMessageStorage::save(const Message& message) {
    if (!message.conversationId || message.conversationId->empty())
        return Error{ErrorCode::InvalidArgument, "Message has no conversation id"};
    std::unique_lock lock(mutex_);
    messages_[*message.conversationId].push_back(message);
    return {};
}

std::vector<Message>
InMemoryMessageStorage::getByConversation(const std::string& conversationId) const {
    std::shared_lock lock(mutex_);
    auto it = messages_.find(conversationId);
    if (it == messages_.end())
        return {};
    return it->second;
}

Result<void> InMemoryMessageStorage::deleteByConversation(const std::string& conversationId) {
    std::unique_lock lock(mutex_);
    messages_.erase(conversationId);
    return {};
}

Result<void> InMemoryMessageStorage::replaceByConversation(const std::string& conversationId,
                                                           std::vector<Message> messages) {
    for (const auto& m : messages) {
        if (m.conversationId != conversationId)
            return Error{ErrorCode::InvalidArgument,
                         "Message '" + m.messageId + "' belongs to another conversation"};
    }
    std::unique_lock lock(mutex_);
    messages_[conversationId] = std::move(messages);
    return {};
}

ConversationMessageStorage::ConversationMessageStorage(std::string conversationId,
                                                       std::shared_ptr<MessageStorage> storage)
    : conversationId_(std::move(conversationId)), storage_(std::move(storage)) {}

Result<void> ConversationMessageStorage::stamp(Message& message) const {
    if (!message.conversationId) {
        message.conversationId = conversationId_;
    } else if (*message.conversationId != conversationId_) {
        return Error{ErrorCode::InvalidArgument,
                     "Message '" + message.messageId + "' belongs to conversation '" +
                         *message.conversationId + "', expected '" + conversationId_ + "'"};
    }
    return {};
}

Result<void> ConversationMessageStorage::save(Message message) {
    if (auto r = stamp(message); !r)
        return r;
    return storage_->save(message);
}

std::vector<Message> ConversationMessageStorage::getAll() const {
    return storage_->getByConversation(conversationId_);
}

Result<void> ConversationMessageStorage::deleteAll() {
    return storage_->deleteByConversation(conversationId_);
}

Result<void> ConversationMessageStorage::replaceAll(std::vector<Message> messages) {
    for (auto& m : messages) {
        if (auto r = stamp(m); !r)
            return r;
    }
    return storage_->replaceByConversation(conversationId_, std::move(messages));
}

} // namespace agentd
