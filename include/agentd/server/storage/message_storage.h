#pragma once

#include <agentd/core/types.h>
#include <agentd/model/task.h>

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentd {

// Storage contract for conversational messages, grouped by conversation id.
class MessageStorage {
public:
    virtual ~MessageStorage() = default;

    // The message must carry a conversation id.
    virtual Result<void> save(const Message& message) = 0;
    virtual std::vector<Message> getByConversation(const std::string& conversationId) const = 0;
    virtual Result<void> deleteByConversation(const std::string& conversationId) = 0;
    virtual Result<void> replaceByConversation(const std::string& conversationId,
                                               std::vector<Message> messages) = 0;
};

class InMemoryMessageStorage : public MessageStorage {
public:
    Result<void> save(const Message& message) override;
    std::vector<Message> getByConversation(const std::string& conversationId) const override;
    Result<void> deleteByConversation(const std::string& conversationId) override;
    Result<void> replaceByConversation(const std::string& conversationId,
                                       std::vector<Message> messages) override;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::vector<Message>> messages_;
};

/**
 * @brief View of a MessageStorage restricted to a single conversation.
 *
 * Messages without a conversation id are stamped with this one; messages of another
 * conversation are rejected with InvalidArgument.
 */
class ConversationMessageStorage {
public:
    ConversationMessageStorage(std::string conversationId,
                               std::shared_ptr<MessageStorage> storage);

    const std::string& conversationId() const noexcept { return conversationId_; }

    Result<void> save(Message message);
    std::vector<Message> getAll() const;
    Result<void> deleteAll();
    Result<void> replaceAll(std::vector<Message> messages);

private:
    Result<void> stamp(Message& message) const;

    std::string conversationId_;
    std::shared_ptr<MessageStorage> storage_;
};

} // namespace agentd
