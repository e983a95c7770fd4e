#pragma once

#include <agentd/core/types.h>
#include <agentd/model/task.h>

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentd {

/**
 * @brief Storage contract for task snapshots.
 *
 * `historyLength`: std::nullopt keeps the full history, 0 none, n the last n messages.
 * `update` merges one task event into the stored snapshot.
 */
class TaskStorage {
public:
    virtual ~TaskStorage() = default;

    virtual std::optional<Task> get(const std::string& taskId, std::optional<int> historyLength,
                                    bool includeArtifacts) const = 0;
    virtual std::vector<Task> getByConversation(const std::string& conversationId,
                                                std::optional<int> historyLength,
                                                bool includeArtifacts) const = 0;
    virtual Result<void> update(const TaskEvent& event) = 0;
    virtual Result<void> remove(const std::string& taskId) = 0;
};

/**
 * @brief Thread-safe in-memory TaskStorage.
 *
 * Merge rules:
 * - Task: replaces the snapshot, merging metadata.
 * - Status update: requires the task; a terminal task only accepts a repeated Canceled.
 *   A status message is appended to history.
 * - Artifact update: requires the task; append=false replaces the artifact with the same
 *   id (or adds it), append=true extends its parts.
 */
class InMemoryTaskStorage : public TaskStorage {
public:
    std::optional<Task> get(const std::string& taskId, std::optional<int> historyLength,
                            bool includeArtifacts) const override;
    std::vector<Task> getByConversation(const std::string& conversationId,
                                        std::optional<int> historyLength,
                                        bool includeArtifacts) const override;
    Result<void> update(const TaskEvent& event) override;
    Result<void> remove(const std::string& taskId) override;

    std::size_t size() const;

private:
    Result<void> apply(Task task);
    Result<void> apply(const TaskStatusUpdateEvent& event);
    Result<void> apply(const TaskArtifactUpdateEvent& event);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Task> tasks_;
};

// Applies the history/artifact projection used by get().
Task projectTask(Task task, std::optional<int> historyLength, bool includeArtifacts);

/**
 * @brief View of a TaskStorage restricted to a single conversation.
 *
 * Tasks of other conversations are invisible; writes for them are rejected with
 * InvalidArgument.
 */
class ConversationTaskStorage {
public:
    ConversationTaskStorage(std::string conversationId, std::shared_ptr<TaskStorage> storage);

    const std::string& conversationId() const noexcept { return conversationId_; }

    std::optional<Task> get(const std::string& taskId, std::optional<int> historyLength = {},
                            bool includeArtifacts = true) const;
    std::vector<Task> getAll(std::optional<int> historyLength = {},
                             bool includeArtifacts = true) const;
    Result<void> update(const TaskEvent& event);
    Result<void> remove(const std::string& taskId);

private:
    std::string conversationId_;
    std::shared_ptr<TaskStorage> storage_;
};

} // namespace agentd
