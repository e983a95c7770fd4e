#include <agentd/server/storage/task_storage.h>

#include <algorithm>
#include <mutex>

namespace agentd {

namespace {

void mergeMetadata(Metadata& into, const Metadata& from) {
    for (const auto& [k, v] : from)
        into[k] = v;
}

} // namespace

Task projectTask(Task task, std::optional<int> historyLength, bool includeArtifacts) {
    if (historyLength) {
        const auto keep = static_cast<std::size_t>(std::max(0, *historyLength));
        if (task.history.size() > keep) {
            task.history.erase(task.history.begin(),
                               task.history.end() - static_cast<std::ptrdiff_t>(keep));
        }
    }
    if (!includeArtifacts)
        task.artifacts.clear();
    return task;
}

std::optional<Task> InMemoryTaskStorage::get(const std::string& taskId,
                                             std::optional<int> historyLength,
                                             bool includeArtifacts) const {
    std::shared_lock lock(mutex_);
    auto it = tasks_.find(taskId);
    if (it == tasks_.end())
        return std::nullopt;
    return projectTask(it->second, historyLength, includeArtifacts);
}

std::vector<Task> InMemoryTaskStorage::getByConversation(const std::string& conversationId,
                                                         std::optional<int> historyLength,
                                                         bool includeArtifacts) const {
    std::vector<Task> out;
    std::shared_lock lock(mutex_);
    for (const auto& [id, task] : tasks_) {
        if (task.conversationId == conversationId)
            out.push_back(projectTask(task, historyLength, includeArtifacts));
    }
    return out;
}

Result<void> InMemoryTaskStorage::update(const TaskEvent& event) {
    std::unique_lock lock(mutex_);
    return std::visit([this](const auto& e) { return apply(e); }, event);
}

Result<void> InMemoryTaskStorage::remove(const std::string& taskId) {
    std::unique_lock lock(mutex_);
    if (tasks_.erase(taskId) == 0)
        return Error{ErrorCode::NotFound, "Task '" + taskId + "' not found"};
    return {};
}

std::size_t InMemoryTaskStorage::size() const {
    std::shared_lock lock(mutex_);
    return tasks_.size();
}

Result<void> InMemoryTaskStorage::apply(Task task) {
    auto it = tasks_.find(task.id);
    if (it == tasks_.end()) {
        auto id = task.id;
        tasks_.emplace(std::move(id), std::move(task));
        return {};
    }
    Metadata merged = std::move(it->second.metadata);
    mergeMetadata(merged, task.metadata);
    task.metadata = std::move(merged);
    it->second = std::move(task);
    return {};
}

Result<void> InMemoryTaskStorage::apply(const TaskStatusUpdateEvent& event) {
    auto it = tasks_.find(event.taskId);
    if (it == tasks_.end())
        return Error{ErrorCode::NotFound, "Task '" + event.taskId + "' not found"};

    auto& task = it->second;
    const auto current = task.status.state;
    if (isTerminal(current) &&
        !(current == TaskState::Canceled && event.status.state == TaskState::Canceled)) {
        return Error{ErrorCode::InvalidState, "Task '" + task.id + "' is already " +
                                                  toString(current)};
    }

    task.status = event.status;
    if (event.status.message)
        task.history.push_back(*event.status.message);
    mergeMetadata(task.metadata, event.metadata);
    return {};
}

Result<void> InMemoryTaskStorage::apply(const TaskArtifactUpdateEvent& event) {
    auto it = tasks_.find(event.taskId);
    if (it == tasks_.end())
        return Error{ErrorCode::NotFound, "Task '" + event.taskId + "' not found"};

    auto& artifacts = it->second.artifacts;
    auto existing = std::find_if(artifacts.begin(), artifacts.end(), [&](const Artifact& a) {
        return a.artifactId == event.artifact.artifactId;
    });

    if (existing == artifacts.end()) {
        artifacts.push_back(event.artifact);
    } else if (event.append) {
        existing->parts.insert(existing->parts.end(), event.artifact.parts.begin(),
                               event.artifact.parts.end());
        mergeMetadata(existing->metadata, event.artifact.metadata);
    } else {
        *existing = event.artifact;
    }
    mergeMetadata(it->second.metadata, event.metadata);
    return {};
}

} // namespace agentd
