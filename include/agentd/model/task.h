#pragma once

#include <agentd/core/types.h>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace agentd {

using Metadata = std::map<std::string, std::string>;

enum class TaskState { Submitted, Working, InputRequired, Completed, Failed, Canceled };

constexpr bool isTerminal(TaskState state) {
    return state == TaskState::Completed || state == TaskState::Failed ||
           state == TaskState::Canceled;
}

constexpr const char* toString(TaskState state) {
    switch (state) {
        case TaskState::Submitted: return "submitted";
        case TaskState::Working: return "working";
        case TaskState::InputRequired: return "input-required";
        case TaskState::Completed: return "completed";
        case TaskState::Failed: return "failed";
        case TaskState::Canceled: return "canceled";
    }
    return "unknown";
}

std::optional<TaskState> parseTaskState(std::string_view s);

enum class Role { User, Agent };

constexpr const char* toString(Role role) {
    return role == Role::User ? "user" : "agent";
}

struct Part {
    enum class Kind { Text, File, Data };

    Kind kind = Kind::Text;
    // Text content, or the serialized JSON payload of a Data part.
    std::string text;
    std::optional<std::string> name;
    std::optional<std::string> mimeType;
    std::optional<std::string> uri;
    // Base64 file content.
    std::optional<std::string> bytes;
    Metadata metadata;

    static Part fromText(std::string t) {
        Part p;
        p.kind = Kind::Text;
        p.text = std::move(t);
        return p;
    }
};

struct Message {
    std::string messageId;
    Role role = Role::User;
    std::vector<Part> parts;
    std::optional<std::string> conversationId;
    std::optional<std::string> taskId;
    std::vector<std::string> referenceTaskIds;
    Metadata metadata;
};

struct TaskStatus {
    TaskState state = TaskState::Submitted;
    std::optional<Message> message;
    std::optional<TimePoint> timestamp;
};

struct Artifact {
    std::string artifactId;
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::vector<Part> parts;
    Metadata metadata;
};

struct Task {
    std::string id;
    std::string conversationId;
    TaskStatus status;
    std::vector<Message> history;
    std::vector<Artifact> artifacts;
    Metadata metadata;
};

struct TaskStatusUpdateEvent {
    std::string taskId;
    std::string conversationId;
    TaskStatus status;
    bool final = false;
    Metadata metadata;
};

struct TaskArtifactUpdateEvent {
    std::string taskId;
    std::string conversationId;
    Artifact artifact;
    bool append = false;
    bool lastChunk = false;
    Metadata metadata;
};

using TaskEvent = std::variant<Task, TaskStatusUpdateEvent, TaskArtifactUpdateEvent>;

// Alternative order matches EventKind.
using Event = std::variant<Message, Task, TaskStatusUpdateEvent, TaskArtifactUpdateEvent>;

enum class EventKind { Message = 0, Task, StatusUpdate, ArtifactUpdate };

inline EventKind kindOf(const Event& event) {
    return static_cast<EventKind>(event.index());
}

constexpr const char* toString(EventKind kind) {
    switch (kind) {
        case EventKind::Message: return "message";
        case EventKind::Task: return "task";
        case EventKind::StatusUpdate: return "status-update";
        case EventKind::ArtifactUpdate: return "artifact-update";
    }
    return "unknown";
}

inline bool isTaskEvent(const Event& event) {
    return kindOf(event) != EventKind::Message;
}

Event toEvent(TaskEvent event);

// Task id carried by a task event, or the optional task id of a message.
std::optional<std::string> eventTaskId(const Event& event);
const std::string& eventTaskId(const TaskEvent& event);
std::optional<std::string> eventConversationId(const Event& event);
const std::string& eventConversationId(const TaskEvent& event);

} // namespace agentd
