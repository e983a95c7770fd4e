#include <agentd/model/task.h>

#include <type_traits>

namespace agentd {

std::optional<TaskState> parseTaskState(std::string_view s) {
    for (auto state : {TaskState::Submitted, TaskState::Working, TaskState::InputRequired,
                       TaskState::Completed, TaskState::Failed, TaskState::Canceled}) {
        if (s == toString(state))
            return state;
    }
    return std::nullopt;
}

Event toEvent(TaskEvent event) {
    return std::visit([](auto&& e) -> Event { return Event{std::move(e)}; }, std::move(event));
}

std::optional<std::string> eventTaskId(const Event& event) {
    return std::visit(
        [](const auto& e) -> std::optional<std::string> {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, Message>) {
                return e.taskId;
            } else if constexpr (std::is_same_v<T, Task>) {
                return e.id;
            } else {
                return e.taskId;
            }
        },
        event);
}

const std::string& eventTaskId(const TaskEvent& event) {
    return std::visit(
        [](const auto& e) -> const std::string& {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, Task>) {
                return e.id;
            } else {
                return e.taskId;
            }
        },
        event);
}

std::optional<std::string> eventConversationId(const Event& event) {
    return std::visit(
        [](const auto& e) -> std::optional<std::string> { return e.conversationId; }, event);
}

const std::string& eventConversationId(const TaskEvent& event) {
    return std::visit([](const auto& e) -> const std::string& { return e.conversationId; },
                      event);
}

} // namespace agentd
