#include <agentd/server/components/SessionEventProcessor.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace agentd {

namespace {

constexpr const char* kSessionClosed = "Session event processor is closed, can't send events";
constexpr const char* kInvalidConversationId =
    "Event conversation id must be the same as the session conversation id";
constexpr const char* kInvalidTaskId = "Event task id must be the same as the session task id";
constexpr const char* kMessageSent =
    "A message has already been sent in this session; no more events are allowed";
constexpr const char* kTaskInitialized =
    "The session already carries task events; only task events for the same task are allowed";
constexpr const char* kTaskDoesNotExist =
    "The task does not exist yet and the event is not a Task; a new task must start with a "
    "Task event";
constexpr const char* kFinalSent =
    "A final task event has already been sent in this session; no more events are allowed";
constexpr const char* kTerminalState =
    "Task events cannot be sent once the task reached a terminal state";
constexpr const char* kFinalRequired =
    "A status update into a terminal state must be marked final";

} // namespace

EventSubscription::EventSubscription(std::size_t capacity) : queue_(capacity) {}

boost::asio::awaitable<std::optional<Event>> EventSubscription::next() {
    auto event = co_await queue_.pop();
    if (event)
        co_return event;

    std::exception_ptr reason;
    {
        std::lock_guard<std::mutex> lock(reasonMutex_);
        reason = reason_;
    }
    if (reason && !isCancelled())
        std::rethrow_exception(reason);
    co_return std::nullopt;
}

boost::asio::awaitable<std::optional<Event>> EventSubscription::nextOrEnd() {
    co_return co_await queue_.pop();
}

void EventSubscription::cancel() {
    cancelled_.store(true, std::memory_order_release);
    queue_.close();
}

boost::asio::awaitable<bool> EventSubscription::deliver(Event event) {
    if (isCancelled())
        co_return false;
    co_return co_await queue_.push(std::move(event));
}

void EventSubscription::finish(std::exception_ptr reason) {
    {
        std::lock_guard<std::mutex> lock(reasonMutex_);
        reason_ = std::move(reason);
    }
    queue_.close();
}

SessionEventProcessor::SessionEventProcessor(std::string conversationId, std::string taskId,
                                             std::shared_ptr<TaskStorage> taskStorage,
                                             std::optional<Task> currentTask,
                                             std::size_t bufferSize)
    : conversationId_(std::move(conversationId)), taskId_(std::move(taskId)),
      taskStorage_(std::move(taskStorage)), bufferSize_(bufferSize) {
    if (!taskStorage_) {
        throw std::invalid_argument("SessionEventProcessor: taskStorage cannot be null");
    }
    if (currentTask) {
        kind_ = SessionKind::TaskSession;
        taskState_ = currentTask->status.state;
    }
}

std::shared_ptr<EventSubscription> SessionEventProcessor::subscribe() {
    auto subscription = std::make_shared<EventSubscription>(bufferSize_);
    std::exception_ptr reason;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!closed_) {
            subscribers_.push_back(subscription);
            return subscription;
        }
        reason = closeReason_;
    }
    subscription->finish(reason);
    return subscription;
}

boost::asio::awaitable<void> SessionEventProcessor::sendMessage(Message message) {
    auto guard = co_await publishMutex_.scopedLock();
    ensureOpen();

    if (message.conversationId != conversationId_) {
        throw ProtocolError(ErrorCode::InvalidEvent, kInvalidConversationId);
    }
    switch (kind_) {
        case SessionKind::MessageSession:
            throw ProtocolError(ErrorCode::InvalidEvent, kMessageSent);
        case SessionKind::TaskSession:
            throw ProtocolError(ErrorCode::InvalidEvent, kTaskInitialized);
        case SessionKind::Undetermined:
            break;
    }

    kind_ = SessionKind::MessageSession;
    co_await publish(Event{std::move(message)});
}

boost::asio::awaitable<void> SessionEventProcessor::sendTaskEvent(TaskEvent event) {
    auto guard = co_await publishMutex_.scopedLock();
    ensureOpen();
    validateTaskEvent(event);

    if (auto r = taskStorage_->update(event); !r) {
        spdlog::warn("[SessionEventProcessor] Task {} storage update failed: {}", taskId_,
                     r.error().message);
        throw ProtocolError(r.error());
    }
    recordTaskEvent(event);
    co_await publish(toEvent(std::move(event)));
}

void SessionEventProcessor::close(std::exception_ptr reason) {
    std::vector<std::weak_ptr<EventSubscription>> subscribers;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (closed_)
            return;
        closed_ = true;
        closeReason_ = reason;
        subscribers.swap(subscribers_);
    }
    for (auto& weak : subscribers) {
        if (auto s = weak.lock())
            s->finish(reason);
    }
    spdlog::debug("[SessionEventProcessor] Closed session for task {} ({} subscribers)", taskId_,
                  subscribers.size());
}

bool SessionEventProcessor::isClosed() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return closed_;
}

std::size_t SessionEventProcessor::subscriberCount() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return static_cast<std::size_t>(
        std::count_if(subscribers_.begin(), subscribers_.end(), [](const auto& weak) {
            auto s = weak.lock();
            return s && !s->isCancelled();
        }));
}

void SessionEventProcessor::ensureOpen() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (closed_) {
        throw ProtocolError(ErrorCode::SessionClosed, kSessionClosed);
    }
}

void SessionEventProcessor::validateTaskEvent(const TaskEvent& event) const {
    if (eventConversationId(event) != conversationId_) {
        throw ProtocolError(ErrorCode::InvalidEvent, kInvalidConversationId);
    }
    if (eventTaskId(event) != taskId_) {
        throw ProtocolError(ErrorCode::InvalidEvent, kInvalidTaskId);
    }
    if (kind_ == SessionKind::MessageSession) {
        throw ProtocolError(ErrorCode::InvalidEvent, kMessageSent);
    }
    if (!taskState_ && !std::holds_alternative<Task>(event)) {
        throw ProtocolError(ErrorCode::InvalidEvent, kTaskDoesNotExist);
    }
    if (finalSent_) {
        throw ProtocolError(ErrorCode::InvalidEvent, kFinalSent);
    }
    if (taskState_ && isTerminal(*taskState_)) {
        throw ProtocolError(ErrorCode::InvalidEvent, kTerminalState);
    }
    if (const auto* status = std::get_if<TaskStatusUpdateEvent>(&event)) {
        if (isTerminal(status->status.state) && !status->final) {
            throw ProtocolError(ErrorCode::InvalidEvent, kFinalRequired);
        }
    }
}

void SessionEventProcessor::recordTaskEvent(const TaskEvent& event) {
    kind_ = SessionKind::TaskSession;
    if (const auto* task = std::get_if<Task>(&event)) {
        taskState_ = task->status.state;
    } else if (const auto* status = std::get_if<TaskStatusUpdateEvent>(&event)) {
        taskState_ = status->status.state;
        finalSent_ = status->final;
    }
}

boost::asio::awaitable<void> SessionEventProcessor::publish(Event event) {
    std::vector<std::shared_ptr<EventSubscription>> targets;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                          [](const auto& weak) {
                                              auto s = weak.lock();
                                              return !s || s->isCancelled();
                                          }),
                           subscribers_.end());
        targets.reserve(subscribers_.size());
        for (auto& weak : subscribers_) {
            if (auto s = weak.lock())
                targets.push_back(std::move(s));
        }
    }

    for (auto& subscription : targets) {
        co_await subscription->deliver(event);
    }
}

} // namespace agentd
