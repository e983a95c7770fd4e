#pragma once

#include <agentd/core/async_sync.h>
#include <agentd/model/task.h>
#include <agentd/server/storage/task_storage.h>

#include <atomic>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>

namespace agentd {

/**
 * @brief One subscriber's view of a SessionEventProcessor stream.
 *
 * Events arrive in emission order. next() returns std::nullopt at a clean end of stream
 * and rethrows the close reason if the processor was closed with one. A subscription
 * that falls behind by the buffer size applies back-pressure to the publisher.
 */
class EventSubscription {
public:
    explicit EventSubscription(std::size_t capacity);

    boost::asio::awaitable<std::optional<Event>> next();

    // Like next(), but ends with std::nullopt whatever the close reason.
    boost::asio::awaitable<std::optional<Event>> nextOrEnd();

    // Detaches from the processor; pending and future publishes skip this subscriber.
    void cancel();
    bool isCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

private:
    friend class SessionEventProcessor;

    boost::asio::awaitable<bool> deliver(Event event);
    void finish(std::exception_ptr reason);

    AsyncQueue<Event> queue_;
    std::mutex reasonMutex_;
    std::exception_ptr reason_;
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Per-task event bus with validation and storage mirroring.
 *
 * Every event published through sendMessage()/sendTaskEvent() is validated against the
 * session state, task events are merged into the TaskStorage, and the event is then
 * delivered to all current subscribers. Publishing is serialized, so all subscribers
 * observe the same order.
 *
 * Validation rules:
 * - A session carries either a single Message or task events, never both
 * - Every event carries this processor's conversation id; task events its task id
 * - For a new task, the first task event must be a Task
 * - Nothing may follow a final status update, or a task that reached a terminal state
 * - A status update into a terminal state must be final
 *
 * Violations throw ProtocolError(InvalidEvent); publishing after close() throws
 * ProtocolError(SessionClosed).
 */
class SessionEventProcessor {
public:
    static constexpr std::size_t kDefaultBufferSize = 64;

    /**
     * @param currentTask Stored task this session continues, if any
     */
    SessionEventProcessor(std::string conversationId, std::string taskId,
                          std::shared_ptr<TaskStorage> taskStorage,
                          std::optional<Task> currentTask = std::nullopt,
                          std::size_t bufferSize = kDefaultBufferSize);

    SessionEventProcessor(const SessionEventProcessor&) = delete;
    SessionEventProcessor& operator=(const SessionEventProcessor&) = delete;

    const std::string& conversationId() const noexcept { return conversationId_; }
    const std::string& taskId() const noexcept { return taskId_; }

    /**
     * @brief Attach a subscriber. Only events published after this call are delivered.
     *
     * Subscribing to a closed processor yields an already-ended stream.
     */
    std::shared_ptr<EventSubscription> subscribe();

    boost::asio::awaitable<void> sendMessage(Message message);
    boost::asio::awaitable<void> sendTaskEvent(TaskEvent event);

    /**
     * @brief End the stream for current and future subscribers. Idempotent.
     *
     * @param reason Rethrown to subscribers after they drain; nullptr for a clean end
     */
    void close(std::exception_ptr reason = nullptr);

    bool isClosed() const;

    std::size_t subscriberCount() const;

private:
    enum class SessionKind { Undetermined, MessageSession, TaskSession };

    void ensureOpen() const;
    void validateTaskEvent(const TaskEvent& event) const;
    void recordTaskEvent(const TaskEvent& event);
    boost::asio::awaitable<void> publish(Event event);

    const std::string conversationId_;
    const std::string taskId_;
    std::shared_ptr<TaskStorage> taskStorage_;
    const std::size_t bufferSize_;

    // Serializes publishers; guards the validation state below.
    AsyncMutex publishMutex_;
    SessionKind kind_ = SessionKind::Undetermined;
    std::optional<TaskState> taskState_;
    bool finalSent_ = false;

    mutable std::mutex stateMutex_;
    bool closed_ = false;
    std::exception_ptr closeReason_;
    std::vector<std::weak_ptr<EventSubscription>> subscribers_;
};

} // namespace agentd
