#pragma once

#include <agentd/core/async_sync.h>
#include <agentd/server/components/SessionEventProcessor.h>

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

namespace agentd {

class SessionManager;

/**
 * @brief Binds one SessionEventProcessor to one background job.
 *
 * Lifecycle: NotStarted -> Running -> Finished, with `closed` tracked separately.
 *
 * - start() launches the job on the executor once; later calls are no-ops.
 * - join() starts if needed, waits for the job and then for finalization. A session
 *   owned by SessionManager is finalized once the manager has unregistered and closed it
 *   and sent its notifications; an unmanaged session finalizes itself by closing.
 * - close() requests stop, closes the processor and marks a never-started job finished.
 *   Idempotent; concurrent callers all wait for the first close to complete.
 *
 * Cancellation is cooperative: a running job observes stopToken(), or fails its next
 * publish with SessionClosed.
 */
class Session : public std::enable_shared_from_this<Session> {
public:
    using Job = std::function<boost::asio::awaitable<void>()>;

    enum class JobState { NotStarted, Running, Finished };

    Session(boost::asio::any_io_executor executor,
            std::shared_ptr<SessionEventProcessor> eventProcessor, Job job);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& conversationId() const noexcept {
        return eventProcessor_->conversationId();
    }
    const std::string& taskId() const noexcept { return eventProcessor_->taskId(); }
    const std::shared_ptr<SessionEventProcessor>& eventProcessor() const noexcept {
        return eventProcessor_;
    }

    void start();
    boost::asio::awaitable<void> join();
    boost::asio::awaitable<void> close();

    // Waits for the job to finish. Never throws, whatever the job's outcome.
    boost::asio::awaitable<void> waitFinished();

    JobState jobState() const noexcept { return jobState_.load(std::memory_order_acquire); }
    bool isStarted() const noexcept { return jobState() != JobState::NotStarted; }
    bool isFinished() const noexcept { return jobState() == JobState::Finished; }
    bool isClosed() const noexcept { return closedEvent_.isSet(); }

    std::stop_token stopToken() const noexcept { return stopSource_.get_token(); }

    // Exception the job ended with, if any.
    std::exception_ptr failure() const;

private:
    friend class SessionManager;

    // Keeps the session alive for the duration of the detached job.
    static boost::asio::awaitable<void> runOwned(std::shared_ptr<Session> self);
    boost::asio::awaitable<void> run();
    void markFinished();
    void markFinalized();
    void setManaged();

    boost::asio::any_io_executor executor_;
    std::shared_ptr<SessionEventProcessor> eventProcessor_;
    Job job_;

    std::atomic<JobState> jobState_{JobState::NotStarted};
    std::atomic<bool> managed_{false};
    std::atomic<bool> closing_{false};
    std::stop_source stopSource_;

    AsyncEvent finishedEvent_;
    AsyncEvent closedEvent_;
    AsyncEvent finalizedEvent_;

    mutable std::mutex failureMutex_;
    std::exception_ptr failure_;
};

} // namespace agentd
