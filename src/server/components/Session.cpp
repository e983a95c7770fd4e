#include <agentd/server/components/Session.h>

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

namespace agentd {

Session::Session(boost::asio::any_io_executor executor,
                 std::shared_ptr<SessionEventProcessor> eventProcessor, Job job)
    : executor_(std::move(executor)), eventProcessor_(std::move(eventProcessor)),
      job_(std::move(job)) {
    if (!eventProcessor_) {
        throw std::invalid_argument("Session: eventProcessor cannot be null");
    }
}

void Session::start() {
    auto expected = JobState::NotStarted;
    if (!jobState_.compare_exchange_strong(expected, JobState::Running,
                                           std::memory_order_acq_rel)) {
        return;
    }
    spdlog::debug("[Session] Starting job for task {}", taskId());
    boost::asio::co_spawn(executor_, runOwned(shared_from_this()),
                          boost::asio::detached);
}

boost::asio::awaitable<void> Session::join() {
    start();
    co_await finishedEvent_.wait();
    co_await finalizedEvent_.wait();
}

boost::asio::awaitable<void> Session::close() {
    if (closing_.exchange(true, std::memory_order_acq_rel)) {
        co_await closedEvent_.wait();
        co_return;
    }

    stopSource_.request_stop();

    // A job that never started is finished without running.
    auto expected = JobState::NotStarted;
    const bool neverStarted = jobState_.compare_exchange_strong(
        expected, JobState::Finished, std::memory_order_acq_rel);
    if (neverStarted) {
        finishedEvent_.set();
    }

    eventProcessor_->close();
    closedEvent_.set();

    if (neverStarted && !managed_.load(std::memory_order_acquire)) {
        markFinalized();
    }
    spdlog::debug("[Session] Closed session for task {}", taskId());
}

boost::asio::awaitable<void> Session::waitFinished() {
    co_await finishedEvent_.wait();
}

std::exception_ptr Session::failure() const {
    std::lock_guard<std::mutex> lock(failureMutex_);
    return failure_;
}

boost::asio::awaitable<void> Session::runOwned(std::shared_ptr<Session> self) {
    co_await self->run();
}

boost::asio::awaitable<void> Session::run() {
    std::exception_ptr failure;
    try {
        if (job_) {
            co_await job_();
        }
    } catch (const std::exception& e) {
        spdlog::debug("[Session] Job for task {} failed: {}", taskId(), e.what());
        failure = std::current_exception();
    } catch (...) {
        spdlog::debug("[Session] Job for task {} failed with a non-standard exception",
                      taskId());
        failure = std::current_exception();
    }

    if (failure) {
        std::lock_guard<std::mutex> lock(failureMutex_);
        failure_ = failure;
    }
    markFinished();

    if (!managed_.load(std::memory_order_acquire)) {
        co_await close();
        markFinalized();
    }
}

void Session::markFinished() {
    jobState_.store(JobState::Finished, std::memory_order_release);
    finishedEvent_.set();
}

void Session::markFinalized() {
    finalizedEvent_.set();
}

void Session::setManaged() {
    managed_.store(true, std::memory_order_release);
}

} // namespace agentd
