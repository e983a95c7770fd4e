#include <agentd/core/async_sync.h>

#include <stdexcept>

namespace agentd {

void AsyncEvent::set() {
    detail::WaiterList waiters;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (set_)
            return;
        set_ = true;
        waiters.swap(waiters_);
    }
    detail::completeAll(waiters);
}

bool AsyncEvent::isSet() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return set_;
}

boost::asio::awaitable<void> AsyncEvent::wait() {
    return detail::parkUnless(mutex_, waiters_, [this] { return set_; });
}

boost::asio::awaitable<void> AsyncMutex::lock() {
    // Ownership is handed directly to the next waiter on unlock(), so a resumed waiter
    // already holds the lock.
    return detail::parkUnless(mutex_, waiters_, [this] {
        if (!locked_) {
            locked_ = true;
            return true;
        }
        return false;
    });
}

boost::asio::awaitable<AsyncMutex::Guard> AsyncMutex::scopedLock() {
    co_await lock();
    co_return Guard{this};
}

bool AsyncMutex::tryLock() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (locked_)
        return false;
    locked_ = true;
    return true;
}

void AsyncMutex::unlock() {
    std::unique_ptr<detail::Waiter> next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!locked_) {
            throw std::logic_error("AsyncMutex::unlock called on an unlocked mutex");
        }
        next = detail::takeFirst(waiters_);
        if (!next)
            locked_ = false;
    }
    if (next)
        next->complete();
}

bool AsyncMutex::isLocked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locked_;
}

} // namespace agentd
