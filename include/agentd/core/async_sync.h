#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

namespace agentd {

/**
 * @file async_sync.h
 * @brief Coroutine-aware synchronization primitives built on Boost.Asio.
 *
 * A coroutine waiting on one of these primitives suspends without blocking its worker
 * thread. Waiters are resumed on their own executor, never inline from the thread that
 * releases them.
 */

namespace detail {

class Waiter {
public:
    virtual ~Waiter() = default;
    virtual void complete() = 0;
};

template <typename Handler> class HandlerWaiter final : public Waiter {
public:
    explicit HandlerWaiter(Handler&& handler) : handler_(std::move(handler)) {}

    void complete() override {
        auto ex = boost::asio::get_associated_executor(handler_);
        boost::asio::post(ex, [h = std::move(handler_)]() mutable {
            h(boost::system::error_code{});
        });
    }

private:
    Handler handler_;
};

using WaiterList = std::deque<std::unique_ptr<Waiter>>;

inline std::unique_ptr<Waiter> takeFirst(WaiterList& waiters) {
    if (waiters.empty())
        return nullptr;
    auto w = std::move(waiters.front());
    waiters.pop_front();
    return w;
}

inline void completeAll(WaiterList& waiters) {
    for (auto& w : waiters)
        w->complete();
    waiters.clear();
}

/**
 * Suspends the calling coroutine until it is completed from `waiters`, unless `ready()`
 * returns true. `ready` runs with `mu` held, so the check and the parking are atomic with
 * respect to anyone who completes waiters under the same mutex.
 */
template <typename Ready>
boost::asio::awaitable<void> parkUnless(std::mutex& mu, WaiterList& waiters, Ready ready) {
    return boost::asio::async_initiate<const boost::asio::use_awaitable_t<>&,
                                       void(boost::system::error_code)>(
        [&mu, &waiters, ready = std::move(ready)](auto handler) mutable {
            using HandlerT = decltype(handler);
            std::unique_lock<std::mutex> lock(mu);
            if (ready()) {
                lock.unlock();
                HandlerWaiter<HandlerT>(std::move(handler)).complete();
                return;
            }
            waiters.push_back(std::make_unique<HandlerWaiter<HandlerT>>(std::move(handler)));
        },
        boost::asio::use_awaitable);
}

} // namespace detail

/**
 * @brief One-shot latch. Once set, every current and future wait() completes.
 */
class AsyncEvent {
public:
    AsyncEvent() = default;
    AsyncEvent(const AsyncEvent&) = delete;
    AsyncEvent& operator=(const AsyncEvent&) = delete;

    void set();
    bool isSet() const;
    boost::asio::awaitable<void> wait();

private:
    mutable std::mutex mutex_;
    bool set_ = false;
    detail::WaiterList waiters_;
};

/**
 * @brief Non-reentrant mutex for coroutines with FIFO hand-off.
 *
 * Locking twice from the same logical flow deadlocks. unlock() on a mutex that is not
 * locked throws std::logic_error.
 */
class AsyncMutex {
public:
    class Guard {
    public:
        Guard() = default;
        explicit Guard(AsyncMutex* mutex) : mutex_(mutex) {}
        Guard(Guard&& other) noexcept : mutex_(std::exchange(other.mutex_, nullptr)) {}
        Guard& operator=(Guard&& other) noexcept {
            if (this != &other) {
                release();
                mutex_ = std::exchange(other.mutex_, nullptr);
            }
            return *this;
        }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        ~Guard() { release(); }

        void release() {
            if (mutex_) {
                std::exchange(mutex_, nullptr)->unlock();
            }
        }

    private:
        AsyncMutex* mutex_ = nullptr;
    };

    AsyncMutex() = default;
    AsyncMutex(const AsyncMutex&) = delete;
    AsyncMutex& operator=(const AsyncMutex&) = delete;

    boost::asio::awaitable<void> lock();
    boost::asio::awaitable<Guard> scopedLock();
    bool tryLock();
    void unlock();
    bool isLocked() const;

private:
    mutable std::mutex mutex_;
    bool locked_ = false;
    detail::WaiterList waiters_;
};

/**
 * @brief Bounded multi-producer multi-consumer queue for coroutines.
 *
 * push() suspends while the queue is full; pop() suspends while it is empty. After
 * close(), push() returns false and pop() drains the remaining items before returning
 * std::nullopt.
 */
template <typename T> class AsyncQueue {
public:
    explicit AsyncQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}
    AsyncQueue(const AsyncQueue&) = delete;
    AsyncQueue& operator=(const AsyncQueue&) = delete;

    boost::asio::awaitable<bool> push(T value) {
        for (;;) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (closed_)
                    co_return false;
                if (items_.size() < capacity_) {
                    items_.push_back(std::move(value));
                    auto waiter = detail::takeFirst(popWaiters_);
                    lock.unlock();
                    if (waiter)
                        waiter->complete();
                    co_return true;
                }
            }
            co_await detail::parkUnless(mutex_, pushWaiters_,
                                        [this] { return closed_ || items_.size() < capacity_; });
        }
    }

    boost::asio::awaitable<std::optional<T>> pop() {
        for (;;) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (!items_.empty()) {
                    std::optional<T> item{std::move(items_.front())};
                    items_.pop_front();
                    auto waiter = detail::takeFirst(pushWaiters_);
                    lock.unlock();
                    if (waiter)
                        waiter->complete();
                    co_return item;
                }
                if (closed_)
                    co_return std::nullopt;
            }
            co_await detail::parkUnless(mutex_, popWaiters_,
                                        [this] { return closed_ || !items_.empty(); });
        }
    }

    void close() {
        detail::WaiterList pushers;
        detail::WaiterList poppers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
                return;
            closed_ = true;
            pushers.swap(pushWaiters_);
            poppers.swap(popWaiters_);
        }
        detail::completeAll(pushers);
        detail::completeAll(poppers);
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<T> items_;
    std::size_t capacity_;
    bool closed_ = false;
    detail::WaiterList pushWaiters_;
    detail::WaiterList popWaiters_;
};

} // namespace agentd
