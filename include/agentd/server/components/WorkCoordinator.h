// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2024-2025 YAMS Project Contributors
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <thread>
#include <vector>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

namespace agentd {

/**
 * @brief Bounded worker pool that every agentd coroutine runs on.
 *
 * Sessions, their completion monitors and event streams are lightweight coroutines
 * multiplexed over a fixed number of threads running one shared io_context. No component
 * creates threads of its own.
 *
 * ## Usage Pattern
 *
 * ```cpp
 * WorkCoordinator coordinator;
 * coordinator.start(config.workerThreads);
 *
 * ProtocolServer server({.executor = coordinator.getExecutor(), ...});
 * boost::asio::co_spawn(coordinator.getExecutor(), serve(server), boost::asio::detached);
 * ```
 *
 * ## Shutdown Behavior
 *
 * - `stop()`: Resets the work guard and stops the io_context. Parked coroutines are
 *   destroyed together with the io_context.
 * - `join()`: Blocks until all workers exit.
 */
class WorkCoordinator {
public:
    /**
     * @brief Construct WorkCoordinator (does not start threads).
     */
    WorkCoordinator();

    /**
     * @brief Destructor stops and joins if still running.
     */
    ~WorkCoordinator();

    WorkCoordinator(const WorkCoordinator&) = delete;
    WorkCoordinator& operator=(const WorkCoordinator&) = delete;
    WorkCoordinator(WorkCoordinator&&) = delete;
    WorkCoordinator& operator=(WorkCoordinator&&) = delete;

    /**
     * @brief Start the worker thread pool.
     *
     * @param numThreads Optional thread count override (default: hardware_concurrency,
     *        minimum 1)
     *
     * @throws std::runtime_error if already started or thread creation fails
     */
    void start(std::optional<std::size_t> numThreads = std::nullopt);

    /**
     * @brief Stop accepting new work. Idempotent, does not block.
     */
    void stop();

    /**
     * @brief Wait for all worker threads to finish. Idempotent.
     *
     * Must call stop() first, or this will hang indefinitely.
     */
    void join();

    [[nodiscard]] std::shared_ptr<boost::asio::io_context> getIOContext() const noexcept;

    [[nodiscard]] boost::asio::any_io_executor getExecutor() const noexcept;

    /**
     * @brief Create a new strand for serialized work on the shared pool.
     */
    [[nodiscard]] boost::asio::strand<boost::asio::io_context::executor_type> makeStrand() const;

    [[nodiscard]] bool isRunning() const noexcept;

    [[nodiscard]] std::size_t getWorkerCount() const noexcept;

    [[nodiscard]] std::size_t getActiveWorkerCount() const noexcept {
        return activeWorkers_.load(std::memory_order_relaxed);
    }

private:
    std::shared_ptr<boost::asio::io_context> ioContext_;

    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        workGuard_;

    std::vector<std::thread> workers_;

    bool started_ = false;

    /// Count of workers currently inside io_context::run()
    std::atomic<std::size_t> activeWorkers_{0};
};

} // namespace agentd
