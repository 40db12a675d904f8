/**
 * @file serial_executor.hpp
 * @brief Single-threaded task queue.
 *
 * Two instances give the discovery engine its execution contexts:
 * - "radio": every radio operation and radio callback runs here, so the
 *   driver is never entered from two threads at once.
 * - "delivery": listener notifications run here, so listener code never
 *   runs on (or blocks) the radio context.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#pragma once

#include "proxid/core/export.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace proxid {
namespace core {

/**
 * @class SerialExecutor
 * @brief Runs posted tasks one at a time, in FIFO order, on one thread.
 *
 * Exceptions escaping a task are caught and logged; the worker survives.
 *
 * @code
 * SerialExecutor radio("radio");
 * radio.post([&] { scanner.start(); });
 * radio.runSync([&] { advertiser.stop(); });  // waits for completion
 * @endcode
 */
class PROXID_CORE_API SerialExecutor {
public:
    using Task = std::function<void()>;

    explicit SerialExecutor(std::string name);

    /// Equivalent to shutdown().
    ~SerialExecutor();

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    /**
     * @brief Queue a task.
     * @return False (task dropped) once shutdown has begun.
     */
    bool post(Task task);

    /**
     * @brief Run a task and wait for it to finish.
     *
     * Runs inline when called from the executor's own thread.
     * @return False if the executor no longer accepts tasks.
     */
    bool runSync(Task task);

    /// True when called from inside one of this executor's tasks.
    bool isCurrentThread() const;

    /**
     * @brief Stop accepting tasks, run what is already queued, join.
     *
     * Idempotent. Must not be called from one of this executor's tasks.
     */
    void shutdown();

    bool isRunning() const { return !stopping_.load(); }

    /// Tasks queued but not yet started.
    size_t pendingTasks() const;

    /// Tasks that threw.
    uint64_t failedTasks() const { return failedTasks_.load(); }

    const std::string& name() const { return name_; }

private:
    std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<Task> tasks_;
    std::atomic<bool> stopping_{false};
    std::atomic<uint64_t> failedTasks_{0};

    std::thread worker_;

    void workerLoop();
};

}  // namespace core
}  // namespace proxid
