/**
 * @file serial_executor.cpp
 * @brief SerialExecutor implementation.
 *
 * @copyright Copyright (c) 2024 proxid Contributors
 * @license MIT License
 */

#include "proxid/core/serial_executor.hpp"
#include "proxid/utils/logger.hpp"

#include <exception>
#include <future>
#include <memory>

namespace proxid {
namespace core {

SerialExecutor::SerialExecutor(std::string name)
    : name_(std::move(name))
{
    worker_ = std::thread(&SerialExecutor::workerLoop, this);
    LOG_DEBUG("Executor", "Started '{}'", name_);
}

SerialExecutor::~SerialExecutor() {
    shutdown();
}

bool SerialExecutor::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_.load()) {
            LOG_TRACE("Executor", "'{}' is shut down, dropping task", name_);
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    condition_.notify_one();
    return true;
}

bool SerialExecutor::runSync(Task task) {
    if (isCurrentThread()) {
        task();
        return true;
    }

    auto done = std::make_shared<std::promise<void>>();
    std::future<void> finished = done->get_future();

    bool queued = post([task = std::move(task), done]() {
        try {
            task();
            done->set_value();
        } catch (...) {
            done->set_exception(std::current_exception());
        }
    });
    if (!queued) {
        return false;
    }

    try {
        finished.get();
    } catch (const std::exception& e) {
        LOG_ERROR("Executor", "'{}' synchronous task failed: {}", name_, e.what());
        failedTasks_.fetch_add(1);
    } catch (...) {
        LOG_ERROR("Executor", "'{}' synchronous task threw a non-standard exception", name_);
        failedTasks_.fetch_add(1);
    }
    return true;
}

bool SerialExecutor::isCurrentThread() const {
    return std::this_thread::get_id() == worker_.get_id();
}

void SerialExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_.exchange(true)) {
            return;
        }
    }
    condition_.notify_all();

    if (isCurrentThread()) {
        LOG_ERROR("Executor", "'{}' shutdown() called from its own task; not joining", name_);
        worker_.detach();
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    LOG_DEBUG("Executor", "Stopped '{}'", name_);
}

size_t SerialExecutor::pendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void SerialExecutor::workerLoop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] {
                return stopping_.load() || !tasks_.empty();
            });
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            failedTasks_.fetch_add(1);
            LOG_ERROR("Executor", "'{}' task threw: {}", name_, e.what());
        } catch (...) {
            failedTasks_.fetch_add(1);
            LOG_ERROR("Executor", "'{}' task threw a non-standard exception", name_);
        }
    }
}

}  // namespace core
}  // namespace proxid
