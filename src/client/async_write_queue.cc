/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: async_write_queue.cc
 * Description: Implementation of AsyncWriteQueue. One worker thread appends
 *              queued payloads in submission order and fulfils or fails the
 *              promise of each payload; flush() waits for the queue to go idle.
 */

#include "kbridge/client/async_write_queue.h"
#include "kbridge/client/errors.h"
#include <exception>
#include <utility>

namespace kbridge {
namespace client {

AsyncWriteQueue::AsyncWriteQueue(std::string name, AppendFn append)
    : name_(std::move(name)), append_(std::move(append)) {
}

AsyncWriteQueue::~AsyncWriteQueue() {
    stop();
}

void AsyncWriteQueue::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.load() || stopping_) {
        return;
    }
    running_ = true;
    worker_ = std::thread([this]() { run(); });
}

std::future<void> AsyncWriteQueue::submit(const std::string& payload) {
    Task task;
    task.payload = payload;
    std::future<void> future = task.promise.get_future();

    std::unique_lock<std::mutex> lock(mutex_);
    if (!running_.load() || stopping_) {
        lock.unlock();
        task.promise.set_exception(std::make_exception_ptr(
            StreamError(name_ + ": writer is not running")));
        return future;
    }
    tasks_.push_back(std::move(task));
    ++submitted_;
    lock.unlock();
    work_cv_.notify_one();
    return future;
}

void AsyncWriteQueue::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    const uint64_t target = submitted_;
    idle_cv_.wait(lock, [this, target]() { return completed_ >= target; });
}

void AsyncWriteQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) {
            return;
        }
        stopping_ = true;
    }
    work_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    running_ = false;
}

void AsyncWriteQueue::run() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                // stopping and fully drained
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try {
            append_(task.payload);
            task.promise.set_value();
        } catch (const std::exception& e) {
            task.promise.set_exception(std::make_exception_ptr(
                StreamError(name_ + ": append failed: " + e.what())));
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++completed_;
        }
        idle_cv_.notify_all();
    }
}

} // namespace client
} // namespace kbridge
