/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: async_write_queue.h
 * Description: Header for AsyncWriteQueue, a single worker thread that applies a
 *              blocking append function to queued payloads in FIFO order and
 *              settles a std::future per payload. Used by stream writers to
 *              offer a fire-and-forget write primitive.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <thread>

namespace kbridge {
namespace client {

class AsyncWriteQueue {
public:
    using AppendFn = std::function<void(const std::string& payload)>;

    AsyncWriteQueue(std::string name, AppendFn append);
    ~AsyncWriteQueue();

    AsyncWriteQueue(const AsyncWriteQueue&) = delete;
    AsyncWriteQueue& operator=(const AsyncWriteQueue&) = delete;

    // Start the worker (idempotent)
    void start();

    // Queue a payload. If the queue is stopped the future holds a StreamError.
    std::future<void> submit(const std::string& payload);

    // Block until everything submitted so far has been appended or failed
    void flush();

    // Drain outstanding work and join the worker (idempotent)
    void stop();

    bool running() const { return running_.load(); }

private:
    struct Task {
        std::string payload;
        std::promise<void> promise;
    };

    std::string name_;
    AppendFn append_;
    std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<Task> tasks_;
    uint64_t submitted_ = 0;
    uint64_t completed_ = 0;
    std::atomic<bool> running_{false};
    bool stopping_ = false;
    std::thread worker_;

    void run();
};

} // namespace client
} // namespace kbridge
