// Bounded channel between the copy loop and a progress consumer. The loop
// never waits: when the queue is full the oldest sample is dropped.
#pragma once
#include "TransferTypes.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace skiff {

class ProgressQueue {
public:
    explicit ProgressQueue(std::size_t capacity = 64);

    ProgressQueue(const ProgressQueue&) = delete;
    ProgressQueue& operator=(const ProgressQueue&) = delete;

    // Non-blocking. Ignored once closed.
    void publish(const ProgressSample& sample);

    // Waits up to timeout for the next sample. Returns false on timeout or
    // when the queue is closed and drained.
    bool pop(ProgressSample& out, std::chrono::milliseconds timeout);

    void close();
    bool closed() const;
    std::size_t dropped() const;
    std::size_t size() const;

    // Callback for TransferEngine that publishes into this queue. The queue
    // must outlive the transfer.
    ProgressCallback publisher();

private:
    const std::size_t capacity_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<ProgressSample> items_;
    std::size_t dropped_ = 0;
    bool closed_ = false;
};

} // namespace skiff
