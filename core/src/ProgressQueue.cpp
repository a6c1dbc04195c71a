#include "skiff/ProgressQueue.hpp"

namespace skiff {

ProgressQueue::ProgressQueue(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void ProgressQueue::publish(const ProgressSample& sample) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (closed_) return;
        if (items_.size() >= capacity_) {
            items_.pop_front();
            ++dropped_;
        }
        items_.push_back(sample);
    }
    cv_.notify_one();
}

bool ProgressQueue::pop(ProgressSample& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait_for(lk, timeout, [this] { return !items_.empty() || closed_; });
    if (items_.empty()) return false;
    out = items_.front();
    items_.pop_front();
    return true;
}

void ProgressQueue::close() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ProgressQueue::closed() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return closed_;
}

std::size_t ProgressQueue::dropped() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return dropped_;
}

std::size_t ProgressQueue::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return items_.size();
}

ProgressCallback ProgressQueue::publisher() {
    return [this](const ProgressSample& s) { publish(s); };
}

} // namespace skiff
