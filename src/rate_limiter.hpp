#pragma once
#include <deque>
#include <mutex>
#include <chrono>

namespace toolwire {

// Sliding-window request limiter shared by all request threads.
// A limit of 0 admits everything.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(int limit, Clock::duration window = std::chrono::minutes(1))
        : limit_(limit), window_(window) {}

    bool allow() {
        if (limit_ <= 0) return true;

        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        evict(now);
        if (static_cast<int>(admitted_.size()) >= limit_) return false;
        admitted_.push_back(now);
        return true;
    }

private:
    int limit_;
    Clock::duration window_;
    std::mutex mutex_;
    std::deque<Clock::time_point> admitted_;

    void evict(Clock::time_point now) {
        while (!admitted_.empty() && now - admitted_.front() >= window_) {
            admitted_.pop_front();
        }
    }
};

} // namespace toolwire
