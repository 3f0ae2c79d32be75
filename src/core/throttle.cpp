// src/core/throttle.cpp
#include "copy_ngin/core/throttle.hpp"
#include <algorithm>
#include <thread>

namespace copy_ngin {

Throttle::Throttle(std::chrono::milliseconds min_interval)
    : min_interval_(std::max(min_interval, std::chrono::milliseconds(0))) {}

bool Throttle::can_run(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_run_.find(key);
    if (it == last_run_.end()) {
        return true;
    }
    return Clock::now() - it->second >= min_interval_;
}

void Throttle::touch(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_run_[key] = Clock::now();
}

std::chrono::milliseconds Throttle::wait_and_touch(const std::string& key) {
    Clock::time_point slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        slot = now;
        auto it = last_run_.find(key);
        if (it != last_run_.end()) {
            slot = std::max(now, it->second + min_interval_);
        }
        last_run_[key] = slot;
    }

    auto now = Clock::now();
    if (slot <= now) {
        return std::chrono::milliseconds(0);
    }
    auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(slot - now);
    std::this_thread::sleep_until(slot);
    return wait;
}

void Throttle::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_run_.clear();
}

}  // namespace copy_ngin
