// src/live/address_backoff.cpp
#include "copy_ngin/live/address_backoff.hpp"
#include <algorithm>
#include "copy_ngin/core/logger.hpp"

namespace copy_ngin {

AddressBackoff::AddressBackoff(std::chrono::milliseconds base, std::chrono::milliseconds max)
    : base_(std::max(base, std::chrono::milliseconds(1))), max_(std::max(max, base_)) {}

std::chrono::milliseconds AddressBackoff::delay_for(int failures) const {
    if (failures <= 0) {
        return std::chrono::milliseconds(0);
    }
    // Stop doubling at max_ so long outages cannot overflow
    auto delay = base_;
    for (int i = 1; i < failures && delay < max_; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_);
}

bool AddressBackoff::is_backing_off(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(address);
    return it != states_.end() && Clock::now() < it->second.until;
}

std::chrono::milliseconds AddressBackoff::record_failure(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = states_[address];
    state.failures++;
    const auto delay = delay_for(state.failures);
    state.until = Clock::now() + delay;
    WARN("Backing off " << address << " for " << delay.count() << "ms after "
                        << state.failures << " failure(s)");
    return delay;
}

void AddressBackoff::record_success(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (states_.erase(address) > 0) {
        DEBUG("Backoff cleared for " << address);
    }
}

int AddressBackoff::failure_count(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(address);
    return it == states_.end() ? 0 : it->second.failures;
}

std::chrono::milliseconds AddressBackoff::remaining(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(address);
    if (it == states_.end()) {
        return std::chrono::milliseconds(0);
    }
    const auto now = Clock::now();
    if (now >= it->second.until) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(it->second.until - now);
}

}  // namespace copy_ngin
