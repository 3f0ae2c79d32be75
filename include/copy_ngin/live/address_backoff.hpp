// include/copy_ngin/live/address_backoff.hpp
#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace copy_ngin {

/**
 * @brief Exponential backoff keyed by source account address
 *
 * Each failure doubles the delay starting from base, capped at max. A
 * success clears the address immediately. Thread-safe.
 */
class AddressBackoff {
public:
    using Clock = std::chrono::steady_clock;

    AddressBackoff(std::chrono::milliseconds base, std::chrono::milliseconds max);

    /**
     * @brief Whether calls for the address must be skipped right now
     */
    bool is_backing_off(const std::string& address) const;

    /**
     * @brief Record a failed call and open a new backoff window
     * @return Delay of the window just opened
     */
    std::chrono::milliseconds record_failure(const std::string& address);

    void record_success(const std::string& address);

    int failure_count(const std::string& address) const;

    /**
     * @brief Time left in the current window, zero when not backing off
     */
    std::chrono::milliseconds remaining(const std::string& address) const;

    /**
     * @brief Delay applied after the n-th consecutive failure
     */
    std::chrono::milliseconds delay_for(int failures) const;

private:
    struct State {
        int failures{0};
        Clock::time_point until{};
    };

    std::chrono::milliseconds base_;
    std::chrono::milliseconds max_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, State> states_;
};

}  // namespace copy_ngin
