// include/copy_ngin/core/throttle.hpp
#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace copy_ngin {

/**
 * @brief Named minimum-interval throttle
 *
 * Tracks, per key, when an action last ran. Callers either poll with
 * can_run()/touch() and drop the action, or block with wait_and_touch()
 * until the interval has elapsed. Keys never seen before may always run.
 */
class Throttle {
public:
    using Clock = std::chrono::steady_clock;

    explicit Throttle(std::chrono::milliseconds min_interval);

    /**
     * @brief Check whether enough time has elapsed since the key last ran
     */
    bool can_run(const std::string& key) const;

    /**
     * @brief Record that the key ran now
     */
    void touch(const std::string& key);

    /**
     * @brief Sleep until the key may run, then record it as run
     *
     * Concurrent callers on the same key are serialized: each reserves the
     * next free slot before sleeping, so no two run within min_interval.
     * @return Time spent sleeping
     */
    std::chrono::milliseconds wait_and_touch(const std::string& key);

    std::chrono::milliseconds min_interval() const {
        return min_interval_;
    }

    void reset();

private:
    std::chrono::milliseconds min_interval_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Clock::time_point> last_run_;
};

}  // namespace copy_ngin
