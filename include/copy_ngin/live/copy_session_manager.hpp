// include/copy_ngin/live/copy_session_manager.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "copy_ngin/core/config_base.hpp"
#include "copy_ngin/core/error.hpp"
#include "copy_ngin/core/state_manager.hpp"
#include "copy_ngin/core/throttle.hpp"
#include "copy_ngin/data/exchange_interfaces.hpp"
#include "copy_ngin/live/address_backoff.hpp"
#include "copy_ngin/live/copy_session.hpp"
#include "copy_ngin/live/order_builder.hpp"

namespace copy_ngin {

/**
 * @brief Configuration of the live copy loop
 */
struct CopierConfig : public ConfigBase {
    int poll_interval_ms{1000};
    int info_min_interval_ms{334};  // 3 requests/s to the info endpoint
    int leverage_throttle_ms{2000};
    int account_cache_ttl_ms{5000};
    int backoff_base_ms{1000};
    int backoff_max_ms{60000};
    double slippage_pct{1.0};
    bool is_cross{true};
    size_t max_messages{500};

    // Configuration metadata
    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["poll_interval_ms"] = poll_interval_ms;
        j["info_min_interval_ms"] = info_min_interval_ms;
        j["leverage_throttle_ms"] = leverage_throttle_ms;
        j["account_cache_ttl_ms"] = account_cache_ttl_ms;
        j["backoff_base_ms"] = backoff_base_ms;
        j["backoff_max_ms"] = backoff_max_ms;
        j["slippage_pct"] = slippage_pct;
        j["is_cross"] = is_cross;
        j["max_messages"] = max_messages;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("poll_interval_ms"))
            poll_interval_ms = j.at("poll_interval_ms").get<int>();
        if (j.contains("info_min_interval_ms"))
            info_min_interval_ms = j.at("info_min_interval_ms").get<int>();
        if (j.contains("leverage_throttle_ms"))
            leverage_throttle_ms = j.at("leverage_throttle_ms").get<int>();
        if (j.contains("account_cache_ttl_ms"))
            account_cache_ttl_ms = j.at("account_cache_ttl_ms").get<int>();
        if (j.contains("backoff_base_ms"))
            backoff_base_ms = j.at("backoff_base_ms").get<int>();
        if (j.contains("backoff_max_ms"))
            backoff_max_ms = j.at("backoff_max_ms").get<int>();
        if (j.contains("slippage_pct"))
            slippage_pct = j.at("slippage_pct").get<double>();
        if (j.contains("is_cross"))
            is_cross = j.at("is_cross").get<bool>();
        if (j.contains("max_messages"))
            max_messages = j.at("max_messages").get<size_t>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }

    Result<void> validate() const override {
        if (poll_interval_ms <= 0) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "poll_interval_ms must be positive", "CopierConfig");
        }
        if (info_min_interval_ms < 0 || leverage_throttle_ms < 0 || account_cache_ttl_ms < 0) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "throttle and cache intervals must be non-negative",
                                    "CopierConfig");
        }
        if (backoff_base_ms <= 0 || backoff_max_ms < backoff_base_ms) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "backoff requires 0 < backoff_base_ms <= backoff_max_ms",
                                    "CopierConfig");
        }
        if (!(slippage_pct >= 0.0) || slippage_pct >= 100.0) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "slippage_pct must be in [0, 100)", "CopierConfig");
        }
        if (max_messages == 0) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT, "max_messages must be positive",
                                    "CopierConfig");
        }
        return Result<void>();
    }
};

/**
 * @brief Owns the live copy sessions and the loop that drives them
 *
 * One background thread ticks every poll interval and visits active
 * sessions one after another. The session map lock is held only to copy
 * or mutate the map, never across exchange calls.
 */
class CopySessionManager {
public:
    /**
     * @throws std::invalid_argument if a client is null or the config is invalid
     */
    CopySessionManager(std::shared_ptr<ExchangeInfoClient> info_client,
                       std::shared_ptr<TradingClient> trading_client, CopierConfig config = {});
    ~CopySessionManager();

    CopySessionManager(const CopySessionManager&) = delete;
    CopySessionManager& operator=(const CopySessionManager&) = delete;

    /**
     * @brief Register with the StateManager
     */
    Result<void> initialize();

    /**
     * @brief Start the background loop
     * @return NOT_INITIALIZED before initialize()
     */
    Result<void> start();

    /**
     * @brief Stop the background loop; sessions keep their state
     */
    Result<void> stop();

    bool is_running() const {
        return running_.load();
    }

    /**
     * @brief Create a session and seed its cursor and pre-session positions
     *
     * Exchange failures during seeding are recorded and do not fail creation.
     * @return Session id, INVALID_ARGUMENT for an empty source account
     */
    Result<std::string> create_session(const CopySessionRequest& request);

    /**
     * @brief Deactivate a session; an in-flight tick for it completes
     * @return SESSION_NOT_FOUND for an unknown id
     */
    Result<void> stop_session(const std::string& session_id);

    Result<CopySessionStatus> get_status(const std::string& session_id) const;

    std::vector<CopySessionStatus> list_sessions() const;

    size_t active_session_count() const;

    /**
     * @brief Visit every active session once
     *
     * Called by the background loop; exposed so a caller can drive the
     * manager without a thread.
     */
    void tick();

    const CopierConfig& config() const {
        return config_;
    }

    const std::string& instance_id() const {
        return instance_id_;
    }

private:
    void run_loop();
    void process_session(CopySession& session);
    void process_fill(CopySession& session, const Fill& fill);

    /**
     * Fetch fills through the info throttle and the address backoff
     */
    Result<std::vector<Fill>> fetch_fills(const std::string& account,
                                          const std::optional<Timestamp>& since);

    /**
     * Account state of a source account, cached for account_cache_ttl_ms
     */
    Result<AccountState> account_state(const std::string& account, bool allow_cached = true);

    Result<AssetSizing> asset_sizing(const std::string& asset);

    void maybe_update_leverage(CopySession& session, const std::string& asset, double leverage);

    void add_error(CopySession& session, const std::string& message) const;
    void add_notification(CopySession& session, const std::string& message) const;

    void publish_metrics();

    std::string generate_session_id() const;

    std::string generate_instance_id() const {
        static std::atomic<uint64_t> counter{0};
        return "COPY_SESSION_MANAGER_" + std::to_string(++counter);
    }

    struct CachedAccountState {
        AccountState state;
        std::chrono::steady_clock::time_point fetched_at;
    };

    std::shared_ptr<ExchangeInfoClient> info_client_;
    std::shared_ptr<TradingClient> trading_client_;
    CopierConfig config_;
    OrderBuilder order_builder_;

    Throttle info_throttle_;
    Throttle leverage_throttle_;
    AddressBackoff backoff_;

    mutable std::mutex sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<CopySession>> sessions_;

    std::mutex cache_mutex_;
    std::unordered_map<std::string, CachedAccountState> account_cache_;
    std::unordered_map<std::string, AssetSizing> sizing_cache_;

    std::atomic<uint64_t> processed_fills_{0};

    std::string instance_id_;
    std::atomic<bool> initialized_{false};
    std::atomic<bool> running_{false};
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    std::thread loop_thread_;
};

}  // namespace copy_ngin
