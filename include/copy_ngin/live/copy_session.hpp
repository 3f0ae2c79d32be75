// include/copy_ngin/live/copy_session.hpp
#pragma once

#include <atomic>
#include <deque>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "copy_ngin/backtest/backtest_results.hpp"
#include "copy_ngin/core/types.hpp"

namespace copy_ngin {

/**
 * @brief Leverage or position size of a session: a fixed value or "auto"
 */
struct CopyParameter {
    bool automatic{false};
    double value{1.0};

    static CopyParameter fixed(double v) {
        return CopyParameter{false, v};
    }

    static CopyParameter auto_value() {
        return CopyParameter{true, 0.0};
    }
};

/**
 * @brief Everything needed to start copying one source account
 */
struct CopySessionRequest {
    std::string source_account;
    std::string whale_id;
    CopyParameter leverage{CopyParameter::fixed(1.0)};
    CopyParameter position_size_pct{CopyParameter::fixed(100.0)};
    std::vector<std::string> asset_symbols;  // Empty = every asset
    bool execute{false};                     // false = dry run
    double user_deposit_usd{0.0};            // Capital backing auto sizing

    /**
     * @brief Parameterize a session from a saved backtest run
     * @param position_size_override Takes precedence over the run's percent
     */
    static CopySessionRequest from_run(const backtest::RunRecord& run,
                                       const std::string& source_account, bool execute,
                                       std::optional<double> user_deposit_usd = std::nullopt,
                                       std::optional<double> position_size_override = std::nullopt);
};

/**
 * @brief Read-only snapshot of a session
 */
struct CopySessionStatus {
    std::string session_id;
    std::string source_account;
    bool active{false};
    bool execute{false};
    int processed{0};
    std::vector<std::string> errors;
    std::vector<std::string> notifications;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["sessionId"] = session_id;
        j["sourceAccount"] = source_account;
        j["active"] = active;
        j["execute"] = execute;
        j["processed"] = processed;
        j["errors"] = errors;
        j["notifications"] = notifications;
        return j;
    }
};

/**
 * @brief Live replication of one source account
 *
 * Owned by the session manager through shared_ptr; the loop keeps its own
 * reference while a tick runs. Fields below `mutex` are guarded by it.
 */
struct CopySession {
    std::string id;
    std::string source_account;
    std::string whale_id;
    CopyParameter leverage;
    CopyParameter position_size_pct;
    std::unordered_set<std::string> asset_symbols;
    bool execute{false};
    double user_deposit_usd{0.0};
    Timestamp created_at;

    std::atomic<bool> active{true};

    mutable std::mutex mutex;
    std::optional<Timestamp> cursor;
    std::unordered_set<std::string> ids_at_cursor;  // Provider ids already seen at cursor
    // Remaining signed size per asset the source held before the session started
    std::unordered_map<std::string, double> pre_session_positions;
    std::unordered_map<std::string, double> last_leverage;
    int processed{0};
    std::deque<std::string> errors;
    std::deque<std::string> notifications;
    std::optional<double> source_account_value;

    bool copies_asset(const std::string& asset) const {
        return asset_symbols.empty() || asset_symbols.count(asset) > 0;
    }

    CopySessionStatus status() const {
        std::lock_guard<std::mutex> lock(mutex);
        CopySessionStatus snapshot;
        snapshot.session_id = id;
        snapshot.source_account = source_account;
        snapshot.active = active.load();
        snapshot.execute = execute;
        snapshot.processed = processed;
        snapshot.errors.assign(errors.begin(), errors.end());
        snapshot.notifications.assign(notifications.begin(), notifications.end());
        return snapshot;
    }
};

}  // namespace copy_ngin
