// src/live/copy_session_manager.cpp
#include "copy_ngin/live/copy_session_manager.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include "copy_ngin/core/logger.hpp"
#include "copy_ngin/core/time_utils.hpp"
#include "copy_ngin/data/trade_classifier.hpp"

namespace copy_ngin {

namespace {

constexpr double MIN_LEVERAGE = 0.1;
constexpr double MAX_LEVERAGE = 100.0;
constexpr double MAX_POSITION_PCT = 200.0;
constexpr double SIZE_EPSILON = 1e-12;
const char* const INFO_ENDPOINT_KEY = "info";

double clamp(double value, double lo, double hi) {
    if (!std::isfinite(value)) {
        return lo;
    }
    return std::max(lo, std::min(value, hi));
}

// Provider id, or a composite key for providers that omit one
std::string fill_key(const Fill& fill) {
    if (!fill.provider_id.empty()) {
        return fill.provider_id;
    }
    std::ostringstream ss;
    ss << fill.asset << "|" << core::to_epoch_ms(fill.time) << "|" << fill.size << "|"
       << fill.price << "|" << direction_to_string(fill.direction);
    return ss.str();
}

void push_bounded(std::deque<std::string>& messages, const std::string& message, size_t limit) {
    messages.push_back(message);
    while (limit > 0 && messages.size() > limit) {
        messages.pop_front();
    }
}

}  // namespace

CopySessionManager::CopySessionManager(std::shared_ptr<ExchangeInfoClient> info_client,
                                       std::shared_ptr<TradingClient> trading_client,
                                       CopierConfig config)
    : info_client_(std::move(info_client)),
      trading_client_(std::move(trading_client)),
      config_(std::move(config)),
      order_builder_(config_.slippage_pct),
      info_throttle_(std::chrono::milliseconds(config_.info_min_interval_ms)),
      leverage_throttle_(std::chrono::milliseconds(config_.leverage_throttle_ms)),
      backoff_(std::chrono::milliseconds(config_.backoff_base_ms),
               std::chrono::milliseconds(config_.backoff_max_ms)) {
    if (!info_client_) {
        throw std::invalid_argument("CopySessionManager requires an exchange info client");
    }
    if (!trading_client_) {
        throw std::invalid_argument("CopySessionManager requires a trading client");
    }
    auto valid = config_.validate();
    if (valid.is_error()) {
        throw std::invalid_argument(valid.error()->what());
    }
}

CopySessionManager::~CopySessionManager() {
    auto stopped = stop();
    if (stopped.is_error()) {
        WARN("Error stopping copy session manager: " << stopped.error()->to_string());
    }
    if (initialized_.load()) {
        auto removed = StateManager::instance().unregister_component(instance_id_);
        if (removed.is_error()) {
            DEBUG("Component " << instance_id_ << " already unregistered");
        }
    }
}

Result<void> CopySessionManager::initialize() {
    if (initialized_.load()) {
        return Result<void>();
    }
    if (instance_id_.empty()) {
        instance_id_ = generate_instance_id();
    }

    ComponentInfo info{ComponentType::COPY_SESSION_MANAGER,
                       ComponentState::INITIALIZED,
                       instance_id_,
                       "",
                       std::chrono::system_clock::now(),
                       {{"active_sessions", 0.0}, {"processed_fills", 0.0}}};

    auto register_result = StateManager::instance().register_component(info);
    if (register_result.is_error()) {
        return register_result;
    }

    initialized_.store(true);
    INFO("Copy session manager " << instance_id_ << " initialized");
    return Result<void>();
}

Result<void> CopySessionManager::start() {
    if (!initialized_.load()) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED,
                                "Copy session manager not initialized", "CopySessionManager");
    }
    if (running_.exchange(true)) {
        return Result<void>();
    }

    auto state_result = StateManager::instance().update_state(instance_id_, ComponentState::RUNNING);
    if (state_result.is_error()) {
        running_.store(false);
        return state_result;
    }

    loop_thread_ = std::thread(&CopySessionManager::run_loop, this);
    INFO("Copy loop started, polling every " << config_.poll_interval_ms << "ms");
    return Result<void>();
}

Result<void> CopySessionManager::stop() {
    if (!running_.exchange(false)) {
        return Result<void>();
    }

    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        loop_cv_.notify_all();
    }
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }

    INFO("Copy loop stopped");
    if (initialized_.load()) {
        return StateManager::instance().update_state(instance_id_, ComponentState::STOPPED);
    }
    return Result<void>();
}

void CopySessionManager::run_loop() {
    Logger::register_component("CopySessionManager");
    while (running_.load()) {
        tick();

        std::unique_lock<std::mutex> lock(loop_mutex_);
        loop_cv_.wait_for(lock, std::chrono::milliseconds(config_.poll_interval_ms),
                          [this] { return !running_.load(); });
    }
}

std::string CopySessionManager::generate_session_id() const {
    static std::atomic<uint64_t> counter{0};
    return "copy_" + std::to_string(core::to_epoch_ms(std::chrono::system_clock::now())) + "_" +
           std::to_string(++counter);
}

Result<std::string> CopySessionManager::create_session(const CopySessionRequest& request) {
    if (request.source_account.empty()) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT,
                                       "Source account must not be empty", "CopySessionManager");
    }
    if (!std::isfinite(request.user_deposit_usd) || request.user_deposit_usd < 0.0) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT,
                                       "User deposit must be non-negative", "CopySessionManager");
    }

    auto session = std::make_shared<CopySession>();
    session->id = generate_session_id();
    session->source_account = request.source_account;
    session->whale_id = request.whale_id;
    session->leverage = request.leverage;
    if (!session->leverage.automatic) {
        session->leverage.value = clamp(session->leverage.value, MIN_LEVERAGE, MAX_LEVERAGE);
    }
    session->position_size_pct = request.position_size_pct;
    if (!session->position_size_pct.automatic) {
        session->position_size_pct.value =
            clamp(session->position_size_pct.value, 0.0, MAX_POSITION_PCT);
    }
    for (const auto& symbol : request.asset_symbols) {
        session->asset_symbols.insert(normalize_symbol(symbol));
    }
    session->execute = request.execute;
    session->user_deposit_usd = request.user_deposit_usd;
    session->created_at = std::chrono::system_clock::now();

    // Seed the cursor so history is never replayed
    auto fills = fetch_fills(session->source_account, std::nullopt);
    if (fills.is_ok()) {
        const auto& history = fills.value();
        std::optional<Timestamp> latest;
        for (const auto& fill : history) {
            if (!latest.has_value() || fill.time > *latest) {
                latest = fill.time;
            }
        }
        if (latest.has_value()) {
            session->cursor = latest;
            for (const auto& fill : history) {
                if (fill.time == *latest) {
                    session->ids_at_cursor.insert(fill_key(fill));
                }
            }
            add_notification(*session, "Skipping historical fills up to " +
                                           core::format_timestamp_utc(*latest));
        }
    } else {
        // Without the history, fills older than the session itself are never copied
        session->cursor = session->created_at;
        add_error(*session, std::string("Failed to seed cursor: ") + fills.error()->what());
    }

    // Snapshot exposure the source held before the session started
    auto state = account_state(session->source_account, false);
    if (state.is_ok()) {
        const auto& account = state.value();
        session->source_account_value = account.account_value_usd;
        std::vector<std::string> held;
        for (const auto& position : account.open_positions) {
            if (std::abs(position.signed_size) <= SIZE_EPSILON) {
                continue;
            }
            const std::string asset = normalize_symbol(position.asset);
            session->pre_session_positions[asset] += position.signed_size;
            held.push_back(asset);
        }
        if (!held.empty()) {
            std::sort(held.begin(), held.end());
            held.erase(std::unique(held.begin(), held.end()), held.end());
            std::string names;
            for (const auto& asset : held) {
                names += (names.empty() ? "" : ", ") + asset;
            }
            add_notification(*session, "Detected pre-session open positions: " + names);
        }
    } else {
        add_error(*session,
                  std::string("Failed to snapshot open positions: ") + state.error()->what());
    }

    const std::string id = session->id;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_[id] = session;
    }

    INFO("Created copy session " << id << " for " << request.source_account << " ("
                                 << (request.execute ? "execute" : "dry-run") << ")");
    publish_metrics();
    return id;
}

Result<void> CopySessionManager::stop_session(const std::string& session_id) {
    std::shared_ptr<CopySession> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return make_error<void>(ErrorCode::SESSION_NOT_FOUND,
                                    "Unknown copy session: " + session_id, "CopySessionManager");
        }
        session = it->second;
    }

    session->active.store(false);
    INFO("Stopped copy session " << session_id);
    publish_metrics();
    return Result<void>();
}

Result<CopySessionStatus> CopySessionManager::get_status(const std::string& session_id) const {
    std::shared_ptr<CopySession> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return make_error<CopySessionStatus>(ErrorCode::SESSION_NOT_FOUND,
                                                 "Unknown copy session: " + session_id,
                                                 "CopySessionManager");
        }
        session = it->second;
    }
    return session->status();
}

std::vector<CopySessionStatus> CopySessionManager::list_sessions() const {
    std::vector<std::shared_ptr<CopySession>> snapshot;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& [id, session] : sessions_) {
            snapshot.push_back(session);
        }
    }

    std::vector<CopySessionStatus> statuses;
    statuses.reserve(snapshot.size());
    for (const auto& session : snapshot) {
        statuses.push_back(session->status());
    }
    std::sort(statuses.begin(), statuses.end(),
              [](const CopySessionStatus& a, const CopySessionStatus& b) {
                  return a.session_id < b.session_id;
              });
    return statuses;
}

size_t CopySessionManager::active_session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return static_cast<size_t>(
        std::count_if(sessions_.begin(), sessions_.end(),
                      [](const auto& entry) { return entry.second->active.load(); }));
}

void CopySessionManager::tick() {
    std::vector<std::shared_ptr<CopySession>> active;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& [id, session] : sessions_) {
            if (session->active.load()) {
                active.push_back(session);
            }
        }
    }

    for (const auto& session : active) {
        try {
            process_session(*session);
        } catch (const std::exception& e) {
            ERROR("Unexpected error in copy session " << session->id << ": " << e.what());
            add_error(*session, std::string("Unexpected error: ") + e.what());
        }
    }

    publish_metrics();
}

void CopySessionManager::process_session(CopySession& session) {
    if (!session.active.load()) {
        return;
    }
    if (backoff_.is_backing_off(session.source_account)) {
        DEBUG("Skipping " << session.source_account << " for another "
                          << backoff_.remaining(session.source_account).count() << "ms");
        return;
    }

    std::optional<Timestamp> since;
    {
        std::lock_guard<std::mutex> lock(session.mutex);
        since = session.cursor;
    }

    auto fills = fetch_fills(session.source_account, since);
    if (fills.is_error()) {
        add_error(session, std::string("Failed to fetch fills: ") + fills.error()->what());
        return;
    }

    std::vector<Fill> batch = fills.value();
    std::stable_sort(batch.begin(), batch.end(),
                     [](const Fill& a, const Fill& b) { return a.time < b.time; });

    for (const auto& fill : batch) {
        if (!session.active.load()) {
            break;
        }
        process_fill(session, fill);
    }
}

void CopySessionManager::process_fill(CopySession& session, const Fill& fill) {
    const std::string key = fill_key(fill);
    {
        std::lock_guard<std::mutex> lock(session.mutex);
        if (session.cursor.has_value()) {
            if (fill.time < *session.cursor) {
                return;
            }
            if (fill.time == *session.cursor && session.ids_at_cursor.count(key) > 0) {
                return;
            }
        }
        if (!session.cursor.has_value() || fill.time > *session.cursor) {
            session.cursor = fill.time;
            session.ids_at_cursor.clear();
        }
        session.ids_at_cursor.insert(key);
    }

    const std::string asset = normalize_symbol(fill.asset);
    if (!session.copies_asset(asset)) {
        DEBUG("Session " << session.id << " ignores " << asset);
        return;
    }

    const TradeDirection direction = fill.direction;
    const Side side = order_side(direction);
    if (side == Side::NONE) {
        return;
    }

    // A fill on the opposite side of a pre-session position unwinds it
    bool suppressed = false;
    {
        std::lock_guard<std::mutex> lock(session.mutex);
        auto it = session.pre_session_positions.find(asset);
        if (it != session.pre_session_positions.end()) {
            const double remembered = it->second;
            const double signed_size =
                side == Side::BUY ? std::abs(fill.size) : -std::abs(fill.size);
            if ((remembered > 0.0 && signed_size < 0.0) ||
                (remembered < 0.0 && signed_size > 0.0)) {
                const double remaining = remembered + signed_size;
                const bool crossed = (remaining > 0.0) != (remembered > 0.0);
                if (crossed || std::abs(remaining) <= SIZE_EPSILON) {
                    session.pre_session_positions.erase(it);
                } else {
                    it->second = remaining;
                }
                session.processed++;
                suppressed = true;
            }
        }
    }
    if (suppressed) {
        processed_fills_++;
        add_notification(session, "Ignored close for pre-session position " + asset);
        return;
    }

    // Auto parameters read the source account's value through the cache
    double account_value = 0.0;
    if (session.position_size_pct.automatic || session.leverage.automatic) {
        auto state = account_state(session.source_account);
        std::lock_guard<std::mutex> lock(session.mutex);
        if (state.is_ok()) {
            session.source_account_value = state.value().account_value_usd;
        } else {
            push_bounded(session.errors,
                         std::string("Failed to fetch account state: ") + state.error()->what(),
                         config_.max_messages);
        }
        account_value = session.source_account_value.value_or(0.0);
    }

    double position_pct = session.position_size_pct.value;
    if (session.position_size_pct.automatic) {
        position_pct = account_value > 0.0 ? session.user_deposit_usd / account_value * 100.0 : 0.0;
    }
    position_pct = clamp(position_pct, 0.0, MAX_POSITION_PCT);

    double leverage = session.leverage.value;
    if (session.leverage.automatic) {
        const double notional = std::abs(fill.size) * fill.price;
        leverage = account_value > 0.0 ? notional / account_value : 1.0;
    }
    leverage = clamp(leverage, MIN_LEVERAGE, MAX_LEVERAGE);

    const Quantity size = std::abs(fill.size) * position_pct / 100.0;
    if (!(size > 0.0)) {
        DEBUG("Session " << session.id << " skips " << asset << ": scaled size is zero");
        return;
    }

    if (session.execute) {
        maybe_update_leverage(session, asset, leverage);
    }

    auto sizing = asset_sizing(asset);
    if (sizing.is_error()) {
        add_error(session, "Failed to resolve sizing for " + asset + ": " +
                               sizing.error()->what());
        return;
    }

    auto order = order_builder_.build(asset, side, size, fill.price, sizing.value(),
                                      is_close(direction), session.id);
    if (order.is_error()) {
        DEBUG("Session " << session.id << " skips " << asset << ": " << order.error()->to_string());
        return;
    }
    const CopyOrder& copy = order.value();

    if (session.execute) {
        auto submitted = trading_client_->submit_order(copy);
        if (submitted.is_error()) {
            WARN("Order for session " << session.id << " failed: " << submitted.error()->to_string());
            add_error(session, std::string("Order submission failed: ") +
                                   submitted.error()->what());
            return;
        }
        INFO("Session " << session.id << " sent " << side_to_string(copy.side) << " "
                        << copy.size << " " << copy.asset << " @ " << copy.limit_price);
    } else {
        std::ostringstream ss;
        ss << "dry-run " << side_to_string(copy.side) << " " << std::fixed
           << std::setprecision(4) << copy.size << " " << copy.asset << " @ "
           << std::defaultfloat << std::setprecision(10) << copy.limit_price;
        add_notification(session, ss.str());
    }

    {
        std::lock_guard<std::mutex> lock(session.mutex);
        session.processed++;
    }
    processed_fills_++;
}

void CopySessionManager::maybe_update_leverage(CopySession& session, const std::string& asset,
                                               double leverage) {
    {
        std::lock_guard<std::mutex> lock(session.mutex);
        auto it = session.last_leverage.find(asset);
        if (it != session.last_leverage.end() && std::abs(it->second - leverage) < 1e-9) {
            return;
        }
    }

    const std::string key = session.id + ":" + asset;
    if (!leverage_throttle_.can_run(key)) {
        DEBUG("Leverage update for " << key << " throttled");
        return;
    }
    leverage_throttle_.touch(key);

    auto updated = trading_client_->update_leverage(asset, leverage, config_.is_cross);
    if (updated.is_error()) {
        WARN("Leverage update for " << key << " failed: " << updated.error()->to_string());
        add_error(session, std::string("leverage error (ignored): ") + updated.error()->what());
        return;
    }

    std::lock_guard<std::mutex> lock(session.mutex);
    session.last_leverage[asset] = leverage;
}

Result<std::vector<Fill>> CopySessionManager::fetch_fills(const std::string& account,
                                                          const std::optional<Timestamp>& since) {
    if (backoff_.is_backing_off(account)) {
        return make_error<std::vector<Fill>>(ErrorCode::RATE_LIMITED,
                                             "Backing off " + account, "CopySessionManager");
    }

    info_throttle_.wait_and_touch(INFO_ENDPOINT_KEY);
    auto fills = info_client_->fetch_fills(account, since);
    if (fills.is_error()) {
        backoff_.record_failure(account);
        return fills;
    }
    backoff_.record_success(account);
    return fills;
}

Result<AccountState> CopySessionManager::account_state(const std::string& account,
                                                       bool allow_cached) {
    if (allow_cached) {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = account_cache_.find(account);
        if (it != account_cache_.end() &&
            std::chrono::steady_clock::now() - it->second.fetched_at <
                std::chrono::milliseconds(config_.account_cache_ttl_ms)) {
            return AccountState(it->second.state);
        }
    }

    if (backoff_.is_backing_off(account)) {
        return make_error<AccountState>(ErrorCode::RATE_LIMITED, "Backing off " + account,
                                        "CopySessionManager");
    }

    info_throttle_.wait_and_touch(INFO_ENDPOINT_KEY);
    auto state = info_client_->fetch_account_state(account);
    if (state.is_error()) {
        backoff_.record_failure(account);
        return state;
    }
    backoff_.record_success(account);

    std::lock_guard<std::mutex> lock(cache_mutex_);
    account_cache_[account] = CachedAccountState{state.value(), std::chrono::steady_clock::now()};
    return state;
}

Result<AssetSizing> CopySessionManager::asset_sizing(const std::string& asset) {
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = sizing_cache_.find(asset);
        if (it != sizing_cache_.end()) {
            return AssetSizing(it->second);
        }
    }

    info_throttle_.wait_and_touch(INFO_ENDPOINT_KEY);
    auto sizing = info_client_->resolve_asset_sizing(asset);
    if (sizing.is_error()) {
        return sizing;
    }

    std::lock_guard<std::mutex> lock(cache_mutex_);
    sizing_cache_[asset] = sizing.value();
    return sizing;
}

void CopySessionManager::add_error(CopySession& session, const std::string& message) const {
    std::lock_guard<std::mutex> lock(session.mutex);
    push_bounded(session.errors, message, config_.max_messages);
}

void CopySessionManager::add_notification(CopySession& session, const std::string& message) const {
    std::lock_guard<std::mutex> lock(session.mutex);
    push_bounded(session.notifications, message, config_.max_messages);
}

void CopySessionManager::publish_metrics() {
    if (!initialized_.load()) {
        return;
    }
    auto result = StateManager::instance().update_metrics(
        instance_id_, {{"active_sessions", static_cast<double>(active_session_count())},
                       {"processed_fills", static_cast<double>(processed_fills_.load())}});
    if (result.is_error()) {
        DEBUG("Could not publish metrics: " << result.error()->to_string());
    }
}

}  // namespace copy_ngin
