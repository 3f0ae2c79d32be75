// src/live/copy_session.cpp
#include "copy_ngin/live/copy_session.hpp"

namespace copy_ngin {

CopySessionRequest CopySessionRequest::from_run(const backtest::RunRecord& run,
                                                const std::string& source_account, bool execute,
                                                std::optional<double> user_deposit_usd,
                                                std::optional<double> position_size_override) {
    CopySessionRequest request;
    request.source_account = source_account;
    request.whale_id = run.whale_id;
    request.leverage = CopyParameter::fixed(run.leverage);
    request.position_size_pct =
        CopyParameter::fixed(position_size_override.value_or(run.position_size_pct));
    request.asset_symbols = run.asset_symbols;
    request.execute = execute;
    request.user_deposit_usd = user_deposit_usd.value_or(run.initial_deposit_usd);
    return request;
}

}  // namespace copy_ngin
