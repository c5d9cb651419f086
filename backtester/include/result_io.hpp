#pragma once

#include "backtester.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace backtester {

    // {"metrics": {...}, "trades": [{entry_date, entry_price, exit_date, exit_price, pnl, return_pct}], "equity_curve": [...]}
    // Dates are YYYY-MM-DD; an infinite profit factor is written as null.
    nlohmann::json toJson(const BacktestResult& result);

    // Writes toJson(result) to path, pretty-printed. Throws core::RuleBacktesterException on I/O failure.
    void writeResult(const BacktestResult& result, const std::string& path);

} // namespace backtester
