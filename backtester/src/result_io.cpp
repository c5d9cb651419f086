#include "result_io.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <fstream>

namespace backtester {

using json = nlohmann::json;

namespace {

    json finiteOrNull(double value) {
        return std::isfinite(value) ? json(value) : json(nullptr);
    }

    template <typename T>
    json optionalToJson(const std::optional<T>& value) {
        return value ? json(*value) : json(nullptr);
    }

} // end anonymous namespace

json toJson(const BacktestResult& result) {
    const auto& m = result.metrics;
    json metrics = {
        {"total_return_pct", m.total_return_pct},
        {"win_rate", m.win_rate},
        {"num_trades", m.num_trades},
        {"max_drawdown_pct", m.max_drawdown_pct},
        {"final_capital", m.final_capital},
        {"total_pnl", m.total_pnl},
        {"winning_trades", m.winning_trades},
        {"losing_trades", m.losing_trades},
        {"profit_factor", finiteOrNull(m.profit_factor)},
        {"avg_win_pnl", m.avg_win_pnl},
        {"avg_loss_pnl", m.avg_loss_pnl},
    };

    json trades = json::array();
    for (const auto& trade : result.trades) {
        trades.push_back({
            {"entry_date", core::utils::timestampToDateString(trade.entry_time)},
            {"entry_price", trade.entry_price},
            {"exit_date", trade.exit_time ? json(core::utils::timestampToDateString(*trade.exit_time)) : json(nullptr)},
            {"exit_price", optionalToJson(trade.exit_price)},
            {"pnl", optionalToJson(trade.pnl)},
            {"return_pct", optionalToJson(trade.return_pct)},
        });
    }

    return json{{"metrics", metrics}, {"trades", trades}, {"equity_curve", result.equity_curve}};
}

void writeResult(const BacktestResult& result, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        throw core::RuleBacktesterException(fmt::format("Cannot open result file '{}' for writing", path));
    }
    out << toJson(result).dump(2) << '\n';
    if (!out) {
        throw core::RuleBacktesterException(fmt::format("Failed writing result file '{}'", path));
    }
    core::logging::getLogger()->info("Backtest result written to {}", path);
}

} // namespace backtester
