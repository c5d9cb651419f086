// cli/src/main.cpp

// Standard includes
#include <iostream>
#include <string>
#include <exception>
#include <memory>
#include <optional>
#include <chrono>

// Project includes
#include "logging.hpp"          // For logging functionality
#include "exceptions.hpp"       // For custom exception types
#include "config.hpp"           // JSON run configuration
#include "utils.hpp"            // For date helpers
#include "bar_series.hpp"
#include "database_manager.hpp" // SQLite bar store
#include "sample_data.hpp"      // Synthetic bars
#include "parser.hpp"           // rule_engine::compile
#include "signal_evaluator.hpp"
#include "backtester.hpp"
#include "result_io.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>

namespace {

    core::BarSeries loadBars(const core::config::DataConfig& data_config) {
        auto logger = core::logging::getLogger();

        if (data_config.source == core::config::DataSource::Synthetic) {
            logger->info("Generating {} synthetic bars from {} (seed {})",
                         data_config.num_bars, data_config.start_date, data_config.seed);
            return data::generateSampleBars(data_config.num_bars, data_config.start_date, data_config.seed);
        }

        logger->info("Using SQLite database path: {}", data_config.database_path);
        data::DatabaseManager db_manager(data_config.database_path);
        if (!db_manager.connect()) {
            throw core::DataLoadException("Failed to connect to database: " + data_config.database_path);
        }

        core::Timestamp start = core::utils::dateToTimestamp(data_config.start_date);
        std::optional<core::Timestamp> end;
        if (!data_config.end_date.empty()) {
            // Inclusive end date: every bar stamped on that day
            end = core::utils::dateToTimestamp(data_config.end_date) + std::chrono::hours(24) - std::chrono::seconds(1);
        }
        return db_manager.queryBars(data_config.instrument_key, data_config.interval, start, end);
    }

    void logTrades(const backtester::BacktestResult& result) {
        auto logger = core::logging::getLogger();
        logger->info("--- Trade Ledger ({} trades) ---", result.trades.size());
        for (std::size_t i = 0; i < result.trades.size(); ++i) {
            const auto& trade = result.trades[i];
            logger->info("#{:<3} {} @ {:.2f} -> {} @ {:.2f}  PnL={:.2f} ({:.2f}%)",
                         i + 1,
                         core::utils::timestampToDateString(trade.entry_time), trade.entry_price,
                         core::utils::timestampToDateString(trade.exit_time.value_or(trade.entry_time)),
                         trade.exit_price.value_or(0.0), trade.pnl.value_or(0.0), trade.return_pct.value_or(0.0));
        }
    }

} // end anonymous namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [config.json]" << std::endl;
        return 1;
    }
    const std::string config_path = (argc == 2) ? argv[1] : "config/backtest.json";

    try {
        // --- Initialize Logging ---
        core::logging::initialize("rule_backtester_cli", spdlog::level::info, spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("Rule Backtester CLI starting...");

        // --- Configuration ---
        logger->info("Loading configuration from {}", config_path);
        core::config::BacktestConfig config = core::config::loadConfig(config_path);
        logger->set_level(core::logging::level_from_string(config.log_level));
        logger->info("Strategy '{}': initial capital {:.2f}", config.strategy_name, config.initial_capital);

        // --- Data ---
        core::BarSeries bars = loadBars(config.data);
        logger->info("Loaded {} bars", bars.size());

        // --- Rules ---
        rule_engine::Strategy strategy = rule_engine::compile(config.rules);
        logger->info("Compiled rules:\n{}", rule_engine::describe(strategy));
        logger->debug("AST: {}", rule_engine::toJson(strategy).dump(2));

        // --- Signals ---
        rule_engine::SignalEvaluator evaluator;
        rule_engine::SignalSeries signals = evaluator.evaluate(bars, strategy);
        logger->info("Signals: {} entry, {} exit", signals.entryCount(), signals.exitCount());

        // --- Backtest ---
        backtester::Backtester the_backtester(config.initial_capital);
        backtester::BacktestResult result = the_backtester.run(bars, signals);
        result.metrics.logMetrics();
        logTrades(result);

        if (config.output_path) {
            backtester::writeResult(result, *config.output_path);
        }

        logger->info("Rule Backtester CLI finished.");

    // --- Exception Handling ---
    } catch (const core::ConfigException& ex) {
        std::cerr << "Configuration Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Configuration Error: {}", ex.what());
        return 1;
    } catch (const core::LexException& ex) {
        std::cerr << "Rule Lex Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Rule Lex Error: {} (lexeme '{}', offset {})", ex.what(), ex.lexeme(), ex.offset());
        return 1;
    } catch (const core::ParseException& ex) {
        std::cerr << "Rule Parse Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Rule Parse Error: {} (expected {}, found {})", ex.what(), ex.expected(), ex.found());
        return 1;
    } catch (const core::EvaluationException& ex) {
        std::cerr << "Evaluation Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Evaluation Error: {}", ex.what());
        return 1;
    } catch (const core::DataException& ex) {
        std::cerr << "Data Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Data Error: {}", ex.what());
        return 1;
    } catch (const core::DataLoadException& ex) {
        std::cerr << "Data Load Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Data Load Error: {}", ex.what());
        return 1;
    } catch (const core::RuleBacktesterException& ex) {
        std::cerr << "Backtester Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Backtester Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    } catch (...) {
        std::cerr << "Unknown Error occurred." << std::endl;
        if (logger) logger->critical("Unknown Error occurred.");
        return 1;
    }

    spdlog::shutdown();
    return 0;
}
