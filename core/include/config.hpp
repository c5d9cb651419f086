#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace core {
namespace config {

    using json = nlohmann::json;

    enum class DataSource {
        Sqlite,
        Synthetic
    };

    struct DataConfig {
        DataSource source = DataSource::Synthetic;
        std::string database_path;
        std::string instrument_key = "DEMO";
        std::string interval = "day";
        std::string start_date = "2023-01-01"; // YYYY-MM-DD
        std::string end_date;                  // Empty: open-ended
        int num_bars = 250;                    // Synthetic only
        unsigned int seed = 42;                // Synthetic only
    };

    struct BacktestConfig {
        std::string strategy_name = "unnamed_strategy";
        std::string rules;                     // Inline rule text, or loaded from rules_file
        std::optional<std::string> rules_file;
        double initial_capital = 100000.0;
        DataConfig data;
        std::optional<std::string> output_path;
        std::string log_level = "info";
    };

    // Throws ConfigException naming the offending key
    BacktestConfig parseConfig(const json& config);

    // Reads and parses a JSON file; relative rules_file paths resolve against the config's directory
    BacktestConfig loadConfig(const std::string& path);

} // namespace config
} // namespace core
