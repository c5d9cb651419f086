#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace core {
namespace config {

    namespace {

        std::string requireString(const json& object, const char* key, const std::string& context) {
            if (!object.contains(key) || !object[key].is_string()) {
                throw ConfigException(fmt::format("{}: '{}' must be a string", context, key));
            }
            return object[key].get<std::string>();
        }

        std::string optionalString(const json& object, const char* key, const std::string& fallback, const std::string& context) {
            if (!object.contains(key)) return fallback;
            return requireString(object, key, context);
        }

        // Integer in [min, max], read without narrowing
        unsigned long long requireBoundedInteger(const json& object, const char* key,
                                                 unsigned long long min, unsigned long long max,
                                                 const std::string& context) {
            const json& value = object[key];
            const bool in_range = value.is_number_integer() &&
                                  (value.is_number_unsigned() || value.get<long long>() >= 0) &&
                                  value.get<unsigned long long>() >= min &&
                                  value.get<unsigned long long>() <= max;
            if (!in_range) {
                throw ConfigException(fmt::format("{}: '{}' must be an integer in [{}, {}]", context, key, min, max));
            }
            return value.get<unsigned long long>();
        }

        DataSource stringToSource(const std::string& source) {
            if (source == "sqlite") return DataSource::Sqlite;
            if (source == "synthetic") return DataSource::Synthetic;
            throw ConfigException(fmt::format("data: unknown source '{}' (expected 'sqlite' or 'synthetic')", source));
        }

        DataConfig parseDataConfig(const json& data) {
            if (!data.is_object()) {
                throw ConfigException("data: must be an object");
            }
            DataConfig result;
            result.source = stringToSource(optionalString(data, "source", "synthetic", "data"));
            result.instrument_key = optionalString(data, "instrument_key", result.instrument_key, "data");
            result.interval = optionalString(data, "interval", result.interval, "data");
            result.start_date = optionalString(data, "start_date", result.start_date, "data");
            result.end_date = optionalString(data, "end_date", result.end_date, "data");

            if (result.source == DataSource::Sqlite) {
                result.database_path = requireString(data, "database_path", "data");
            }

            if (data.contains("num_bars")) {
                result.num_bars = static_cast<int>(
                    requireBoundedInteger(data, "num_bars", 1, std::numeric_limits<int>::max(), "data"));
            }
            if (data.contains("seed")) {
                result.seed = static_cast<unsigned int>(
                    requireBoundedInteger(data, "seed", 0, std::numeric_limits<unsigned int>::max(), "data"));
            }
            return result;
        }

    } // anonymous namespace

    BacktestConfig parseConfig(const json& config) {
        if (!config.is_object()) {
            throw ConfigException("Config must be a JSON object.");
        }

        BacktestConfig result;
        result.strategy_name = optionalString(config, "strategy_name", result.strategy_name, "config");

        const bool has_rules = config.contains("rules");
        const bool has_rules_file = config.contains("rules_file");
        if (has_rules == has_rules_file) {
            throw ConfigException("config: exactly one of 'rules' or 'rules_file' must be given");
        }
        if (has_rules) {
            result.rules = requireString(config, "rules", "config");
        } else {
            result.rules_file = requireString(config, "rules_file", "config");
        }

        if (config.contains("initial_capital")) {
            if (!config["initial_capital"].is_number() || config["initial_capital"].get<double>() <= 0.0) {
                throw ConfigException("config: 'initial_capital' must be a positive number");
            }
            result.initial_capital = config["initial_capital"].get<double>();
        }

        if (config.contains("data")) {
            result.data = parseDataConfig(config["data"]);
        }

        if (config.contains("output_path")) {
            result.output_path = requireString(config, "output_path", "config");
        }
        result.log_level = optionalString(config, "log_level", result.log_level, "config");
        return result;
    }

    BacktestConfig loadConfig(const std::string& path) {
        auto logger = core::logging::getLogger();
        logger->info("Loading backtest config from: {}", path);

        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw ConfigException(fmt::format("Failed to open config file: {}", path));
        }

        json parsed;
        try {
            parsed = json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw ConfigException(fmt::format("Failed to parse config file '{}': {}", path, e.what()));
        }

        BacktestConfig result = parseConfig(parsed);

        if (result.rules_file) {
            std::filesystem::path rules_path(*result.rules_file);
            if (rules_path.is_relative()) {
                rules_path = std::filesystem::path(path).parent_path() / rules_path;
            }
            std::ifstream rules_stream(rules_path);
            if (!rules_stream.is_open()) {
                throw ConfigException(fmt::format("Failed to open rules file: {}", rules_path.string()));
            }
            std::stringstream buffer;
            buffer << rules_stream.rdbuf();
            result.rules = buffer.str();
            logger->debug("Loaded {} bytes of rule text from {}", result.rules.size(), rules_path.string());
        }

        return result;
    }

} // namespace config
} // namespace core
