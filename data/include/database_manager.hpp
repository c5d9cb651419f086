#pragma once

#include <optional>
#include <string>
#include <vector>

#include <sqlite3.h> // Standard C header

#include "bar_series.hpp"
#include "datatypes.hpp"

namespace data {

// SQLite store for historical OHLCV bars, keyed by (instrument_key, interval, timestamp).
// Timestamps are stored as ISO-8601 UTC text so range filters compare as text.
class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    // Owns a raw sqlite3 handle: neither copyable nor movable
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    // Creates historical_bars (and its index) if missing
    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    // Inserts every bar in one transaction, ignoring rows whose key already exists.
    // Returns the number of new rows. Throws core::DataLoadException on failure.
    int saveBars(const core::BarSeries& bars,
                 const std::string& instrument_key,
                 const std::string& interval);

    // Bars in [start_time, end_time] ordered by timestamp; no end bound when end_time is empty.
    // Only the price/volume columns present in the table are read, so a missing column
    // yields a series without that field. Throws core::DataLoadException on failure.
    core::BarSeries queryBars(const std::string& instrument_key,
                              const std::string& interval,
                              core::Timestamp start_time,
                              std::optional<core::Timestamp> end_time = std::nullopt);

    // Column names of a table, in declaration order (PRAGMA table_info)
    std::vector<std::string> tableColumns(const std::string& table);

private:
    std::string database_path_;
    sqlite3* db_ = nullptr; // SQLite database connection handle
    bool connected_ = false;
};

} // namespace data
