#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp" // For timestampToString/stringToTimestamp
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <limits>
#include <memory>
#include <stdexcept>

namespace data
{

    namespace
    {
        const char* kBarsTable = "historical_bars";

        struct StatementFinalizer
        {
            void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
        };
        using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

        StatementPtr prepare(sqlite3* db, const std::string& sql)
        {
            sqlite3_stmt* stmt = nullptr;
            int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
            StatementPtr guard(stmt);
            if (rc != SQLITE_OK)
            {
                throw core::DataLoadException(
                    fmt::format("Failed to prepare SQL statement [{}]: {}", rc, sqlite3_errmsg(db)));
            }
            return guard;
        }
    } // end anonymous namespace

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect();
    }

    bool DatabaseManager::connect()
    {
        if (connected_)
        {
            core::logging::getLogger()->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        core::logging::getLogger()->info("Connecting to SQLite database: {}", database_path_);

        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Cannot open SQLite database '{}': {}", database_path_,
                                              db_ ? sqlite3_errmsg(db_) : "out of memory");
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (!connected_)
        {
            return;
        }

        core::logging::getLogger()->debug("Disconnecting from SQLite database: {}", database_path_);
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK)
        {
            // Unfinalized statements keep the handle open
            core::logging::getLogger()->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        core::logging::getLogger()->trace("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : sqlite3_errstr(rc));
            sqlite3_free(error_msg); // Must free error message memory
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        core::logging::getLogger()->debug("Initializing SQLite database schema if needed...");

        const std::string create_bars_sql = R"(
        CREATE TABLE IF NOT EXISTS historical_bars (
            instrument_key TEXT,
            interval TEXT,
            timestamp TEXT, -- ISO-8601 UTC, e.g. 2024-01-02T00:00:00Z
            open REAL,
            high REAL,
            low REAL,
            close REAL,
            volume REAL,
            PRIMARY KEY (instrument_key, interval, timestamp)
        );
    )";
        const std::string create_bars_index_sql = R"(
        CREATE INDEX IF NOT EXISTS idx_bars_timestamp
        ON historical_bars (instrument_key, interval, timestamp);
     )";

        bool success = executeSQL(create_bars_sql) && executeSQL(create_bars_index_sql);
        if (!success)
        {
            core::logging::getLogger()->error("SQLite database schema initialization failed.");
        }
        return success;
    }

    std::vector<std::string> DatabaseManager::tableColumns(const std::string& table)
    {
        if (!isConnected())
        {
            throw core::DataLoadException("Cannot inspect table: Not connected to database.");
        }

        auto stmt = prepare(db_, fmt::format("PRAGMA table_info({});", table));
        std::vector<std::string> columns;
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        {
            const unsigned char* name = sqlite3_column_text(stmt.get(), 1);
            if (name)
            {
                columns.emplace_back(reinterpret_cast<const char*>(name));
            }
        }
        if (rc != SQLITE_DONE)
        {
            throw core::DataLoadException(
                fmt::format("Failed reading columns of '{}' [{}]: {}", table, rc, sqlite3_errmsg(db_)));
        }
        return columns;
    }

    core::BarSeries DatabaseManager::queryBars(
        const std::string& instrument_key,
        const std::string& interval,
        core::Timestamp start_time,
        std::optional<core::Timestamp> end_time)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected()) {
            throw core::DataLoadException("Cannot query bars: Not connected to database.");
        }

        const auto columns = tableColumns(kBarsTable);
        if (columns.empty()) {
            throw core::DataLoadException(fmt::format("Table '{}' does not exist", kBarsTable));
        }
        if (std::find(columns.begin(), columns.end(), "timestamp") == columns.end()) {
            throw core::DataLoadException(fmt::format("Table '{}' has no timestamp column", kBarsTable));
        }

        // Read only the fields the table actually carries
        std::vector<std::string> fields;
        for (const auto& name : core::requiredFields()) {
            if (std::find(columns.begin(), columns.end(), name) != columns.end()) {
                fields.push_back(name);
            } else {
                logger->warn("Table '{}' has no '{}' column; bars will lack that field", kBarsTable, name);
            }
        }

        std::string select = "SELECT timestamp";
        for (const auto& name : fields) {
            select += ", " + name;
        }
        select += fmt::format(" FROM {} WHERE instrument_key = ? AND interval = ? AND timestamp >= ?", kBarsTable);
        if (end_time) {
            select += " AND timestamp <= ?";
        }
        select += " ORDER BY timestamp ASC;";

        const std::string start_str = core::utils::timestampToString(start_time);
        const std::string end_str = end_time ? core::utils::timestampToString(*end_time) : std::string();
        logger->debug("Querying bars for {} ({}) from '{}' to '{}'", instrument_key, interval, start_str,
                      end_time ? end_str : std::string("end"));

        auto stmt = prepare(db_, select);
        sqlite3_bind_text(stmt.get(), 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 2, interval.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 3, start_str.c_str(), -1, SQLITE_TRANSIENT);
        if (end_time) {
            sqlite3_bind_text(stmt.get(), 4, end_str.c_str(), -1, SQLITE_TRANSIENT);
        }

        std::vector<core::Timestamp> timestamps;
        std::vector<std::vector<double>> values(fields.size());
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            const unsigned char *ts_text = sqlite3_column_text(stmt.get(), 0);
            if (!ts_text) {
                throw core::DataLoadException(
                    fmt::format("NULL timestamp in '{}' for {} ({})", kBarsTable, instrument_key, interval));
            }
            try {
                timestamps.push_back(core::utils::stringToTimestamp(reinterpret_cast<const char*>(ts_text)));
            } catch (const std::invalid_argument& e) {
                throw core::DataLoadException(fmt::format("Bad timestamp in '{}': {}", kBarsTable, e.what()));
            }

            for (std::size_t k = 0; k < fields.size(); ++k) {
                int column = static_cast<int>(k) + 1;
                values[k].push_back(sqlite3_column_type(stmt.get(), column) == SQLITE_NULL
                                        ? std::numeric_limits<double>::quiet_NaN()
                                        : sqlite3_column_double(stmt.get(), column));
            }
        }

        if (rc != SQLITE_DONE) {
            throw core::DataLoadException(
                fmt::format("Error stepping through query results [{}]: {}", rc, sqlite3_errmsg(db_)));
        }

        core::BarSeries bars(std::move(timestamps));
        for (std::size_t k = 0; k < fields.size(); ++k) {
            bars.setField(fields[k], std::move(values[k]));
        }
        logger->debug("Loaded {} bars for {} ({})", bars.size(), instrument_key, interval);
        return bars;
    }

    int DatabaseManager::saveBars(const core::BarSeries& bars,
                                  const std::string& instrument_key,
                                  const std::string& interval)
    {
        if (!isConnected())
        {
            throw core::DataLoadException("Cannot save bars: Not connected to database.");
        }
        if (bars.empty())
        {
            return 0;
        }
        for (const auto& name : core::requiredFields())
        {
            if (!bars.hasField(name))
            {
                throw core::DataLoadException(fmt::format("Cannot save bars without a '{}' field", name));
            }
        }

        const std::string sql = fmt::format(R"(
INSERT OR IGNORE INTO {}
(instrument_key, interval, timestamp, open, high, low, close, volume)
VALUES (?, ?, ?, ?, ?, ?, ?, ?);
)", kBarsTable);

        auto stmt = prepare(db_, sql);

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            throw core::DataLoadException("Failed to begin transaction for saving bars.");
        }

        const auto& timestamps = bars.timestamps();
        const auto& open = bars.field("open");
        const auto& high = bars.field("high");
        const auto& low = bars.field("low");
        const auto& close = bars.field("close");
        const auto& volume = bars.field("volume");

        int saved_count = 0;
        std::string error;
        for (std::size_t i = 0; i < bars.size(); ++i)
        {
            std::string timestamp_str = core::utils::timestampToString(timestamps[i]);
            sqlite3_bind_text(stmt.get(), 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 2, interval.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 3, timestamp_str.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt.get(), 4, open[i]);
            sqlite3_bind_double(stmt.get(), 5, high[i]);
            sqlite3_bind_double(stmt.get(), 6, low[i]);
            sqlite3_bind_double(stmt.get(), 7, close[i]);
            sqlite3_bind_double(stmt.get(), 8, volume[i]);

            int rc = sqlite3_step(stmt.get());
            if (rc != SQLITE_DONE)
            {
                error = fmt::format("Failed to insert bar {} [{}]: {}", i, rc, sqlite3_errmsg(db_));
                break;
            }
            if (sqlite3_changes(db_) > 0)
            {
                saved_count++;
            }
            sqlite3_reset(stmt.get());
        }

        stmt.reset(); // Finalize before COMMIT/ROLLBACK

        if (!error.empty())
        {
            if (!executeSQL("ROLLBACK;"))
            {
                core::logging::getLogger()->error("ROLLBACK failed after insert error for {} ({}).", instrument_key, interval);
            }
            throw core::DataLoadException(error);
        }
        if (!executeSQL("COMMIT;"))
        {
            if (!executeSQL("ROLLBACK;"))
            {
                core::logging::getLogger()->error("ROLLBACK failed after COMMIT error for {} ({}).", instrument_key, interval);
            }
            throw core::DataLoadException("Failed to COMMIT transaction for saving bars.");
        }

        core::logging::getLogger()->info("Saved {} new bars (duplicates ignored) for {} ({}).", saved_count, instrument_key, interval);
        return saved_count;
    }

} // namespace data
