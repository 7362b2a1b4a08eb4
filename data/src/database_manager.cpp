#include "database_manager.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <exception>

namespace data
{

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
        auto logger = core::logging::getLogger();
        if (connected_)
        {
            logger->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        logger->info("Connecting to SQLite database: {}", database_path_);

        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);

        if (rc != SQLITE_OK)
        {
            logger->error("Cannot open SQLite database '{}': {}", database_path_,
                          db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
            sqlite3_close(db_); // Handle must be released even when open fails
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        logger->info("Successfully connected to SQLite database: {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (!connected_)
        {
            return;
        }
        core::logging::getLogger()->info("Disconnecting from SQLite database: {}", database_path_);
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK)
        {
            // Usually an unfinalized statement
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
            sqlite3_free(error_msg);
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
        core::logging::getLogger()->info("Initializing SQLite database schema if needed...");

        const std::string create_candles_sql = R"(
        CREATE TABLE IF NOT EXISTS historical_candles (
            symbol TEXT NOT NULL,
            interval TEXT NOT NULL,
            timestamp TEXT NOT NULL, -- ISO-8601 UTC
            open REAL,
            high REAL,
            low REAL,
            close REAL NOT NULL,
            volume REAL,
            PRIMARY KEY (symbol, interval, timestamp)
        );
    )";

        const std::string create_runs_sql = R"(
        CREATE TABLE IF NOT EXISTS backtest_runs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            strategy_name TEXT NOT NULL,
            run_time TEXT NOT NULL, -- ISO-8601 UTC
            result_json TEXT NOT NULL
        );
    )";

        const std::string create_runs_index_sql = R"(
        CREATE INDEX IF NOT EXISTS idx_runs_strategy
        ON backtest_runs (strategy_name, run_time);
     )";

        bool success = true;
        success &= executeSQL(create_candles_sql);
        success &= executeSQL(create_runs_sql);
        success &= executeSQL(create_runs_index_sql);

        if (success)
        {
            core::logging::getLogger()->info("SQLite database schema initialization check complete.");
        }
        else
        {
            core::logging::getLogger()->error("SQLite database schema initialization failed for one or more statements.");
        }
        return success;
    }

    core::TimeSeries<core::Candle> DatabaseManager::queryCandles(
        const std::string& symbol,
        const std::string& interval,
        std::optional<core::Timestamp> start_time,
        std::optional<core::Timestamp> end_time)
    {
        core::TimeSeries<core::Candle> candles;
        auto logger = core::logging::getLogger();
        if (!isConnected()) {
            logger->error("Cannot query candles: Not connected to database.");
            return candles;
        }

        // Open bounds become bounds no ISO-8601 string can cross
        std::string start_str = start_time ? core::utils::timestampToString(*start_time) : std::string("");
        std::string end_str = end_time ? core::utils::timestampToString(*end_time) : std::string("~");

        logger->debug("Querying candles for {} ({}) between '{}' and '{}'", symbol, interval, start_str, end_str);

        const char* sql = R"(
            SELECT timestamp, open, high, low, close, volume
            FROM historical_candles
            WHERE symbol = ?
              AND interval = ?
              AND timestamp >= ?
              AND timestamp <= ?
            ORDER BY timestamp ASC;
        )";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            logger->error("Failed to prepare candle query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return candles;
        }

        sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 3, start_str.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 4, end_str.c_str(), -1, SQLITE_STATIC);

        int row_count = 0;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            row_count++;
            const unsigned char *ts_text = sqlite3_column_text(stmt, 0);
            if (!ts_text) {
                logger->warn("NULL timestamp found in query result (row {}), skipping row.", row_count);
                continue;
            }
            try {
                core::Candle candle;
                candle.timestamp = core::utils::stringToTimestamp(reinterpret_cast<const char*>(ts_text));
                candle.open = sqlite3_column_double(stmt, 1);
                candle.high = sqlite3_column_double(stmt, 2);
                candle.low = sqlite3_column_double(stmt, 3);
                candle.close = sqlite3_column_double(stmt, 4);
                candle.volume = sqlite3_column_double(stmt, 5);
                candles.push_back(candle);
            } catch (const std::exception& e) {
                logger->error("Skipping malformed candle row {}: {}", row_count, e.what());
            }
        }

        if (rc != SQLITE_DONE) {
            logger->error("Error stepping through query results [{}]: {}", rc, sqlite3_errmsg(db_));
        } else {
            logger->debug("Loaded {} candles for {} ({}).", candles.size(), symbol, interval);
        }

        sqlite3_finalize(stmt);
        return candles;
    }

    bool DatabaseManager::saveCandles(const core::TimeSeries<core::Candle> &candles,
                                      const std::string &symbol,
                                      const std::string &interval)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save candles: Not connected to database.");
            return false;
        }
        if (candles.empty())
        {
            logger->debug("No candles provided to save for {} ({}).", symbol, interval);
            return true;
        }

        const char *sql = R"(
INSERT OR IGNORE INTO historical_candles
(symbol, interval, timestamp, open, high, low, close, volume)
VALUES (?, ?, ?, ?, ?, ?, ?, ?);
)";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare INSERT statement [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return false;
        }

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            logger->error("Failed to begin transaction for saving candles.");
            sqlite3_finalize(stmt);
            return false;
        }

        bool success = true;
        int saved_count = 0;
        for (const auto &candle : candles)
        {
            std::string timestamp_str = core::utils::timestampToString(candle.timestamp);
            sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_STATIC);
            sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_STATIC);
            sqlite3_bind_text(stmt, 3, timestamp_str.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt, 4, candle.open);
            sqlite3_bind_double(stmt, 5, candle.high);
            sqlite3_bind_double(stmt, 6, candle.low);
            sqlite3_bind_double(stmt, 7, candle.close);
            sqlite3_bind_double(stmt, 8, candle.volume);

            rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE)
            {
                logger->error("Failed to execute insert step [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            if (sqlite3_changes(db_) > 0)
            {
                saved_count++;
            }

            rc = sqlite3_reset(stmt);
            if (rc != SQLITE_OK)
            {
                logger->error("Failed to reset prepared statement [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
        }

        // Finalize before COMMIT/ROLLBACK
        sqlite3_finalize(stmt);

        if (success)
        {
            if (!executeSQL("COMMIT;"))
            {
                logger->error("Failed to COMMIT transaction for saving candles.");
                executeSQL("ROLLBACK;");
                return false;
            }
            logger->info("Saved {} new candles (duplicates ignored) for {} ({}).", saved_count, symbol, interval);
        }
        else
        {
            executeSQL("ROLLBACK;");
            logger->warn("Transaction rolled back due to error during candle save for {} ({}).", symbol, interval);
        }
        return success;
    }

    bool DatabaseManager::saveBacktestRun(const std::string& strategy_name,
                                          core::Timestamp run_time,
                                          const std::string& result_json)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save backtest run: Not connected to database.");
            return false;
        }

        const char *sql = "INSERT INTO backtest_runs (strategy_name, run_time, result_json) VALUES (?, ?, ?);";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare backtest run insert [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return false;
        }

        std::string run_time_str = core::utils::timestampToString(run_time);
        sqlite3_bind_text(stmt, 1, strategy_name.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, run_time_str.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 3, result_json.c_str(), -1, SQLITE_STATIC);

        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            logger->error("Failed to store backtest run for '{}' [{}]: {}", strategy_name, rc, sqlite3_errmsg(db_));
            return false;
        }

        logger->info("Stored backtest run for '{}' at {}", strategy_name, run_time_str);
        return true;
    }

    long long DatabaseManager::countBacktestRuns(const std::string& strategy_name)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot count backtest runs: Not connected to database.");
            return -1;
        }

        const char *sql = strategy_name.empty()
            ? "SELECT COUNT(*) FROM backtest_runs;"
            : "SELECT COUNT(*) FROM backtest_runs WHERE strategy_name = ?;";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare backtest run count [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return -1;
        }
        if (!strategy_name.empty())
        {
            sqlite3_bind_text(stmt, 1, strategy_name.c_str(), -1, SQLITE_STATIC);
        }

        long long count = -1;
        rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW)
        {
            count = sqlite3_column_int64(stmt, 0);
        }
        else
        {
            logger->error("Failed to count backtest runs [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        sqlite3_finalize(stmt);
        return count;
    }

} // namespace data
