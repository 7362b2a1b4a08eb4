#pragma once

#include <string>
#include <vector>
#include <optional>

#include <sqlite3.h>

#include "datatypes.hpp"

namespace data {

// SQLite store for historical candles and serialized backtest runs.
// All timestamps are stored as ISO-8601 UTC text, so text comparison orders them.
class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    // Creates historical_candles and backtest_runs if missing
    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    // Inserts in one transaction; rows already present (symbol, interval, timestamp) are ignored
    bool saveCandles(const core::TimeSeries<core::Candle>& candles,
                     const std::string& symbol,
                     const std::string& interval);

    // Candles for symbol/interval with start <= timestamp <= end, oldest first.
    // An unset bound is open.
    core::TimeSeries<core::Candle> queryCandles(
        const std::string& symbol,
        const std::string& interval,
        std::optional<core::Timestamp> start_time = std::nullopt,
        std::optional<core::Timestamp> end_time = std::nullopt);

    // Stores a serialized result keyed by strategy name and run time
    bool saveBacktestRun(const std::string& strategy_name,
                         core::Timestamp run_time,
                         const std::string& result_json);

    // Number of stored runs for one strategy, or for all strategies when the name is empty.
    // Returns -1 on error.
    long long countBacktestRuns(const std::string& strategy_name = "");

private:
    std::string database_path_;
    sqlite3* db_ = nullptr;
    bool connected_ = false;
};

} // namespace data
