#include "database_manager.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <cassert>
#include <chrono>
#include <cmath>

namespace {
bool almost_equal(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

core::Candle candle(const std::string& ts, double close) {
    core::Candle c;
    c.timestamp = core::utils::stringToTimestamp(ts);
    c.open = close - 1.0;
    c.high = close + 2.0;
    c.low = close - 2.0;
    c.close = close;
    c.volume = 12.5;
    return c;
}
}

int main() {
    core::logging::LoggingOptions log_options;
    log_options.to_file = false;
    log_options.console_level = spdlog::level::warn;
    core::logging::initialize(log_options);

    data::DatabaseManager db(":memory:");
    assert(!db.isConnected());
    assert(!db.saveCandles({candle("2024-01-01T00:00:00Z", 1.0)}, "BTC", "day"));
    assert(db.countBacktestRuns() == -1);

    assert(db.connect());
    assert(db.connect());
    assert(db.isConnected());
    assert(db.initializeSchema());
    assert(db.initializeSchema());
    assert(!db.executeSQL("SELECT * FROM no_such_table;"));

    // Stored out of order; read back ordered by time
    core::TimeSeries<core::Candle> candles{
        candle("2024-01-03T00:00:00Z", 103.0),
        candle("2024-01-01T00:00:00Z", 101.0),
        candle("2024-01-02T00:00:00Z", 102.0),
    };
    assert(db.saveCandles(candles, "BTC", "day"));
    assert(db.saveCandles(candles, "BTC", "day"));   // duplicates ignored
    assert(db.saveCandles({}, "BTC", "day"));

    auto all = db.queryCandles("BTC", "day");
    assert(all.size() == 3);
    assert(core::utils::timestampToString(all[0].timestamp) == "2024-01-01T00:00:00Z");
    assert(core::utils::timestampToString(all[2].timestamp) == "2024-01-03T00:00:00Z");
    assert(almost_equal(all[0].close, 101.0));
    assert(almost_equal(all[0].open, 100.0));
    assert(almost_equal(all[0].high, 103.0));
    assert(almost_equal(all[0].volume, 12.5));

    auto bounded = db.queryCandles("BTC", "day",
                                   core::utils::stringToTimestamp("2024-01-02T00:00:00Z"),
                                   core::utils::stringToTimestamp("2024-01-02T23:59:59Z"));
    assert(bounded.size() == 1);
    assert(almost_equal(bounded[0].close, 102.0));

    auto from_second = db.queryCandles("BTC", "day", core::utils::stringToTimestamp("2024-01-02T00:00:00Z"));
    assert(from_second.size() == 2);

    assert(db.queryCandles("ETH", "day").empty());
    assert(db.queryCandles("BTC", "1h").empty());

    // Backtest runs
    auto now = std::chrono::system_clock::now();
    assert(db.countBacktestRuns() == 0);
    assert(db.saveBacktestRun("SMA Crossover", now, R"({"total_return": 12.5})"));
    assert(db.saveBacktestRun("SMA Crossover", now, R"({"total_return": 3.0})"));
    assert(db.saveBacktestRun("RSI", now, R"({"total_return": -1.0})"));
    assert(db.countBacktestRuns("SMA Crossover") == 2);
    assert(db.countBacktestRuns("RSI") == 1);
    assert(db.countBacktestRuns("Unknown") == 0);
    assert(db.countBacktestRuns() == 3);

    db.disconnect();
    assert(!db.isConnected());
    assert(db.queryCandles("BTC", "day").empty());
    assert(!db.saveBacktestRun("RSI", now, "{}"));

    return 0;
}
