#include "utils.hpp"
#include "exceptions.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>    // For string streams
#include <string>
#include <stdexcept>
#include <cmath>      // For std::pow, std::isfinite
#include <cctype>     // For std::isdigit
#include <chrono>

namespace core {
namespace utils {

    namespace {

        std::tm toUtcTm(const Timestamp& ts) {
            auto tt = std::chrono::system_clock::to_time_t(ts);
            std::tm time_tm;
            #ifdef _WIN32
                gmtime_s(&time_tm, &tt);
            #else
                gmtime_r(&tt, &time_tm);
            #endif
            return time_tm;
        }

    } // namespace

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Parse main date/time part up to seconds
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date/time part): " + iso_string);
        }

        // 2. Manually parse optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore(); // consume '.'
            std::string digits;
            while (std::isdigit(ss.peek()) && digits.size() < 9) {
                digits += static_cast<char>(ss.get());
            }
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.length()));
            }
        }

        // 3. Parse timezone offset (+HH:MM, -HH:MM or Z); a bare timestamp is read as UTC
        std::chrono::seconds offset_duration(0);
        char sign_or_z = 0;
        if (ss >> sign_or_z) {
            if (sign_or_z == 'Z') {
                offset_duration = std::chrono::seconds(0);
            } else if (sign_or_z == '+' || sign_or_z == '-') {
                int offset_h = 0;
                int offset_m = 0;
                char colon = ' ';
                if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                     throw std::runtime_error("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
                }
                offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                if (sign_or_z == '-') {
                    offset_duration *= -1;
                }
            } else {
                throw std::runtime_error("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
            }
        }

        // 4. timegm interprets struct tm as UTC; use _mkgmtime on Windows
        #ifdef _WIN32
            time_t tt = _mkgmtime(&tm);
        #else
            time_t tt = timegm(&tm);
        #endif
        if (tt == (time_t)-1) {
             throw std::runtime_error("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::duration<double>(fractional_seconds));

        // 2015-04-20T00:00:00+05:30 is 2015-04-19T18:30:00Z
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts) {
        std::tm time_tm = toUtcTm(ts);
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
        return oss.str();
    }

    std::string compactTimestamp(const Timestamp& ts) {
        std::tm time_tm = toUtcTm(ts);
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y%m%d_%H%M%S");
        return oss.str();
    }

    void validateBars(const TimeSeries<Candle>& bars) {
        if (bars.empty()) {
            throw InvalidDataException("Price series is empty; 'timestamp' and 'close' are required.");
        }
        for (size_t i = 0; i < bars.size(); ++i) {
            const Candle& bar = bars[i];
            if (!std::isfinite(bar.close) || bar.close <= 0.0) {
                throw InvalidDataException("Bar " + std::to_string(i) + " (" + timestampToString(bar.timestamp) +
                                           ") has no valid 'close' value.");
            }
            if (i > 0 && bar.timestamp < bars[i - 1].timestamp) {
                throw InvalidDataException("Bars are not ordered by timestamp at index " + std::to_string(i) + ".");
            }
        }
    }

} // namespace utils
} // namespace core
