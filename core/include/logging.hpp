#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace core {
namespace logging {

    struct LoggingOptions {
        std::string log_dir = "logs";
        std::string base_file_name = "backtester";
        bool to_file = true;
        spdlog::level::level_enum console_level = spdlog::level::info;
        spdlog::level::level_enum file_level = spdlog::level::debug;
    };

    // Call this once at the beginning of your application (e.g., in main()).
    // Calling it again replaces the previous logger.
    void initialize(const LoggingOptions& options = LoggingOptions{});

    // Get the globally configured logger
    std::shared_ptr<spdlog::logger>& getLogger();

    // Helper function to set log level from string (useful for env vars/config)
    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
