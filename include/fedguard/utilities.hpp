/**
 * @file utilities.hpp
 * @brief Logging, clocks and small string helpers
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * All FedGuard components log through these functions. The first call
 * creates a console logger at INFO if initialize_logging() was never called.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fedguard {
namespace utilities {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Replace the coordinator logger
 * @param log_file Rotating log file (10 MB x 3), empty for console only
 * @param level Minimum level for every sink
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/// Change the minimum level of the active logger and its sinks
void set_log_level(LogLevel level);

/**
 * @brief Parse "debug", "info", "warn"/"warning", "error" or "critical"
 *
 * Case and surrounding whitespace are ignored.
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

/**
 * @brief Source of Unix time in seconds
 *
 * Rounds, proofs and ledger blocks all read time through a Clock so tests
 * can pin it.
 */
using Clock = std::function<uint64_t()>;

/// Clock reading std::chrono::system_clock
Clock system_clock();

/// Fixed-point rendering used in log lines and evidence tags
std::string format_double(double value, int precision = 3);

std::string join_strings(const std::vector<std::string>& parts, const std::string& separator);

/**
 * @brief Environment variable or a default
 * @return default_value when the variable is unset
 */
std::string get_env(const std::string& name, const std::string& default_value = "");

} // namespace utilities
} // namespace fedguard
