/**
 * @file utilities.cpp
 * @brief Implementation of logging, clocks and string helpers
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "fedguard/utilities.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace fedguard {
namespace utilities {

namespace {

constexpr const char* LOGGER_NAME = "fedguard";
constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr size_t LOG_FILE_BYTES = 10 * 1024 * 1024;
constexpr size_t LOG_FILE_COUNT = 3;

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:    return spdlog::level::debug;
        case LogLevel::WARN:     return spdlog::level::warn;
        case LogLevel::ERROR:    return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        default:                 return spdlog::level::info;
    }
}

std::shared_ptr<spdlog::logger> active_logger() {
    {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        if (g_logger) {
            return g_logger;
        }
    }
    initialize_logging();
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    return g_logger;
}

} // anonymous namespace

// ============================================================================
// Logging
// ============================================================================

void initialize_logging(const std::string& log_file, LogLevel level) {
    auto spd_level = to_spdlog_level(level);

    try {
        std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
        if (!log_file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, LOG_FILE_BYTES, LOG_FILE_COUNT
            ));
        }
        for (auto& sink : sinks) {
            sink->set_level(spd_level);
        }

        auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        logger->set_level(spd_level);
        logger->set_pattern(LOG_PATTERN);

        std::lock_guard<std::mutex> lock(g_logger_mutex);
        g_logger = logger;
        spdlog::set_default_logger(g_logger);
    } catch (const spdlog::spdlog_ex& ex) {
        // Keep the previous logger, if any
        std::fprintf(stderr, "FedGuard log initialization failed: %s\n", ex.what());
    }
}

void set_log_level(LogLevel level) {
    auto logger = active_logger();
    if (!logger) {
        return;
    }
    logger->set_level(to_spdlog_level(level));
    for (auto& sink : logger->sinks()) {
        sink->set_level(to_spdlog_level(level));
    }
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto first = std::find_if_not(name.begin(), name.end(), is_space);
    auto last = std::find_if_not(name.rbegin(), name.rend(), is_space).base();

    std::string key;
    for (auto it = first; it < last; ++it) {
        key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*it))));
    }

    if (key == "debug") return LogLevel::DEBUG;
    if (key == "info") return LogLevel::INFO;
    if (key == "warn" || key == "warning") return LogLevel::WARN;
    if (key == "error") return LogLevel::ERROR;
    if (key == "critical") return LogLevel::CRITICAL;
    return std::nullopt;
}

void log(LogLevel level, const std::string& message) {
    if (auto logger = active_logger()) {
        logger->log(to_spdlog_level(level), message);
    }
}

void log_debug(const std::string& message) { log(LogLevel::DEBUG, message); }
void log_info(const std::string& message) { log(LogLevel::INFO, message); }
void log_warn(const std::string& message) { log(LogLevel::WARN, message); }
void log_error(const std::string& message) { log(LogLevel::ERROR, message); }
void log_critical(const std::string& message) { log(LogLevel::CRITICAL, message); }

// ============================================================================
// Time
// ============================================================================

Clock system_clock() {
    return [] {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count());
    };
}

// ============================================================================
// Strings
// ============================================================================

std::string format_double(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string join_strings(const std::vector<std::string>& parts, const std::string& separator) {
    std::string joined;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) {
            joined += separator;
        }
        joined += parts[i];
    }
    return joined;
}

std::string get_env(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

} // namespace utilities
} // namespace fedguard
