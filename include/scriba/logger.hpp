/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <string>

namespace scriba {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    // Reads SCRIBA_LOG_LEVEL, SCRIBA_LOG_FILE and SCRIBA_LOG_MAX_BYTES.
    static void initFromEnv() noexcept;

    // Mirror every line into `path`, rotating it to `<path>.1` past maxBytes.
    // An empty path disables the file sink.
    static void setLogFile(const std::filesystem::path& path, std::size_t maxBytes) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
    static void writeFile(const std::string& line) noexcept;
};

// Thread naming for better logging context
void setThreadName(const std::string& name);

}

#define LOG_ERROR(msg) ::scriba::Logger::error(msg)
#define LOG_WARN(msg)  ::scriba::Logger::warn(msg)
#define LOG_INFO(msg)  ::scriba::Logger::info(msg)
#define LOG_DEBUG(msg) ::scriba::Logger::debug(msg)
#define LOG_TRACE(msg) ::scriba::Logger::trace(msg)
