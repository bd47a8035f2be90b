/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/logger.hpp"
#include <iostream>
#include <fstream>
#include <cstdlib>
#include <cctype>
#include <ctime>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace scriba {

static LogLevel g_level = LogLevel::INFO;
static std::mutex g_log_mutex;
static bool g_level_initialized = false;
static std::unordered_map<std::thread::id, std::string> g_thread_names;

static std::filesystem::path g_log_path;
static std::size_t g_log_max_bytes = 5 * 1024 * 1024;
static std::ofstream g_log_file;

void Logger::setLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_initialized = true;
}

void Logger::initFromEnv() noexcept {
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        g_level = parseEnvLevel();
        g_level_initialized = true;
    }

    const char* file = std::getenv("SCRIBA_LOG_FILE");
    if (!file || !*file) {
        return;
    }
    std::size_t maxBytes = 5 * 1024 * 1024;
    if (const char* max = std::getenv("SCRIBA_LOG_MAX_BYTES"); max && *max) {
        char* end = nullptr;
        unsigned long long parsed = std::strtoull(max, &end, 10);
        if (end && *end == '\0' && parsed > 0) {
            maxBytes = static_cast<std::size_t>(parsed);
        }
    }
    setLogFile(file, maxBytes);
}

void Logger::setLogFile(const std::filesystem::path& path, std::size_t maxBytes) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    try {
        if (g_log_file.is_open()) {
            g_log_file.close();
        }
        g_log_path = path;
        g_log_max_bytes = maxBytes == 0 ? g_log_max_bytes : maxBytes;
        if (g_log_path.empty()) {
            return;
        }
        if (g_log_path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(g_log_path.parent_path(), ec);
        }
        g_log_file.open(g_log_path, std::ios::app);
        if (!g_log_file) {
            std::cerr << "Cannot open log file: " << g_log_path.string() << std::endl;
            g_log_path.clear();
        }
    } catch (const std::exception& e) {
        std::cerr << "Cannot open log file: " << e.what() << std::endl;
        g_log_path.clear();
    }
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_initialized) {
        g_level = parseEnvLevel();
        g_level_initialized = true;
    }
    return g_level;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (static_cast<uint8_t>(level) > static_cast<uint8_t>(Logger::level())) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::string thread_info;
        {
            std::lock_guard<std::mutex> lock(g_log_mutex);
            auto tid = std::this_thread::get_id();
            auto it = g_thread_names.find(tid);
            if (it != g_thread_names.end()) {
                thread_info = it->second;
            } else {
                std::ostringstream oss;
                oss << "T" << tid;
                thread_info = oss.str();
            }
        }

        std::tm local{};
        localtime_r(&time_t, &local);

        std::stringstream ss;
        ss << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
        ss << " [" << levelToString(level) << "]";
        ss << " [" << thread_info << "]";
        ss << " " << message;

        {
            // All logs go to stderr - keep stdout pure for UI
            std::lock_guard<std::mutex> lock(g_log_mutex);
            std::cerr << ss.str() << std::endl;
            writeFile(ss.str());
        }
    } catch (const std::exception&) {
        // Never throw from logging - would cause infinite loops
    }
}

// Caller holds g_log_mutex.
void Logger::writeFile(const std::string& line) noexcept {
    if (g_log_path.empty() || !g_log_file.is_open()) {
        return;
    }
    try {
        g_log_file << line << '\n';
        g_log_file.flush();

        if (static_cast<std::size_t>(g_log_file.tellp()) < g_log_max_bytes) {
            return;
        }
        g_log_file.close();
        std::error_code ec;
        auto rotated = g_log_path;
        rotated += ".1";
        std::filesystem::rename(g_log_path, rotated, ec);
        if (ec) {
            std::cerr << "Log rotation failed: " << ec.message() << std::endl;
        }
        g_log_file.open(g_log_path, std::ios::trunc);
    } catch (const std::exception& e) {
        std::cerr << "Log file write failed: " << e.what() << std::endl;
    }
}

LogLevel Logger::parseEnvLevel() noexcept {
    const char* env_val = std::getenv("SCRIBA_LOG_LEVEL");
    if (!env_val) return LogLevel::INFO;

    std::string level_str(env_val);
    for (char& c : level_str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (level_str == "error") return LogLevel::ERROR;
    if (level_str == "warn" || level_str == "warning") return LogLevel::WARN;
    if (level_str == "info") return LogLevel::INFO;
    if (level_str == "debug") return LogLevel::DEBUG;
    if (level_str == "trace") return LogLevel::TRACE;

    return LogLevel::INFO;
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

void setThreadName(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names[std::this_thread::get_id()] = name;
}

}
