/**
 * @file Debug.h
 * @brief Debug logging utilities with timestamps
 *
 * Used by the command-line tools. The library itself never logs; it returns
 * a Status and leaves reporting to the caller.
 *
 * (c) 2026 CasFile Project
 * Licensed under MIT License
 */

#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <mutex>

namespace CasFile {

// Serializes writes to std::cerr so lines from different threads never interleave
inline std::mutex g_logMutex;

/// LOG_DEBUG is dropped unless this is set (cas_put --verbose)
inline std::atomic<bool> g_logDebugEnabled{false};

/**
 * @brief Get current timestamp as formatted string
 * @return Timestamp in format [HH:MM:SS.mmm]
 */
inline std::string getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << "[" << std::setfill('0') << std::setw(2) << tm.tm_hour
        << ":" << std::setfill('0') << std::setw(2) << tm.tm_min
        << ":" << std::setfill('0') << std::setw(2) << tm.tm_sec
        << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
    return oss.str();
}

#define LOG_INFO(msg) \
    do { \
        std::lock_guard<std::mutex> lock(CasFile::g_logMutex); \
        std::cerr << CasFile::getTimestamp() << " [INFO] " << msg << std::endl; \
    } while(0)

#define LOG_DEBUG(msg) \
    do { \
        if (CasFile::g_logDebugEnabled.load()) { \
            std::lock_guard<std::mutex> lock(CasFile::g_logMutex); \
            std::cerr << CasFile::getTimestamp() << " [DEBUG] " << msg << std::endl; \
        } \
    } while(0)

#define LOG_ERROR(msg) \
    do { \
        std::lock_guard<std::mutex> lock(CasFile::g_logMutex); \
        std::cerr << CasFile::getTimestamp() << " [ERROR] " << msg << std::endl; \
    } while(0)

#define LOG_WARNING(msg) \
    do { \
        std::lock_guard<std::mutex> lock(CasFile::g_logMutex); \
        std::cerr << CasFile::getTimestamp() << " [WARNING] " << msg << std::endl; \
    } while(0)

} // namespace CasFile
