//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide logger with level filtering, optional file sink and fmt-style formatting.
//==========================================================================================================
#pragma once

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <errno.h>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

#include <fmt/format.h>

#include "env/EnvVars.h"

// Log level enum
enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL,
    LOG_FATAL_LEVEL
};

class Logger {
public:
    // Convert common level strings to LogLevel (case-insensitive). Unknown strings map to INFO.
    static LogLevel levelFromString(const std::string& lvl) {
        std::string s; s.reserve(lvl.size());
        for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
        if (s == "DEBUG") return LogLevel::LOG_DEBUG_LEVEL;
        if (s == "INFO")  return LogLevel::LOG_INFO_LEVEL;
        if (s == "WARN" || s == "WARNING")  return LogLevel::LOG_WARN_LEVEL;
        if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
        if (s == "FATAL") return LogLevel::LOG_FATAL_LEVEL;
        return LogLevel::LOG_INFO_LEVEL;
    }

    // Variadic logging using fmt::vformat with runtime format strings
    template <typename... Args>
    static void logf(const char* level, const char* fmtStr, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = fmt::vformat(fmtStr, fmt::make_format_args(args...));
        } catch (const fmt::format_error& e) {
            buffer = fmt::format("Format error: {} (format: {})", e.what(), fmtStr);
        }
        log(level, buffer, file, line);
    }

public:
    // Configure logging
    static void setLogLevel(LogLevel level) {
        sLogLevel = level;
    }

    static void setLogLevelFromString(const std::string& level) {
        sLogLevel = levelFromString(level);
    }

    static void setLogFile(const std::string& filePath) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        if (sLogFile.is_open()) {
            sLogFile.close();
        }
        sLogFile.open(filePath, std::ios::out | std::ios::app);
        if (!sLogFile.is_open()) {
            std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
            return;
        }
        sLogFile << "\n=== mcp-bridge log opened at " << timestamp() << " ===\n";
        sLogFile.flush();
    }

    //==========================================================================================================
    // log
    // Purpose: Writes one line: "<local time>.<ms> [LEVEL] [t:<thread>] <file>:<line>: <msg>".
    // Notes:
    //   - Console target is stdout, or stderr when MCPBRIDGE_STDIO_MODE=1 (stdout carries protocol data).
    //   - MCPBRIDGE_LOG_COLOR=0 disables the ANSI label color.
    //==========================================================================================================
    static void log(const char* level, const std::string& msg, const char* file, unsigned int line) {
        static const bool colorEnabled = envFlag("MCPBRIDGE_LOG_COLOR", "1");
        static const bool useStderr = envFlag("MCPBRIDGE_STDIO_MODE", "0");

        const std::string stamp = timestamp();
        const std::string where = fmt::format("[t:{}] {}:{}: {}\n", threadTag(), baseName(file), line, msg);
        std::string consoleLine;
        if (colorEnabled) {
            const bool severe = ::strncmp(level, "ERROR", 5) == 0 || ::strncmp(level, "FATAL", 5) == 0;
            consoleLine = fmt::format("{} [{}{}\033[0m] {}", stamp, severe ? "\033[31m" : "\033[36m", level, where);
        } else {
            consoleLine = fmt::format("{} [{}] {}", stamp, level, where);
        }

        std::lock_guard<std::mutex> lock(sLogMutex);
        if (useStderr) {
            std::cerr << consoleLine << std::flush;
        } else {
            std::cout << consoleLine << std::flush;
        }
        if (sLogFile.is_open()) {
            // Files never get color codes
            sLogFile << stamp << " [" << level << "] " << where;
            sLogFile.flush();
        }
    }

    static LogLevel sLogLevel;

private:
    static bool envFlag(const char* name, const char* def) {
        const std::string v = GetEnvOrDefault(name, def);
        return v == "1" || v == "true" || v == "TRUE";
    }

    static std::string timestamp() {
        const auto now = std::chrono::system_clock::now();
        const std::time_t t = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm buf{};
        ::localtime_r(&t, &buf);
        char text[32];
        std::strftime(text, sizeof(text), "%Y-%m-%d %H:%M:%S", &buf);
        return fmt::format("{}.{:03}", text, ms);
    }

    // Short stable per-thread tag; several backends log from their own reader threads
    static std::size_t threadTag() {
        return std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000;
    }

    static const char* baseName(const char* path) {
        const char* slash = ::strrchr(path, '/');
        return slash != nullptr ? slash + 1 : path;
    }

    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
};

// Definitions of static members are in Logger.cpp

// Logging macros with log level filtering
#define LOG_DEBUG(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_DEBUG_LEVEL) Logger::logf("DEBUG", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_INFO_LEVEL)  Logger::logf("INFO", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_WARN_LEVEL)  Logger::logf("WARN", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_ERROR_LEVEL) Logger::logf("ERROR", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) do { Logger::logf("FATAL", fmt, __FILE__, __LINE__, ##__VA_ARGS__); ::_Exit(EXIT_FAILURE); } while(0)

// Function entry/exit macros for logging
#ifdef _DEBUG
#define FUNC_ENTRY() LOG_DEBUG("ENTER: {}", __FUNCTION__)
#define FUNC_EXIT()  LOG_DEBUG("EXIT:  {}", __FUNCTION__)

// Scope-based entry/exit guard
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_ENTRY() ((void)0)
#define FUNC_EXIT()  ((void)0)
#define FUNC_SCOPE() ((void)0)
#endif
