//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide hub logging: level filtering, timestamped lines tagged with the calling thread,
//          optional ANSI labels and optional file mirroring.
//==========================================================================================================
#pragma once

#include <atomic>
#include <cstdlib>
#include <format>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL,
    LOG_FATAL_LEVEL
};

class Logger {
public:
    // Case-insensitive; "WARNING" is accepted for WARN. Unknown input maps to INFO.
    static LogLevel levelFromString(const std::string& lvl);
    static const char* levelName(LogLevel level);

    static void setLogLevel(LogLevel level) { sLogLevel.store(level, std::memory_order_relaxed); }
    static LogLevel logLevel() { return sLogLevel.load(std::memory_order_relaxed); }
    static bool enabled(LogLevel level) { return logLevel() <= level; }

    // Applies TOOLHUB_LOG_LEVEL and TOOLHUB_LOG_FILE when set.
    static void configureFromEnv();

    // Mirrors every line to filePath (append). Returns false if the file cannot be opened.
    static bool setLogFile(const std::string& filePath);
    static void closeLogFile();

    // Variadic logging using C++20 std::vformat with runtime format strings
    template <typename... Args>
    static void logf(LogLevel level, const char* fmt, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = std::vformat(fmt, std::make_format_args(args...));
        } catch (const std::format_error& e) {
            buffer = std::format("Format error: {}", e.what());
        }
        log(level, buffer, file, line);
    }

    static void log(LogLevel level, std::string_view msg, const char* file, unsigned int line);

    // One formatted line without the trailing newline; exposed for tests.
    static std::string formatLine(LogLevel level, std::string_view msg, const char* file, unsigned int line,
                                  bool color);

private:
    static std::atomic<LogLevel> sLogLevel;
    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
};

// Logging macros with log level filtering
#define LOG_DEBUG(fmt, ...) if (Logger::enabled(LogLevel::LOG_DEBUG_LEVEL)) Logger::logf(LogLevel::LOG_DEBUG_LEVEL, fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  if (Logger::enabled(LogLevel::LOG_INFO_LEVEL))  Logger::logf(LogLevel::LOG_INFO_LEVEL, fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  if (Logger::enabled(LogLevel::LOG_WARN_LEVEL))  Logger::logf(LogLevel::LOG_WARN_LEVEL, fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) if (Logger::enabled(LogLevel::LOG_ERROR_LEVEL)) Logger::logf(LogLevel::LOG_ERROR_LEVEL, fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) do { Logger::logf(LogLevel::LOG_FATAL_LEVEL, fmt, __FILE__, __LINE__, ##__VA_ARGS__); ::_Exit(EXIT_FAILURE); } while(0)

// Function entry/exit tracing, compiled in for _DEBUG builds only
#ifdef _DEBUG
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_SCOPE() ((void)0)
#endif
