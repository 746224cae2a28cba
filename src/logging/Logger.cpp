//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger state, line formatting and sinks.
//==========================================================================================================

#include "logging/Logger.h"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

#include "env/EnvVars.h"

std::atomic<LogLevel> Logger::sLogLevel{LogLevel::LOG_INFO_LEVEL};
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

namespace {

const char* shortFile(const char* file) {
    const char* slash = std::strrchr(file, '/');
    return slash ? slash + 1 : file;
}

const char* labelColor(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_ERROR_LEVEL:
        case LogLevel::LOG_FATAL_LEVEL: return "\033[38;5;88m";
        case LogLevel::LOG_WARN_LEVEL:  return "\033[33m";
        default:                        return "\033[36m";
    }
}

} // namespace

LogLevel Logger::levelFromString(const std::string& lvl) {
    std::string s;
    s.reserve(lvl.size());
    for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    if (s == "DEBUG") return LogLevel::LOG_DEBUG_LEVEL;
    if (s == "INFO")  return LogLevel::LOG_INFO_LEVEL;
    if (s == "WARN" || s == "WARNING") return LogLevel::LOG_WARN_LEVEL;
    if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
    if (s == "FATAL") return LogLevel::LOG_FATAL_LEVEL;
    return LogLevel::LOG_INFO_LEVEL;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_DEBUG_LEVEL: return "DEBUG";
        case LogLevel::LOG_INFO_LEVEL:  return "INFO";
        case LogLevel::LOG_WARN_LEVEL:  return "WARN";
        case LogLevel::LOG_ERROR_LEVEL: return "ERROR";
        case LogLevel::LOG_FATAL_LEVEL: return "FATAL";
    }
    return "INFO";
}

void Logger::configureFromEnv() {
    const std::string lvl = GetEnvOrDefault("TOOLHUB_LOG_LEVEL", "");
    if (!lvl.empty()) {
        setLogLevel(levelFromString(lvl));
    }
    const std::string file = GetEnvOrDefault("TOOLHUB_LOG_FILE", "");
    if (!file.empty()) {
        (void)setLogFile(file);
    }
}

bool Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        return false;
    }
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm buf{};
    ::localtime_r(&now, &buf);
    sLogFile << "\n=== toolhub log opened at " << std::put_time(&buf, "%Y-%m-%d %H:%M:%S") << " ===\n";
    sLogFile.flush();
    return true;
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
}

std::string Logger::formatLine(LogLevel level, std::string_view msg, const char* file, unsigned int line,
                               bool color) {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t secs = system_clock::to_time_t(now);
    const auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm buf{};
    ::localtime_r(&secs, &buf);

    std::ostringstream oss;
    oss << std::put_time(&buf, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << ' ';
    if (color) {
        oss << '[' << labelColor(level) << levelName(level) << "\033[0m] ";
    } else {
        oss << '[' << levelName(level) << "] ";
    }
    // Short hex tag so interleaved connection threads can be told apart.
    oss << 't' << std::hex << (std::hash<std::thread::id>{}(std::this_thread::get_id()) & 0xffff) << std::dec
        << ' ' << shortFile(file) << ':' << line << ": " << msg;
    return oss.str();
}

void Logger::log(LogLevel level, std::string_view msg, const char* file, unsigned int line) {
    static const bool colorEnabled = GetEnvFlag("TOOLHUB_LOG_COLOR", true);
    // stderr keeps stdout free for program output
    static const bool useStderr = GetEnvFlag("TOOLHUB_LOG_STDERR", false);

    const std::string consoleLine = formatLine(level, msg, file, line, colorEnabled);
    std::lock_guard<std::mutex> lock(sLogMutex);
    (useStderr ? std::cerr : std::cout) << consoleLine << '\n';
    if (sLogFile.is_open()) {
        sLogFile << formatLine(level, msg, file, line, false) << '\n';
        sLogFile.flush();
    }
}
