//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger sinks, level parsing and static state
//==========================================================================================================

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "env/EnvVars.h"
#include "logging/Logger.h"

LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

namespace {

bool envFlag(const char* name) {
    const std::string v = GetEnvOrDefault(name, "0");
    return v == "1" || v == "true" || v == "TRUE";
}

std::string timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    ::localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

// Source path without directories, keeping log lines short.
const char* baseName(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

} // namespace

LogLevel Logger::levelFromString(const std::string& name) {
    std::string s;
    s.reserve(name.size());
    for (char c : name) s.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    if (s == "DEBUG") return LogLevel::LOG_DEBUG_LEVEL;
    if (s == "INFO") return LogLevel::LOG_INFO_LEVEL;
    if (s == "WARN" || s == "WARNING") return LogLevel::LOG_WARN_LEVEL;
    if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
    if (s == "FATAL" || s == "CRITICAL") return LogLevel::LOG_FATAL_LEVEL;
    return LogLevel::LOG_INFO_LEVEL;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_DEBUG_LEVEL: return "DEBUG";
        case LogLevel::LOG_INFO_LEVEL: return "INFO";
        case LogLevel::LOG_WARN_LEVEL: return "WARN";
        case LogLevel::LOG_ERROR_LEVEL: return "ERROR";
        case LogLevel::LOG_FATAL_LEVEL: return "FATAL";
    }
    return "INFO";
}

bool Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (" << std::strerror(errno) << ")" << std::endl;
        return false;
    }
    sLogFile << "\n=== ucw log opened at " << timestamp() << " ===\n";
    sLogFile.flush();
    return true;
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.flush();
        sLogFile.close();
    }
}

void Logger::log(const char* level, const std::string& msg, const char* file, unsigned int line) {
    static const bool colorEnabled = envFlag("UCW_LOG_COLOR");
    // stdout carries protocol frames in stdio mode
    static const bool useStderr = envFlag("UCW_STDIO_MODE");

    std::ostringstream body;
    body << baseName(file) << ":" << line << ": " << msg << "\n";
    const std::string tail = body.str();

    std::lock_guard<std::mutex> lock(sLogMutex);
    std::ostream& console = useStderr ? std::cerr : std::cout;
    if (colorEnabled) {
        const char* color = (std::strcmp(level, "ERROR") == 0 || std::strcmp(level, "FATAL") == 0)
                                ? "\033[38;5;88m" : "\033[35m";
        console << "[" << color << level << "\033[0m] " << tail;
    } else {
        console << "[" << level << "] " << tail;
    }
    console.flush();

    if (sLogFile.is_open()) {
        sLogFile << timestamp() << " [" << level << "] " << tail;
        sLogFile.flush();
    }
}
