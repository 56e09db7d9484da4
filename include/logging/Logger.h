//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide logging; console output follows UCW_STDIO_MODE so stdout stays protocol-only.
//==========================================================================================================
#pragma once

#include <cstdlib>
#include <format>
#include <fstream>
#include <mutex>
#include <string>

enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL,
    LOG_FATAL_LEVEL
};

//==========================================================================================================
// Logger
// Purpose: Static logger shared by the library and the ucw binary.
// Notes:
//   - Console lines go to stderr when UCW_STDIO_MODE=1 (the server sets it), stdout otherwise.
//   - An optional append-mode file sink receives the same lines with a timestamp prefix.
//   - UCW_LOG_COLOR=1 colours the level label on the console.
//==========================================================================================================
class Logger {
public:
    // Case-insensitive; WARNING and CRITICAL are accepted. Unknown names map to INFO.
    static LogLevel levelFromString(const std::string& name);
    static const char* levelName(LogLevel level);

    template <typename... Args>
    static void logf(const char* level, const char* fmt, const char* file, unsigned int line, Args&&... args) {
        std::string message;
        try {
            message = std::vformat(fmt, std::make_format_args(args...));
        } catch (const std::format_error& e) {
            message = std::format("Format error: {} in \"{}\"", e.what(), fmt);
        }
        log(level, message, file, line);
    }

    static void setLogLevel(LogLevel level) { sLogLevel = level; }
    static void setLogLevelFromString(const std::string& name) { sLogLevel = levelFromString(name); }

    //==========================================================================================================
    // setLogFile
    // Purpose: Open (append) the file sink, replacing any previous one.
    // Returns:
    //   false when the file cannot be opened; console logging continues either way.
    //==========================================================================================================
    static bool setLogFile(const std::string& filePath);
    static void closeLogFile();

    static void log(const char* level, const std::string& msg, const char* file, unsigned int line);

    static LogLevel sLogLevel;

private:
    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
};

#define LOG_DEBUG(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_DEBUG_LEVEL) Logger::logf("DEBUG", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_INFO_LEVEL)  Logger::logf("INFO", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_WARN_LEVEL)  Logger::logf("WARN", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_ERROR_LEVEL) Logger::logf("ERROR", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) do { Logger::logf("FATAL", fmt, __FILE__, __LINE__, ##__VA_ARGS__); Logger::closeLogFile(); ::_Exit(EXIT_FAILURE); } while(0)

// Scope tracing in debug builds
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
