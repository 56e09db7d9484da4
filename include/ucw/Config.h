//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Runtime settings resolved from the environment, the config.env file and defaults
//==========================================================================================================

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace ucw {

enum class StorageKind {
    Sqlite,
    Memory,
    None
};

const char* StorageKindName(StorageKind kind);

//==========================================================================================================
// Config
// Purpose: Resolved settings for one server run.
// Fields:
//   platform: Platform tag stored with every session (UCW_PLATFORM).
//   dataDir: Root for captures, logs and config.env (UCW_DATA_DIR).
//   logLevel: DEBUG/INFO/WARN/ERROR/FATAL (UCW_LOG_LEVEL).
//   logFile: Log file path; empty disables the file sink (UCW_LOG_FILE).
//   storage: Persistence backend (UCW_STORAGE = sqlite | memory | none).
//   recentEventsMax: In-memory window of recent events (UCW_RECENT_EVENTS_MAX).
//   maxLineBytes: Maximum accepted frame line (UCW_MAX_LINE_BYTES).
//==========================================================================================================
struct Config {
    std::string platform{"claude-desktop"};
    std::string dataDir;
    std::string logLevel{"INFO"};
    std::string logFile;
    StorageKind storage{StorageKind::Sqlite};
    std::size_t recentEventsMax{1000};
    std::size_t maxLineBytes{65536};

    std::string LogDir() const;
    std::string DatabasePath() const;
    std::string ConfigEnvPath() const;
};

//==========================================================================================================
// ParseConfigEnv
// Purpose: Read KEY=VALUE pairs. Blank lines and '#' comments are skipped, keys and values are
//          trimmed, and one layer of matching single or double quotes is stripped from values.
// Returns:
//   Parsed pairs; empty when the file does not exist.
//==========================================================================================================
std::map<std::string, std::string> ParseConfigEnv(const std::string& filePath);

//==========================================================================================================
// LoadConfig
// Purpose: Resolve settings. Precedence: environment, then <dataDir>/config.env, then defaults.
// Args:
//   dataDirOverride: Takes precedence over UCW_DATA_DIR when set (command line).
//==========================================================================================================
Config LoadConfig(const std::optional<std::string>& dataDirOverride = std::nullopt);

// Create the data and log directories. Throws std::filesystem::filesystem_error on failure.
void EnsureDirectories(const Config& cfg);

// Write a commented config.env template. Returns false when the file already exists.
bool WriteDefaultConfigEnv(const Config& cfg);

} // namespace ucw
