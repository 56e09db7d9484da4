//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Settings resolution implementation
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "ucw/Config.h"

namespace ucw {

namespace {

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string stripQuotes(const std::string& v) {
    if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
        return v.substr(1, v.size() - 2);
    }
    return v;
}

std::string defaultDataDir() {
    auto home = GetEnvOptional("HOME");
    return (std::filesystem::path(home.value_or(".")) / ".ucw").string();
}

// Leading "~/" expands to $HOME.
std::string expandHome(const std::string& path) {
    if (path == "~" || path.rfind("~/", 0) == 0) {
        auto home = GetEnvOptional("HOME");
        if (home.has_value()) {
            return home.value() + path.substr(1);
        }
    }
    return path;
}

std::size_t parseSize(const std::string& key, const std::string& text, std::size_t fallback) {
    std::size_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || value == 0) {
        LOG_WARN("Config: invalid value '{}' for {}; using {}", text, key, fallback);
        return fallback;
    }
    return value;
}

StorageKind parseStorage(const std::string& text) {
    std::string v = text;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "sqlite") return StorageKind::Sqlite;
    if (v == "memory") return StorageKind::Memory;
    if (v == "none") return StorageKind::None;
    LOG_WARN("Config: unknown storage '{}'; using sqlite", text);
    return StorageKind::Sqlite;
}

} // namespace

const char* StorageKindName(StorageKind kind) {
    switch (kind) {
        case StorageKind::Sqlite: return "sqlite";
        case StorageKind::Memory: return "memory";
        case StorageKind::None: return "none";
    }
    return "sqlite";
}

std::string Config::LogDir() const {
    return (std::filesystem::path(dataDir) / "logs").string();
}

std::string Config::DatabasePath() const {
    return (std::filesystem::path(dataDir) / "capture.db").string();
}

std::string Config::ConfigEnvPath() const {
    return (std::filesystem::path(dataDir) / "config.env").string();
}

std::map<std::string, std::string> ParseConfigEnv(const std::string& filePath) {
    std::map<std::string, std::string> values;
    std::ifstream in(filePath);
    if (!in.is_open()) {
        return values;
    }
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            LOG_DEBUG("Config: ignoring line without '=' in {}", filePath);
            continue;
        }
        std::string key = trim(line.substr(0, eq));
        if (key.empty()) {
            continue;
        }
        values[key] = stripQuotes(trim(line.substr(eq + 1)));
    }
    return values;
}

Config LoadConfig(const std::optional<std::string>& dataDirOverride) {
    Config cfg;
    cfg.dataDir = expandHome(dataDirOverride.value_or(GetEnvOrDefault("UCW_DATA_DIR", defaultDataDir())));

    const auto fileValues = ParseConfigEnv(cfg.ConfigEnvPath());
    auto lookup = [&](const char* key) -> std::optional<std::string> {
        if (auto env = GetEnvOptional(key)) {
            return env;
        }
        auto it = fileValues.find(key);
        if (it != fileValues.end() && !it->second.empty()) {
            return it->second;
        }
        return std::nullopt;
    };

    // A data dir named only in config.env relocates everything else.
    if (!dataDirOverride.has_value() && !GetEnvOptional("UCW_DATA_DIR").has_value()) {
        auto it = fileValues.find("UCW_DATA_DIR");
        if (it != fileValues.end() && !it->second.empty()) {
            cfg.dataDir = expandHome(it->second);
        }
    }

    if (auto v = lookup("UCW_PLATFORM")) cfg.platform = v.value();
    if (auto v = lookup("UCW_LOG_LEVEL")) cfg.logLevel = v.value();
    cfg.logFile = (std::filesystem::path(cfg.LogDir()) / "ucw.log").string();
    if (auto v = lookup("UCW_LOG_FILE")) cfg.logFile = expandHome(v.value());
    if (auto v = lookup("UCW_STORAGE")) cfg.storage = parseStorage(v.value());
    if (auto v = lookup("UCW_RECENT_EVENTS_MAX")) cfg.recentEventsMax = parseSize("UCW_RECENT_EVENTS_MAX", v.value(), cfg.recentEventsMax);
    if (auto v = lookup("UCW_MAX_LINE_BYTES")) cfg.maxLineBytes = parseSize("UCW_MAX_LINE_BYTES", v.value(), cfg.maxLineBytes);
    return cfg;
}

void EnsureDirectories(const Config& cfg) {
    std::filesystem::create_directories(cfg.dataDir);
    std::filesystem::create_directories(cfg.LogDir());
    if (!cfg.logFile.empty()) {
        auto parent = std::filesystem::path(cfg.logFile).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
    }
}

bool WriteDefaultConfigEnv(const Config& cfg) {
    const std::string path = cfg.ConfigEnvPath();
    if (std::filesystem::exists(path)) {
        return false;
    }
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("cannot write " + path);
    }
    out << "# UCW Configuration\n"
        << "# Uncomment and edit as needed. Environment variables take precedence.\n"
        << "\n"
        << "# UCW_PLATFORM=claude-desktop\n"
        << "# UCW_LOG_LEVEL=INFO\n"
        << "# UCW_LOG_FILE=" << cfg.LogDir() << "/ucw.log\n"
        << "# UCW_STORAGE=sqlite\n"
        << "# UCW_RECENT_EVENTS_MAX=1000\n"
        << "# UCW_MAX_LINE_BYTES=65536\n";
    if (!out) {
        throw std::runtime_error("write failed: " + path);
    }
    return true;
}

} // namespace ucw
