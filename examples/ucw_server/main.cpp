//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: ucw command line: stdio capture server plus setup and status commands
//==========================================================================================================

#include <unistd.h>
#include <csignal>
#include <cstdlib>
#include <cstddef>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "ucw/CaptureTools.h"
#include "ucw/Config.h"
#include "ucw/EnrichmentHook.h"
#include "ucw/MemoryPersistenceSink.hpp"
#include "ucw/Server.h"
#include "ucw/SqlitePersistenceSink.hpp"
#include "ucw/StdioTransport.hpp"

using namespace ucw;

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--data-dir")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

// First argument that is not an option; "server" when none is given.
static std::string getCommand(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == nullptr) {
            continue;
        }
        std::string a = argv[i];
        if (a == "--version" || a == "-V") {
            return "version";
        }
        if (a == "--help" || a == "-h") {
            return "help";
        }
        if (!a.empty() && a[0] != '-') {
            return a;
        }
    }
    return "server";
}

static std::string selfExecutablePath(const char* argv0) {
    std::error_code ec;
    auto p = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        return p.string();
    }
    return (argv0 != nullptr) ? std::string(argv0) : std::string("ucw");
}

static void printUsage() {
    std::cout << "Usage: ucw [command] [--data-dir=PATH]\n\n"
              << "Commands:\n"
              << "  server      Start the MCP capture server on stdio (default)\n"
              << "  init        Create the data directory and a config.env template\n"
              << "  status      Show configuration and capture totals\n"
              << "  mcp-config  Print the client configuration snippet\n"
              << "  version     Print the version\n";
}

static int runInit(const Config& cfg) {
    try {
        EnsureDirectories(cfg);
        const bool created = WriteDefaultConfigEnv(cfg);
        std::cout << "UCW initialized at " << cfg.dataDir << "\n"
                  << "  Config:  " << cfg.ConfigEnvPath() << (created ? "" : " (kept existing)") << "\n"
                  << "  Logs:    " << cfg.LogDir() << "\n"
                  << "  Capture: " << cfg.DatabasePath() << "\n\n"
                  << "Next: run `ucw mcp-config` and add the snippet to your client settings.\n";
    } catch (const std::exception& e) {
        std::cerr << "ucw init failed: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

static int runStatus(const Config& cfg) {
    std::cout << "UCW Status\n"
              << "========================================\n"
              << "Data dir: " << cfg.dataDir << "\n"
              << "Platform: " << cfg.platform << "\n"
              << "Storage:  " << StorageKindName(cfg.storage) << "\n";
    const std::string database = cfg.DatabasePath();
    if (!std::filesystem::exists(database)) {
        std::cout << "\nNo capture database found. Run `ucw init` and start a session first.\n";
        return 0;
    }
    CaptureSummary summary;
    try {
        summary = SummarizeCaptureDatabase(database);
    } catch (const std::exception& e) {
        std::cerr << "Cannot read " << database << ": " << e.what() << "\n";
        return 1;
    }
    std::cout << "\nEvents:   " << summary.eventCount << "\n"
              << "Sessions: " << summary.sessionCount << "\n"
              << "Bytes:    " << summary.bytesCaptured << "\n";
    if (!summary.lastSessionId.empty()) {
        std::cout << "Last:     " << summary.lastSessionId << "\n";
    }
    if (!summary.gutSignals.empty()) {
        std::cout << "\nGut Signals:\n";
        for (const auto& [signal, count] : summary.gutSignals) {
            std::cout << "  " << signal << ": " << count << "\n";
        }
    }
    return 0;
}

static int runMcpConfig(const char* argv0) {
    JSONValue server = MakeObject({
        {"command", JSONValue(selfExecutablePath(argv0))},
        {"args", MakeArray({JSONValue("server")})}
    });
    JSONValue config = MakeObject({
        {"mcpServers", MakeObject({{"ucw", server}})}
    });
    std::cout << "Add this to your client settings:\n\n" << SerializeJSONValue(config) << "\n";
    return 0;
}

static int runServer(const Config& cfg) {
    FUNC_SCOPE();
    std::signal(SIGPIPE, SIG_IGN);

    try {
        EnsureDirectories(cfg);
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot create data directories: {}", e.what());
    }
    if (!cfg.logFile.empty() && !Logger::setLogFile(cfg.logFile)) {
        LOG_WARN("Cannot open log file {}; logging to stderr only", cfg.logFile);
    }
    LOG_INFO("ucw {} (platform={} storage={} data_dir={} log_level={})", SERVER_VERSION, cfg.platform,
             StorageKindName(cfg.storage), cfg.dataDir, Logger::levelName(Logger::sLogLevel));

    auto transport = std::make_unique<StdioTransport>();
    transport->SetMaxLineBytes(cfg.maxLineBytes);

    Server server(std::move(transport), cfg.recentEventsMax);
    server.Capture().SetEnrichmentHook(std::make_shared<DataLayerEnricher>());
    RegisterCaptureTools(server.Router(), server.Capture());

    CaptureEngine& engine = server.Capture();
    switch (cfg.storage) {
        case StorageKind::Sqlite: {
            const std::string path = cfg.DatabasePath();
            const std::string platform = cfg.platform;
            server.SetResourceInitializer([&engine, path, platform](std::stop_token st) {
                auto sink = std::make_shared<SqlitePersistenceSink>(path, platform);
                sink->Open();
                if (st.stop_requested()) {
                    return;
                }
                engine.SetPersistenceSink(sink);
            });
            break;
        }
        case StorageKind::Memory: {
            const std::string platform = cfg.platform;
            server.SetResourceInitializer([&engine, platform](std::stop_token) {
                engine.SetPersistenceSink(std::make_shared<MemoryPersistenceSink>(platform));
            });
            break;
        }
        case StorageKind::None:
            LOG_INFO("Persistence disabled");
            break;
    }

    server.EnableSignalHandling();
    int rc = 0;
    try {
        server.Run().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Server failed: {}", e.what());
        rc = 1;
    }
    Logger::closeLogFile();
    return rc;
}

int main(int argc, char** argv) {
    // stdout carries protocol frames only; route console logging to stderr.
    ::setenv("UCW_STDIO_MODE", "1", 1);

    const std::string command = getCommand(argc, argv);
    const Config cfg = LoadConfig(getArgValue(argc, argv, "--data-dir"));
    Logger::setLogLevelFromString(cfg.logLevel);

    if (command == "server") {
        return runServer(cfg);
    }
    if (command == "init") {
        return runInit(cfg);
    }
    if (command == "status") {
        return runStatus(cfg);
    }
    if (command == "mcp-config") {
        return runMcpConfig(argc > 0 ? argv[0] : nullptr);
    }
    if (command == "version") {
        std::cout << SERVER_NAME << " " << SERVER_VERSION << " (protocol " << PROTOCOL_VERSION << ")\n";
        return 0;
    }
    if (command == "help") {
        printUsage();
        return 0;
    }
    std::cerr << "Unknown command: " << command << "\n";
    printUsage();
    return 2;
}
