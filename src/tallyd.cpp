// TALLY - Daemon
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// tallyd: loads configuration, opens the ledger store and serves the
// treasury API over HTTP until SIGINT or SIGTERM.

#include "tally/core/types.h"
#include "tally/node/context.h"
#include "tally/rpc/api.h"
#include "tally/rpc/httpserver.h"
#include "tally/util/config.h"
#include "tally/util/logging.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tally {

namespace {

constexpr const char* VERSION = "0.1.0";

std::mutex g_shutdownMutex;
std::condition_variable g_shutdownCondition;

std::unique_ptr<NodeContext> g_node;
std::unique_ptr<rpc::TreasuryApi> g_api;
std::unique_ptr<rpc::HttpServer> g_httpServer;

// ============================================================================
// Signal Handling
// ============================================================================

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        RequestShutdown();
    }
}

void SetupSignalHandlers() {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);
    std::signal(SIGPIPE, SIG_IGN);
}

// ============================================================================
// Help
// ============================================================================

void PrintHelp() {
    std::cout << "TALLY Daemon v" << VERSION << "\n\n";
    std::cout << "Usage: tallyd [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -version                   Show version information\n";
    std::cout << "  -conf=FILE                 Config file (default: <datadir>/tally.conf)\n";
    std::cout << "  -datadir=DIR               Data directory (default: ~/.tally)\n";
    std::cout << "  -environment=NAME          development, staging or mainnet\n";
    std::cout << "                             (default: $APP_ENVIRONMENT or development)\n";
    std::cout << "  -jwtsecret=SECRET          Token secret, 32+ characters\n";
    std::cout << "                             (default: $GUARDIAN_JWT_SECRET)\n";
    std::cout << "  -nftmintvalue=AMOUNT       NFT mint value, must be 0 outside mainnet\n";
    std::cout << "  -seeddefaults=0/1          Seed demo accounts and rule (default: 1)\n";
    std::cout << "\nContention Options:\n";
    std::cout << "  -retryattempts=N           Attempts per unit of work (default: 5)\n";
    std::cout << "  -retrybasems=N             First backoff delay (default: 2)\n";
    std::cout << "  -retrymaxms=N              Backoff cap (default: 50)\n";
    std::cout << "  -locktimeoutms=N           Account lock wait (default: 2000)\n";
    std::cout << "\nHTTP Options:\n";
    std::cout << "  -httpbind=ADDR             Bind address (default: 127.0.0.1)\n";
    std::cout << "  -httpport=PORT             Port (default: " << rpc::DEFAULT_HTTP_PORT << ")\n";
    std::cout << "  -httpthreads=N             Worker threads (default: 4)\n";
    std::cout << "  -maxrequestsize=N          Max request bytes (default: 1048576)\n";
    std::cout << "\nLogging Options:\n";
    std::cout << "  -loglevel=LEVEL            trace, debug, info, warn, error\n";
    std::cout << "  -debug=CATEGORY[,..]       Only log these categories\n";
    std::cout << "  -printtoconsole=0/1        Print to console (default: 1)\n";
    std::cout << "  -logfile=FILE              Also append log output to FILE\n";
    std::cout << "\n";
}

// ============================================================================
// Logging
// ============================================================================

void SetupLogging(const util::ConfigManager& config) {
    namespace ConfigKeys = util::ConfigKeys;

    auto& logger = util::Logger::Instance();
    logger.Initialize();
    logger.ClearSinks();

    util::LogLevel level = util::LogLevelFromString(config.GetString(ConfigKeys::LOGLEVEL, "info"));
    logger.SetLevel(level);

    if (config.GetBool(ConfigKeys::PRINTTOCONSOLE, true)) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        consoleConfig.useColors = true;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    std::string logFile = config.GetPath(ConfigKeys::LOGFILE);
    if (!logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = logFile;
        fileConfig.level = util::LogLevel::Debug;
        auto fileSink = std::make_shared<util::FileSink>(fileConfig);
        if (fileSink->IsOpen()) {
            logger.AddSink(fileSink);
        } else {
            std::cerr << "Warning: cannot open log file " << logFile << "\n";
        }
    }

    std::string categories = config.GetString(ConfigKeys::DEBUG, "");
    size_t start = 0;
    while (start < categories.size()) {
        size_t comma = categories.find(',', start);
        if (comma == std::string::npos) comma = categories.size();
        std::string category = categories.substr(start, comma - start);
        if (!category.empty()) {
            logger.EnableCategory(category);
        }
        start = comma + 1;
    }
}

// ============================================================================
// HTTP
// ============================================================================

bool StartHttpServer(const util::ConfigManager& config) {
    namespace ConfigKeys = util::ConfigKeys;

    rpc::HttpServerConfig httpConfig;
    httpConfig.bindAddress = config.GetString(ConfigKeys::HTTPBIND, httpConfig.bindAddress);
    int64_t port = config.GetInt(ConfigKeys::HTTPPORT, rpc::DEFAULT_HTTP_PORT);
    int64_t threads = config.GetInt(ConfigKeys::HTTPTHREADS,
                                    static_cast<int64_t>(httpConfig.threadPoolSize));
    int64_t maxRequest = config.GetInt(ConfigKeys::MAXREQUESTSIZE,
                                       static_cast<int64_t>(httpConfig.maxRequestSize));
    if (port < 0 || port > 65535 || threads < 1 || maxRequest < 1024) {
        LOG_ERROR(util::LogCategory::HTTP) << "Invalid HTTP settings (port " << port
                                           << ", threads " << threads << ", max request "
                                           << maxRequest << ")";
        return false;
    }
    httpConfig.port = static_cast<uint16_t>(port);
    httpConfig.threadPoolSize = static_cast<size_t>(threads);
    httpConfig.maxRequestSize = static_cast<size_t>(maxRequest);

    g_api = std::make_unique<rpc::TreasuryApi>(*g_node);
    rpc::TreasuryApi* api = g_api.get();
    g_httpServer = std::make_unique<rpc::HttpServer>(
        httpConfig, [api](const rpc::HttpRequest& request) { return api->Handle(request); });
    return g_httpServer->Start();
}

void WaitForShutdown() {
    std::unique_lock<std::mutex> lock(g_shutdownMutex);
    while (!ShutdownRequested()) {
        g_shutdownCondition.wait_for(lock, std::chrono::milliseconds(200));
    }
}

void Shutdown() {
    LOG_INFO(util::LogCategory::DEFAULT) << "Shutting down...";

    if (g_httpServer) {
        g_httpServer->Stop();
        g_httpServer.reset();
    }
    g_api.reset();

    if (g_node) {
        ShutdownNode(*g_node);
        g_node.reset();
    }

    LOG_INFO(util::LogCategory::DEFAULT) << "Shutdown complete";
    util::Logger::Instance().Shutdown();
}

} // namespace

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;
    std::vector<std::string> positional;
    auto parsed = config.ParseCommandLine(argc, argv, &positional);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << std::endl;
        return 1;
    }
    if (config.GetBool("help", false) || config.GetBool("h", false)) {
        PrintHelp();
        return 0;
    }
    if (config.GetBool("version", false)) {
        std::cout << "TALLY Daemon v" << VERSION << "\n";
        return 0;
    }
    if (!positional.empty()) {
        std::cerr << "Error: unexpected argument '" << positional.front() << "'" << std::endl;
        return 1;
    }

    parsed = config.LoadConfigFile();
    if (!parsed.success) {
        std::cerr << "Error reading config: " << parsed.ToString() << std::endl;
        return 1;
    }

    SetupLogging(config);
    LOG_INFO(util::LogCategory::DEFAULT) << "TALLY Daemon v" << VERSION << " starting...";
    LOG_DEBUG(util::LogCategory::DEFAULT) << "Configuration:\n" << config.Dump();

    NodeInitOptions options;
    std::string error;
    if (!LoadNodeOptions(config, options, error)) {
        LOG_ERROR(util::LogCategory::DEFAULT) << error;
        util::Logger::Instance().Shutdown();
        return 1;
    }
    LOG_INFO(util::LogCategory::DEFAULT) << "Data directory: " << options.dataDir.string();

    SetupSignalHandlers();

    g_node = std::make_unique<NodeContext>();
    if (!InitializeNode(*g_node, options)) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Node initialization failed";
        Shutdown();
        return 1;
    }

    if (!StartHttpServer(config)) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Failed to start HTTP server";
        Shutdown();
        return 1;
    }

    LOG_INFO(util::LogCategory::DEFAULT) << "TALLY Daemon started successfully";
    WaitForShutdown();
    Shutdown();
    return 0;
}

} // namespace tally

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return tally::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
