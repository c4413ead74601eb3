// TALLY CLI - Command Line Interface
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// The tally-cli tool sends requests to a running tallyd over HTTP and can
// sign guardian tokens locally from the shared secret.

#include "tally/auth/gate.h"
#include "tally/ledger/errors.h"
#include "tally/ledger/types.h"
#include "tally/rpc/httpclient.h"
#include "tally/util/config.h"
#include "tally/util/json.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <getopt.h>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace tally {
namespace cli {

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "TALLY CLI";

// ============================================================================
// CLI Configuration
// ============================================================================

struct CLIConfig {
    std::string host{"127.0.0.1"};
    uint16_t port{rpc::DEFAULT_HTTP_PORT};
    int timeout{30};
    std::string token;
    std::string jwtSecret;
    std::string configFile;
    bool rawOutput{false};

    bool showHelp{false};
    bool showVersion{false};

    std::vector<std::string> args;
};

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: tally-cli [options] <METHOD> <PATH> [json-body]\n";
    std::cout << "       tally-cli [options] token <subject> [role] [ttl-seconds]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  -c, --conf=FILE            Config file (reads httpbind, httpport, jwtsecret)\n";
    std::cout << "  --rpcconnect=HOST          Server host (default: 127.0.0.1)\n";
    std::cout << "  --httpport=PORT            Server port (default: " << rpc::DEFAULT_HTTP_PORT
              << ")\n";
    std::cout << "  --timeout=SECONDS          Request timeout (default: 30)\n";
    std::cout << "  --token=TOKEN              Bearer token for guardian routes\n";
    std::cout << "  --jwtsecret=SECRET         Secret for the token command\n";
    std::cout << "                             (default: $GUARDIAN_JWT_SECRET)\n";
    std::cout << "  --raw                      Print the body unformatted\n";
    std::cout << "\nExamples:\n";
    std::cout << "  tally-cli GET /treasury/status\n";
    std::cout << "  tally-cli POST /transactions '{\"transaction_type\":\"DEPOSIT\","
                 "\"amount\":\"100.00\",\"to_account\":\"main_operating\"}'\n";
    std::cout << "  tally-cli token ops-admin guardian 600\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 TALLY Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Command Line Parsing
// ============================================================================

bool ParsePort(const std::string& text, uint16_t& port) {
    if (text.empty() || text.size() > 5 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    unsigned long value = std::stoul(text);
    if (value == 0 || value > 65535) {
        return false;
    }
    port = static_cast<uint16_t>(value);
    return true;
}

bool ParseCommandLine(int argc, char* argv[], CLIConfig& config) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"conf", required_argument, nullptr, 'c'},
        {"rpcconnect", required_argument, nullptr, 1001},
        {"httpport", required_argument, nullptr, 1002},
        {"timeout", required_argument, nullptr, 1003},
        {"token", required_argument, nullptr, 1004},
        {"jwtsecret", required_argument, nullptr, 1005},
        {"raw", no_argument, nullptr, 1006},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;
    optind = 1;

    // '+' stops at the first positional so JSON bodies pass through untouched
    while ((opt = getopt_long(argc, argv, "+hvc:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return true;
            case 'v':
                config.showVersion = true;
                return true;
            case 'c':
                config.configFile = optarg;
                break;
            case 1001:
                config.host = optarg;
                break;
            case 1002:
                if (!ParsePort(optarg, config.port)) {
                    std::cerr << "Error: invalid port '" << optarg << "'\n";
                    return false;
                }
                break;
            case 1003:
                config.timeout = std::atoi(optarg);
                if (config.timeout <= 0) {
                    std::cerr << "Error: invalid timeout '" << optarg << "'\n";
                    return false;
                }
                break;
            case 1004:
                config.token = optarg;
                break;
            case 1005:
                config.jwtSecret = optarg;
                break;
            case 1006:
                config.rawOutput = true;
                break;
            case '?':
            default:
                return false;
        }
    }

    for (int i = optind; i < argc; ++i) {
        config.args.push_back(argv[i]);
    }
    return true;
}

/// Fill connection settings the command line left unset from a config file
bool LoadConfigFile(CLIConfig& config) {
    if (config.configFile.empty()) {
        return true;
    }
    util::ConfigManager file;
    auto result = file.ParseFile(config.configFile);
    if (!result.success) {
        std::cerr << "Error reading config: " << result.ToString() << "\n";
        return false;
    }
    if (config.host == "127.0.0.1") {
        config.host = file.GetString(util::ConfigKeys::HTTPBIND, config.host);
    }
    if (config.port == rpc::DEFAULT_HTTP_PORT) {
        int64_t port = file.GetInt(util::ConfigKeys::HTTPPORT, rpc::DEFAULT_HTTP_PORT);
        if (port <= 0 || port > 65535) {
            std::cerr << "Error: invalid httpport in " << config.configFile << "\n";
            return false;
        }
        config.port = static_cast<uint16_t>(port);
    }
    if (config.jwtSecret.empty()) {
        config.jwtSecret = file.GetString(util::ConfigKeys::JWTSECRET, "");
    }
    return true;
}

// ============================================================================
// Commands
// ============================================================================

int IssueToken(const CLIConfig& config) {
    if (config.args.size() < 2 || config.args.size() > 4) {
        std::cerr << "Usage: tally-cli token <subject> [role] [ttl-seconds]\n";
        return 1;
    }
    std::string secret = config.jwtSecret;
    if (secret.empty()) {
        if (const char* fromEnv = std::getenv(util::ConfigEnv::JWT_SECRET)) {
            secret = fromEnv;
        }
    }
    std::string role = config.args.size() > 2 ? config.args[2] : ledger::GUARDIAN_ROLE;
    int64_t ttl = auth::DEFAULT_TOKEN_TTL;
    if (config.args.size() > 3) {
        try {
            ttl = std::stoll(config.args[3]);
        } catch (const std::exception&) {
            std::cerr << "Error: invalid ttl '" << config.args[3] << "'\n";
            return 1;
        }
    }

    try {
        auth::AccessGate gate(secret);
        std::cout << gate.IssueToken(config.args[1], role, ttl) << "\n";
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

int ExecuteRequest(const CLIConfig& config) {
    if (config.args.size() < 2 || config.args.size() > 3) {
        std::cerr << "Error: expected <METHOD> <PATH> [json-body]\n";
        std::cerr << "Use 'tally-cli --help' for usage information.\n";
        return 1;
    }
    std::string method = config.args[0];
    std::transform(method.begin(), method.end(), method.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    const std::string& target = config.args[1];
    if (target.empty() || target[0] != '/') {
        std::cerr << "Error: path must start with '/'\n";
        return 1;
    }

    std::string body;
    if (config.args.size() == 3) {
        if (!util::JSONValue::TryParse(config.args[2])) {
            std::cerr << "Error: request body is not valid JSON\n";
            return 1;
        }
        body = config.args[2];
    }

    rpc::HttpClientConfig clientConfig;
    clientConfig.host = config.host;
    clientConfig.port = config.port;
    clientConfig.timeout = config.timeout;
    clientConfig.bearerToken = config.token;
    rpc::HttpClient client(clientConfig);

    rpc::HttpResponse response;
    try {
        response = client.Request(method, target, body);
    } catch (const std::runtime_error& e) {
        std::cerr << "error: " << e.what() << "\n";
        std::cerr << "Make sure tallyd is running on " << config.host << ":" << config.port
                  << ".\n";
        return 1;
    }

    auto parsed = util::JSONValue::TryParse(response.body);
    std::ostream& out = response.status >= 400 ? std::cerr : std::cout;
    if (response.status >= 400) {
        out << "status: " << response.status << " " << rpc::StatusText(response.status) << "\n";
    }
    if (parsed && !config.rawOutput) {
        out << parsed->ToJSON(true) << "\n";
    } else if (!response.body.empty()) {
        out << response.body << "\n";
    }
    return response.status >= 400 ? 1 : 0;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    CLIConfig config;

    if (!ParseCommandLine(argc, argv, config)) {
        std::cerr << "Error parsing command line. Use --help for usage.\n";
        return 1;
    }
    if (config.showHelp) {
        PrintHelp();
        return 0;
    }
    if (config.showVersion) {
        PrintVersion();
        return 0;
    }
    if (config.args.empty()) {
        std::cerr << "Error: No command specified.\n";
        std::cerr << "Use 'tally-cli --help' for usage information.\n";
        return 1;
    }
    if (!LoadConfigFile(config)) {
        return 1;
    }

    if (config.args[0] == "token") {
        return IssueToken(config);
    }
    return ExecuteRequest(config);
}

} // namespace cli
} // namespace tally

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return tally::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
