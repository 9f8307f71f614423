#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#ifdef _WIN32
    #define NOMINMAX
    #include <winsock2.h>
#endif
#include "core/ConfigManager.h"
#include "server/BridgeServer.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

// ANSI Color Codes
const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string RED = "\033[38;5;196m";
const std::string GREEN = "\033[38;5;46m";
const std::string CYAN = "\033[38;5;51m";
const std::string GRAY = "\033[38;5;242m";

namespace {
std::atomic<bool> g_stopRequested{false};

void handleSignal(int) {
    g_stopRequested.store(true);
}

void printUsage() {
    std::cout << "Usage: tether [config.json]" << std::endl;
    std::cout << GRAY << "  Without an argument, ./config.json is used when present, otherwise built-in defaults." << RESET << std::endl;
}

// Tools a host would normally contribute; this executable only hosts the bridge
std::vector<ToolDescriptor> demoTools(BridgeServer& server, const std::chrono::steady_clock::time_point& startedAt) {
    ToolDescriptor echo;
    echo.name = "echo";
    echo.description = "Return the given text unchanged";
    echo.category = "Demo";
    echo.readOnly = true;
    echo.params = {{"text", "string", "Text to echo back", true}};
    echo.handler = [](const nlohmann::json& args) -> nlohmann::json {
        return {{"text", args.at("text")}};
    };

    ToolDescriptor hostInfo;
    hostInfo.name = "host_info";
    hostInfo.description = "Describe the running host process";
    hostInfo.category = "Demo";
    hostInfo.readOnly = true;
    hostInfo.handler = [&server, startedAt](const nlohmann::json&) -> nlohmann::json {
        auto uptime = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startedAt).count();
        return {
            {"name", "tether"},
            {"port", server.getPort()},
            {"uptimeMs", uptime},
            {"hostThreadTicks", server.getDispatcher().getStats().ticks},
            {"workingDirectory", fs::current_path().u8string()}
        };
    };

    return {echo, hostInfo};
}
} // namespace

int main(int argc, char* argv[]) {
#ifdef _WIN32
    WSADATA wsaData;
    if (WSAStartup(MAKEWORD(2, 2), &wsaData) != 0) {
        std::cerr << "Failed to initialize Winsock." << std::endl;
        return 1;
    }
#endif

    std::string configPath;
    if (argc >= 2) {
        std::string arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        }
        configPath = arg;
    } else if (fs::exists(fs::u8path("config.json"))) {
        configPath = "config.json";
    }

    Config cfg = Config::defaults();
    if (!configPath.empty() && !fs::exists(fs::u8path(configPath))) {
        Logger::getInstance().warn("[Tether] Config file not found: " + configPath + ", using defaults");
        configPath.clear();
    } else if (!configPath.empty()) {
        try {
            cfg = Config::load(configPath);
            std::cout << GREEN << "✔ Loaded configuration from: " << BOLD << configPath << RESET << std::endl;
        } catch (const std::exception& e) {
            std::cerr << RED << "✖ Failed to load config: " << e.what() << RESET << std::endl;
            printUsage();
            return 1;
        }
    } else if (argc < 2) {
        std::cout << GRAY << "  (No config.json found, using defaults)" << RESET << std::endl;
    }

    Logger::getInstance().setLogFile(cfg.logging.file);
    if (cfg.logging.debug) {
        Logger::getInstance().setDebugEnabled(true);
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    try {
        BridgeServer server(cfg);
        auto startedAt = std::chrono::steady_clock::now();
        server.getRegistry().registerSource("demo", [&server, startedAt] {
            return demoTools(server, startedAt);
        });

        if (cfg.server.autoStart && !server.start()) {
            Logger::getInstance().error("[Tether] Could not bind any port, exiting");
            return 1;
        }

        std::cout << CYAN << "Tether bridge running, press Ctrl+C to stop" << RESET << std::endl;

        // Host loop: the only thread that runs tools
        const auto tick = std::chrono::milliseconds(16);
        while (!g_stopRequested.load()) {
            auto frameStart = std::chrono::steady_clock::now();
            server.publishHostStatus(BridgeServer::HostStatus{});
            server.pump();
            std::this_thread::sleep_until(frameStart + tick);
        }

        Logger::getInstance().info("[Tether] Shutdown requested");
        server.stop();
    } catch (const std::exception& e) {
        Logger::getInstance().error("FATAL ERROR: " + std::string(e.what()));
        std::cerr << "\n" << RED << BOLD << "█ FATAL ERROR: " << RESET << e.what() << std::endl;
        return 1;
    }

#ifdef _WIN32
    WSACleanup();
#endif
    return 0;
}
