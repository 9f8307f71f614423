#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>

struct Config {
    struct Server {
        std::string host = "127.0.0.1";
        int port = 8090;
        std::vector<int> fallbackPorts = {8091, 8092};
        size_t listenerThreads = 24;  // must exceed maxQueueSize or capacity rejections never happen
        bool autoStart = true;
    } server;

    struct Bridge {
        size_t maxQueueSize = 20;
        size_t batchSize = 10;
        int requestTimeoutMs = 30000;
        int staleRequestAgeMs = 25000;
        size_t maxResponseBytes = 50 * 1024;
    } bridge;

    struct Tools {
        int slowThresholdMs = 2000;
        int defaultTimeoutMs = 15000;
        int buildTimeoutMs = 30000;
        std::vector<std::string> buildTools = {"wait_for_build", "ensure_ready"};
    } tools;

    struct Build {
        int pollIntervalMs = 50;
        int refreshGraceMs = 100;
        size_t maxDiagnostics = 100;
    } build;

    struct Logging {
        std::string file = "tether.log";
        bool debug = false;
    } logging;

    static Config defaults() { return Config{}; }

    // Counts are read signed so a negative value is rejected instead of wrapping
    static size_t positiveCount(const nlohmann::json& section, const char* key, size_t fallback) {
        long long value = section.value(key, static_cast<long long>(fallback));
        if (value <= 0) {
            throw std::runtime_error(std::string(key) + " must be positive");
        }
        return static_cast<size_t>(value);
    }

    static Config fromJson(const nlohmann::json& j) {
        Config cfg;
        if (!j.is_object()) {
            throw std::runtime_error("Config root must be a JSON object");
        }

        if (j.contains("server")) {
            const auto& s = j.at("server");
            cfg.server.host = s.value("host", cfg.server.host);
            cfg.server.port = s.value("port", cfg.server.port);
            cfg.server.fallbackPorts = s.value("fallback_ports", cfg.server.fallbackPorts);
            cfg.server.listenerThreads = positiveCount(s, "listener_threads", cfg.server.listenerThreads);
            cfg.server.autoStart = s.value("auto_start", cfg.server.autoStart);
        }

        if (j.contains("bridge")) {
            const auto& b = j.at("bridge");
            cfg.bridge.maxQueueSize = positiveCount(b, "max_queue_size", cfg.bridge.maxQueueSize);
            cfg.bridge.batchSize = positiveCount(b, "batch_size", cfg.bridge.batchSize);
            cfg.bridge.requestTimeoutMs = b.value("request_timeout_ms", cfg.bridge.requestTimeoutMs);
            cfg.bridge.staleRequestAgeMs = b.value("stale_request_age_ms", cfg.bridge.staleRequestAgeMs);
            cfg.bridge.maxResponseBytes = b.value("max_response_bytes", cfg.bridge.maxResponseBytes);
        }

        if (j.contains("tools")) {
            const auto& t = j.at("tools");
            cfg.tools.slowThresholdMs = t.value("slow_threshold_ms", cfg.tools.slowThresholdMs);
            cfg.tools.defaultTimeoutMs = t.value("default_timeout_ms", cfg.tools.defaultTimeoutMs);
            cfg.tools.buildTimeoutMs = t.value("build_timeout_ms", cfg.tools.buildTimeoutMs);
            if (t.contains("build_tools")) {
                cfg.tools.buildTools = t["build_tools"].get<std::vector<std::string>>();
            }
        }

        if (j.contains("build")) {
            const auto& b = j.at("build");
            cfg.build.pollIntervalMs = b.value("poll_interval_ms", cfg.build.pollIntervalMs);
            cfg.build.refreshGraceMs = b.value("refresh_grace_ms", cfg.build.refreshGraceMs);
            cfg.build.maxDiagnostics = b.value("max_diagnostics", cfg.build.maxDiagnostics);
        }

        if (j.contains("logging")) {
            const auto& l = j.at("logging");
            cfg.logging.file = l.value("file", cfg.logging.file);
            cfg.logging.debug = l.value("debug", cfg.logging.debug);
        }

        if (cfg.build.pollIntervalMs <= 0) {
            throw std::runtime_error("build.poll_interval_ms must be positive");
        }
        return cfg;
    }

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }

        try {
            return fromJson(j);
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid config value in " + path.string() + ": " + e.what());
        }
    }
};
