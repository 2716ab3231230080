/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace stenodesk::infrastructure {

using json = nlohmann::json;

namespace {

template <typename T>
void Read(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j[key].is_null()) {
        target = j[key].get<T>();
    }
}

StenoDeskConfig Parse(const json& j) {
    StenoDeskConfig config;
    Read(j, "data_dir", config.dataDir);

    if (j.contains("http") && j["http"].is_object()) {
        const auto& http = j["http"];
        Read(http, "host", config.httpHost);
        Read(http, "port", config.httpPort);
    }

    if (j.contains("engine") && j["engine"].is_object()) {
        const auto& engine = j["engine"];
        Read(engine, "kind", config.engineKind);
        Read(engine, "model_path", config.modelPath);
        Read(engine, "language", config.language);
        Read(engine, "threads", config.threads);
        Read(engine, "interpreter", config.interpreter);
        Read(engine, "script_path", config.scriptPath);
    }

    if (j.contains("scheduler") && j["scheduler"].is_object()) {
        const auto& scheduler = j["scheduler"];
        Read(scheduler, "queue_poll_ms", config.queuePollMs);
        Read(scheduler, "snapshot_every_segments", config.snapshotEverySegments);
        Read(scheduler, "snapshot_interval_ms", config.snapshotIntervalMs);
        Read(scheduler, "cancel_timeout_ms", config.cancelTimeoutMs);
        Read(scheduler, "stop_all_timeout_ms", config.stopAllTimeoutMs);
        Read(scheduler, "lease_stale_seconds", config.leaseStaleSeconds);
        Read(scheduler, "lease_heartbeat_seconds", config.leaseHeartbeatSeconds);
    }
    return config;
}

} // namespace

StenoDeskConfig ConfigLoader::FromJsonText(const std::string& text) {
    return Parse(json::parse(text));
}

StenoDeskConfig ConfigLoader::Load(const std::string& configPath) {
    if (!std::filesystem::exists(configPath)) {
        std::cout << "[ConfigLoader] " << configPath << " not found, using defaults." << std::endl;
        return StenoDeskConfig{};
    }

    try {
        std::ifstream f(configPath);
        json j;
        f >> j;
        return Parse(j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
    }

    return StenoDeskConfig{};
}

} // namespace stenodesk::infrastructure
