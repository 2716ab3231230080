/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the service configuration (settings.json).
 * 
 * Keeps JSON parsing of settings in one place instead of scattering it
 * through the composition root.
 */

#pragma once

#include <string>

namespace stenodesk::infrastructure {

/**
 * @struct StenoDeskConfig
 * @brief Every tunable of the service, with its default.
 */
struct StenoDeskConfig {
    std::string dataDir; ///< Empty means <XDG data home>/StenoDesk.

    std::string httpHost = "127.0.0.1";
    int httpPort = 8765;

    std::string engineKind = "whisper_cpp"; ///< "whisper_cpp" or "script".
    std::string modelPath;                  ///< Empty means <models dir>/ggml-base.bin.
    std::string language = "auto";
    int threads = 0;                        ///< 0 means all cores.
    std::string interpreter = "python3";
    std::string scriptPath;

    int queuePollMs = 250;
    int snapshotEverySegments = 5;
    int snapshotIntervalMs = 2000;
    int cancelTimeoutMs = 1500;
    int stopAllTimeoutMs = 500;
    int leaseStaleSeconds = 30;
    int leaseHeartbeatSeconds = 10;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json. Missing keys keep their defaults.
     * @param configPath Absolute path to the file. A missing or unreadable file yields the defaults.
     */
    static StenoDeskConfig Load(const std::string& configPath);

    /** @brief Parses an already loaded document. */
    static StenoDeskConfig FromJsonText(const std::string& text);
};

} // namespace stenodesk::infrastructure
