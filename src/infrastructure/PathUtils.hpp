// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace stenodesk::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief <data home>/StenoDesk, created on demand. */
    static std::filesystem::path GetAppDataDir();
    /** @brief <data home>/StenoDesk/models, created on demand. */
    static std::filesystem::path GetModelsDir();
    static std::filesystem::path GetDefaultConfigPath();

    /** @brief Absolute, lexically normal form used as the progress key. */
    static std::string NormalizeMediaPath(const std::string& path);
};

} // namespace stenodesk::infrastructure
