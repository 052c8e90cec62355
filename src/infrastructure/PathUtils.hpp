// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace hubingest::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetDatasetsDir();
    static std::filesystem::path GetSettingsPath();
    static std::filesystem::path GetExecutableDir();
};

} // namespace hubingest::infrastructure
