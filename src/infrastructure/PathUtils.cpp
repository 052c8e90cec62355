#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace hubingest::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetDatasetsDir() {
    return GetDataHome() / "HubIngest" / "datasets";
}

fs::path PathUtils::GetSettingsPath() {
    return GetConfigHome() / "HubIngest" / "settings.json";
}

fs::path PathUtils::GetExecutableDir() {
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec || exe.empty()) {
        return fs::current_path();
    }
    return exe.parent_path();
}

} // namespace hubingest::infrastructure
