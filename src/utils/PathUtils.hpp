#pragma once

#include <filesystem>
#include <string>
#include <cstdlib>

namespace reelq::utils {

namespace fs = std::filesystem;

class PathUtils {
public:
    static fs::path getAppDataPath() {
#ifdef _WIN32
        const char* appData = std::getenv("APPDATA");
        return appData ? fs::path(appData) : fs::current_path();
#elif defined(__APPLE__)
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / "Library" / "Application Support" : fs::current_path();
#else
        const char* xdg = std::getenv("XDG_DATA_HOME");
        if (xdg && *xdg) {
            return fs::path(xdg);
        }
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / ".local" / "share" : fs::current_path();
#endif
    }

    static fs::path getDataPath() {
        return getAppDataPath() / "reelq";
    }

    static fs::path getConfigPath() {
        return getDataPath() / "config.json";
    }

    /**
     * True if path names an existing regular file. Never throws.
     */
    static bool isExistingFile(const std::string& path) {
        if (path.empty()) {
            return false;
        }
        std::error_code ec;
        return fs::is_regular_file(fs::path(path), ec);
    }
};

} // namespace reelq::utils
