#include "resources.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <vector>

#include <unistd.h>
#include <climits>

namespace fs = std::filesystem;

// Directory of the running binary (cwd when /proc is unavailable)
static fs::path executableDir() {
    char buffer[PATH_MAX];
    ssize_t n = ::readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (n <= 0) return fs::current_path();
    buffer[n] = '\0';
    return fs::path(buffer).parent_path();
}

// -------------------------------------------------------------
// Locate resource root
// -------------------------------------------------------------
std::string getResourcePath() {
    std::vector<fs::path> candidates;
#if defined(ARIA_PORTABLE_ONLY)
    candidates.push_back(executableDir() / "resources");
    candidates.push_back(executableDir());
#else
    // 🔹 Project resources first (running from build/), then ./resources
    candidates.push_back(fs::current_path().parent_path() / "resources");
    candidates.push_back(fs::current_path() / "resources");
    candidates.push_back(executableDir() / "resources");
#endif

    std::error_code ec;
    for (const auto& dir : candidates) {
        if (fs::is_directory(dir, ec)) {
            LOG_TRACE("Resources", "Using resource path: " + dir.string());
            return dir.string();
        }
    }

    // Last resort: current working directory
    LOG_DEBUG("Resources", "No resources/ found, falling back to cwd: " + fs::current_path().string());
    return fs::current_path().string();
}

// -------------------------------------------------------------
// Data paths
// -------------------------------------------------------------
static std::string pathSetting(const nlohmann::json& cfg, const std::string& key,
                               const std::string& fallback) {
    if (cfg.is_object() && cfg.contains("paths") && cfg["paths"].is_object()) {
        const auto& p = cfg["paths"];
        if (p.contains(key) && p[key].is_string() && !p[key].get<std::string>().empty()) {
            return p[key].get<std::string>();
        }
    }
    return fallback;
}

fs::path dataDirectory(const nlohmann::json& cfg) {
    fs::path dir = pathSetting(cfg, "data_dir", "Data");
    if (dir.is_relative()) dir = fs::current_path() / dir;
    return dir;
}

fs::path dataFile(const nlohmann::json& cfg, const std::string& key, const std::string& fallback) {
    fs::path p = pathSetting(cfg, key, fallback);
    if (p.is_absolute()) return p;
    return dataDirectory(cfg) / p;
}
