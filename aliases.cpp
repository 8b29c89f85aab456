#include "aliases.hpp"
#include "commands/commands_helpers.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <map>
#include <mutex>

namespace fs = std::filesystem;

// ------------------------------------------------------------
// Globals
// ------------------------------------------------------------
static std::map<std::string, std::string> g_aliases;   // lower-cased alias → target
static std::mutex g_aliasMutex;

// ------------------------------------------------------------
// Internal helpers
// ------------------------------------------------------------
static void fillLocked(const nlohmann::json& j) {
    g_aliases.clear();
    if (!j.is_object()) return;

    const nlohmann::json& table =
        (j.contains("user") && j["user"].is_object()) ? j["user"] : j;

    for (auto& [k, v] : table.items()) {
        if (!v.is_string()) continue;
        std::string key = toLower(trim(k));
        if (key.empty()) continue;
        g_aliases[key] = v.get<std::string>();
    }
}

// ------------------------------------------------------------
// Public API
// ------------------------------------------------------------
namespace aliases {

void load(const fs::path& file) {
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        {
            std::scoped_lock lock(g_aliasMutex);
            g_aliases.clear();
        }
        if (file.has_parent_path()) fs::create_directories(file.parent_path(), ec);
        std::ofstream(file) << nlohmann::json{ {"user", nlohmann::json::object()} }.dump(4);

        LOG_DEBUG("Aliases", file.filename().string() + " not found, created empty");
        LOG_PHASE("Aliases load", true);
        return;
    }

    std::ifstream in(file);
    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        LOG_ERROR("Aliases", "Failed to parse " + file.string());
        LOG_PHASE("Aliases load", false);
        std::scoped_lock lock(g_aliasMutex);
        g_aliases.clear();
        return;
    }

    size_t count = 0;
    {
        std::scoped_lock lock(g_aliasMutex);
        fillLocked(j);
        count = g_aliases.size();
    }
    LOG_PHASE("Aliases load", true);
    LOG_DEBUG("Aliases", "Loaded " + std::to_string(count) + " aliases from " + file.string());
}

void loadFromJson(const nlohmann::json& j) {
    std::scoped_lock lock(g_aliasMutex);
    fillLocked(j);
}

void clear() {
    std::scoped_lock lock(g_aliasMutex);
    g_aliases.clear();
}

std::string resolveExact(const std::string& key) {
    std::string wanted = toLower(trim(key));
    std::scoped_lock lock(g_aliasMutex);
    auto it = g_aliases.find(wanted);
    return (it != g_aliases.end()) ? it->second : std::string{};
}

std::string resolve(const std::string& key) {
    std::string wanted = toLower(trim(key));
    if (wanted.empty()) return {};

    std::scoped_lock lock(g_aliasMutex);

    auto it = g_aliases.find(wanted);
    if (it != g_aliases.end()) return it->second;

    // 🔹 Fuzzy fallback
    const std::string* best = nullptr;
    size_t bestDist = kFuzzyDistance + 1;
    for (auto& [alias, target] : g_aliases) {
        size_t d = levenshtein(wanted, alias);
        if (d < bestDist) {
            bestDist = d;
            best = &target;
        }
    }
    if (best) {
        LOG_DEBUG("Aliases", "Fuzzy match for \"" + wanted + "\" (distance " +
                             std::to_string(bestDist) + ")");
        return *best;
    }
    return {};
}

} // namespace aliases
