#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <filesystem>

// Centralized config bootstrap for ARIA
namespace bootstrap_config {

    // Load aria_config.json, errors.json and app_aliases.json.
    // Returns the effective configuration.
    nlohmann::json initAll(const std::filesystem::path& configPath);

    // Generic loader → ensures defaults, patches missing keys, saves back.
    // Unparseable file → reset to defaults (reports errorCode), returns false.
    bool loadConfig(const std::filesystem::path& path,
                    const nlohmann::json& defaults,
                    nlohmann::json& outConfig,
                    const std::string& name,
                    const std::string& errorCode = "");

    // Fill missing / mistyped keys of 'cfg' from 'defs' (recursive).
    // Returns true if anything changed.
    bool mergeDefaults(nlohmann::json& cfg,
                       const nlohmann::json& defs,
                       int* patchedCount = nullptr);

    // Canonical defaults
    nlohmann::json defaultConfig();
    nlohmann::json defaultErrors();
    nlohmann::json defaultAliases();
}
