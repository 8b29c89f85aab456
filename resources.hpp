#pragma once
#include <string>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>

// ------------------------------------------------------------
// Constants
// ------------------------------------------------------------
inline constexpr const char* ARIA_CONFIG_FILE  = "aria_config.json";
inline constexpr const char* ARIA_ERRORS_FILE  = "errors.json";
inline constexpr const char* ARIA_ALIASES_FILE = "app_aliases.json";
inline constexpr const char* ARIA_VOCAB_FILE   = "nlp_vocab.json";

// ------------------------------------------------------------
// Resource loading
// ------------------------------------------------------------
// ../resources → ./resources → <exe dir>/resources → cwd
// (ARIA_PORTABLE_ONLY: resources/ next to the executable)
std::string getResourcePath();

// ------------------------------------------------------------
// Data paths ("paths" section of aria_config.json)
// ------------------------------------------------------------
// Data directory; relative values are taken from cwd
std::filesystem::path dataDirectory(const nlohmann::json& cfg);

// dataDirectory()/<cfg.paths[key] or fallback>
std::filesystem::path dataFile(const nlohmann::json& cfg,
                               const std::string& key,
                               const std::string& fallback);
