#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "aliases.hpp"
#include "logger.hpp"

#include <fstream>

namespace fs = std::filesystem;

// ----------------- helpers -----------------
static bool sameKind(const nlohmann::json& a, const nlohmann::json& b) {
    // 1 and 1.0 are both fine for a numeric setting
    if (a.is_number() && b.is_number()) return true;
    return a.type() == b.type();
}

static bool writeJson(const fs::path& path, const nlohmann::json& j) {
    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);

    std::ofstream out(path, std::ios::trunc);
    out << j.dump(2);
    if (!out) {
        LOG_ERROR("Config", "Could not write " + path.string());
        return false;
    }
    return true;
}

namespace bootstrap_config {

bool mergeDefaults(nlohmann::json& cfg, const nlohmann::json& defs, int* patchedCount) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (mergeDefaults(cfg[key], defVal, patchedCount))
                patched = true;
        } else if (!sameKind(cfg[key], defVal)) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        }
    }
    return patched;
}

// ----------------- defaults -----------------
nlohmann::json defaultConfig() {
    return {
        {"assistant_name", "Aria"},
        {"user_name", "User"},

        {"ai", {
            {"backend", "groq"},
            {"default_model", "llama-3.1-8b-instant"},
            {"groq_url", "https://api.groq.com/openai/v1"},
            {"openai_url", "https://api.openai.com/v1"},
            {"localai_url", "http://127.0.0.1:8080/v1"},
            {"ollama_url", "http://127.0.0.1:11434"},
            {"temperature", 0.7},
            {"max_tokens", 1024},
            {"timeout_ms", 30000},
            {"api_keys", {
                {"groq", ""},
                {"openai", ""}
            }}
        }},

        {"voice", {
            {"enabled", true},
            {"engine", "command"},
            {"command", {"espeak-ng", "-w", "{out}", "{text}"}},
            {"speed", 1.0},
            {"coqui", {
                {"bridge", {"python3", "-u", "coqui_bridge.py", "--persistent"}},
                {"speaker", "p225"},
                {"timeout_ms", 30000}
            }},
            {"poll_interval_ms", 30},
            {"tail_delay_ms", 50},
            {"input_device_index", -1},
            {"silence_threshold", 0.02},
            {"silence_timeout_ms", 4000},
            {"max_capture_ms", 15000}
        }},

        {"whisper", {
            {"model", "ggml-base.en.bin"},
            {"language", "en"},
            {"min_speech_ms", 500},
            {"min_silence_ms", 1200}
        }},

        {"session", {
            {"mode", "text"},
            {"pacing_ms", 300}
        }},

        {"paths", {
            {"data_dir", "Data"},
            {"transcript", "ChatLog.json"},
            {"reminders", "reminders.txt"},
            {"speech_dir", "speech"}
        }},

        {"logging", {
            {"level", "debug"},
            {"file", "aria.log"},
            {"console", true}
        }},

        {"system_commands", {
            {"mute",        {"amixer", "-q", "set", "Master", "mute"}},
            {"unmute",      {"amixer", "-q", "set", "Master", "unmute"}},
            {"volume up",   {"amixer", "-q", "set", "Master", "5%+"}},
            {"volume down", {"amixer", "-q", "set", "Master", "5%-"}}
        }}
    };
}

nlohmann::json defaultErrors() {
    return ErrorManager::defaults();
}

nlohmann::json defaultAliases() {
    return {
        {"user", {
            {"browser", "firefox"},
            {"editor", "code"},
            {"terminal", "x-terminal-emulator"},
            {"files", "nautilus"}
        }}
    };
}

// ----------------- loader -----------------
bool loadConfig(const fs::path& path,
                const nlohmann::json& defaults,
                nlohmann::json& outConfig,
                const std::string& name,
                const std::string& errorCode) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        outConfig = defaults;
        writeJson(path, outConfig);

        LOG_PHASE(name + " created", true);
        return true;
    }

    std::ifstream f(path);
    nlohmann::json loaded = nlohmann::json::parse(f, nullptr, false);
    if (loaded.is_discarded() || !loaded.is_object()) {
        LOG_ERROR("Config", name + " invalid → reset to defaults");
        LOG_PHASE(name + " load", false);

        if (!errorCode.empty())
            ErrorManager::report(errorCode, path.string());

        outConfig = defaults;
        writeJson(path, outConfig);
        return false;
    }

    outConfig = std::move(loaded);
    int patchedCount = 0;
    if (mergeDefaults(outConfig, defaults, &patchedCount)) {
        writeJson(path, outConfig);
        LOG_PHASE(name + " patched", true);
        LOG_DEBUG("Config", name + " patched (" + std::to_string(patchedCount) + " keys)");
    } else {
        LOG_PHASE(name + " load", true);
    }
    return true;
}

// ----------------- entry -----------------
nlohmann::json initAll(const fs::path& configPath) {
    // errors.json first so later failures report with the user's texts
    fs::path errPath = fs::path(getResourcePath()) / ARIA_ERRORS_FILE;
    nlohmann::json errorsCfg;
    loadConfig(errPath, defaultErrors(), errorsCfg, "Errors config");
    ErrorManager::load(errorsCfg);

    // aria_config.json
    nlohmann::json config;
    loadConfig(configPath, defaultConfig(), config, "ARIA config", "ERR_CONFIG_INVALID");

    const auto& logging = config["logging"];
    std::string level = logging.value("level", "debug");
    setLogLevel(parseLogLevel(level));
    setConsoleLogging(logging.value("console", true));
    if (!setLogFile(logging.value("file", "aria.log"))) {
        LOG_PHASE("Log file switch", false);
    }
    LOG_DEBUG("Config", "Log level: " + level);

    // app_aliases.json (created on first run with the starter table)
    fs::path aliasPath = fs::path(getResourcePath()) / ARIA_ALIASES_FILE;
    if (!fs::exists(aliasPath)) {
        writeJson(aliasPath, defaultAliases());
        LOG_PHASE("Aliases config created", true);
    }
    aliases::load(aliasPath);

    return config;
}

} // namespace bootstrap_config
