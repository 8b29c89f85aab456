#include "error_manager.hpp"
#include "logger.hpp"

#include <fstream>
#include <mutex>

// ------------------------------------------------------------
// Catalog storage
// ------------------------------------------------------------
static std::mutex g_errorMutex;
static nlohmann::json g_root = ErrorManager::defaults();

nlohmann::json ErrorManager::defaults() {
    return {
        {"ERR_NONE", {
            {"user", ""},
            {"debug", "No error."}
        }},
        {"ERR_HANDLER_EXCEPTION", {
            {"user", "[Error] Something went wrong while handling that."},
            {"debug", "Handler raised an exception; converted to a failed segment."}
        }},
        {"ERR_CAPABILITY_MISSING", {
            {"user", "[Error] That feature is not available right now."},
            {"debug", "Handler needed a capability that was not injected."}
        }},
        {"ERR_CHAT_BACKEND_FAILED", {
            {"user", "[AI] I'm experiencing technical difficulties. Please try again."},
            {"debug", "Conversational backend call failed."}
        }},
        {"ERR_REALTIME_BACKEND_FAILED", {
            {"user", "[AI] I couldn't get live information right now."},
            {"debug", "Web-augmented backend call failed."}
        }},
        {"ERR_APP_NO_ARGUMENT", {
            {"user", "[App] Usage: open/close/play <target>"},
            {"debug", "Application command called without argument."}
        }},
        {"ERR_APP_LAUNCH_FAILED", {
            {"user", "[App] Could not open that."},
            {"debug", "Opener process could not be started."}
        }},
        {"ERR_APP_CLOSE_FAILED", {
            {"user", "[App] Could not close that."},
            {"debug", "pkill could not be started."}
        }},
        {"ERR_WEB_OPEN_FAILED", {
            {"user", "[Web] Could not open the browser."},
            {"debug", "URL opener could not be started."}
        }},
        {"ERR_SYSTEM_COMMAND_FAILED", {
            {"user", "[System] That system command failed."},
            {"debug", "Configured system command could not be started."}
        }},
        {"ERR_REMINDER_WRITE_FAILED", {
            {"user", "[Reminder] Could not save the reminder."},
            {"debug", "Appending to the reminders file failed."}
        }},
        {"ERR_SPEECH_BUSY", {
            {"user", ""},
            {"debug", "Speech controller busy; request rejected."}
        }},
        {"ERR_SPEECH_SYNTH_FAILED", {
            {"user", ""},
            {"debug", "Speech synthesis failed; no playback attempted."}
        }},
        {"ERR_SPEECH_PLAYBACK_FAILED", {
            {"user", ""},
            {"debug", "Speech playback failed; artifact cleaned up."}
        }},
        {"ERR_VOICE_NOT_INITIALIZED", {
            {"user", "[Voice] Speech input is not available."},
            {"debug", "Whisper model missing or failed to load."}
        }},
        {"ERR_VOICE_NO_DEVICE", {
            {"user", "[Voice] No microphone found."},
            {"debug", "PortAudio could not open an input device."}
        }},
        {"ERR_VOICE_NO_SPEECH", {
            {"user", "[Voice] I didn't catch that."},
            {"debug", "Capture finished with an empty transcript."}
        }},
        {"ERR_CONFIG_INVALID", {
            {"user", "[Config] Config file invalid → reset to defaults."},
            {"debug", "aria_config.json failed parsing or validation."}
        }}
    };
}

// ------------------------------------------------------------
// Loading
// ------------------------------------------------------------
void ErrorManager::load(const nlohmann::json& catalog) {
    std::lock_guard<std::mutex> lock(g_errorMutex);
    if (catalog.contains("errors") && catalog["errors"].is_object()) {
        g_root = catalog["errors"];
    } else if (catalog.is_object()) {
        g_root = catalog;
    }
}

bool ErrorManager::loadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        LOG_ERROR("ErrorManager", "Could not open " + path);
        return false;
    }

    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        LOG_ERROR("ErrorManager", "Failed to parse " + path);
        return false;
    }

    load(j);
    LOG_DEBUG("ErrorManager", "Loaded error catalog from " + path);
    return true;
}

// ------------------------------------------------------------
// Lookup
// ------------------------------------------------------------
std::string ErrorManager::getUserMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_errorMutex);
    if (g_root.contains(code) && g_root[code].contains("user") && g_root[code]["user"].is_string()) {
        return g_root[code]["user"].get<std::string>();
    }
    return "[Error] Unknown error code: " + code;
}

std::string ErrorManager::getDebugMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_errorMutex);
    if (g_root.contains(code) && g_root[code].contains("debug") && g_root[code]["debug"].is_string()) {
        return g_root[code]["debug"].get<std::string>();
    }
    return "[Debug] No debug message for code: " + code;
}

CommandResult ErrorManager::report(const std::string& code, const std::string& detail) {
    std::string debugMsg = getDebugMessage(code);
    if (!detail.empty()) debugMsg += " (" + detail + ")";

    LOG_ERROR("ErrorManager", code + " -> " + debugMsg);

    CommandResult result;
    result.success   = false;
    result.message   = getUserMessage(code);
    result.errorCode = code;
    result.voice     = "";          // don't auto-speak
    result.category  = "error";
    return result;
}
