#include "system_actions.hpp"
#include "aliases.hpp"
#include "process.hpp"
#include "commands/commands_helpers.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>

// ------------------------------------------------------------
// URL detection
// ------------------------------------------------------------
bool looksLikeUrl(const std::string& target) {
    std::string t = toLower(trim(target));
    if (t.empty() || t.find(' ') != std::string::npos) return false;
    if (t.find("://") != std::string::npos) return true;
    if (t.rfind("www", 0) == 0) return true;

    // "example.com", "docs.rs/foo": a dot with something on both sides
    auto dot = t.find('.');
    return dot != std::string::npos && dot > 0 && dot + 1 < t.size();
}

std::string normalizeUrl(const std::string& target) {
    std::string url = trim(target);
    if (url.find("://") == std::string::npos) url = "https://" + url;
    return url;
}

// ------------------------------------------------------------
// PosixSystemActions
// ------------------------------------------------------------
PosixSystemActions::PosixSystemActions(const nlohmann::json& systemCommands) {
    if (!systemCommands.is_object()) return;

    for (auto& [name, argv] : systemCommands.items()) {
        if (!argv.is_array() || argv.empty()) continue;
        std::vector<std::string> args;
        for (const auto& a : argv) {
            if (a.is_string()) args.push_back(a.get<std::string>());
        }
        if (!args.empty()) systemCommands_[toLower(trim(name))] = std::move(args);
    }
    LOG_DEBUG("System", "Loaded " + std::to_string(systemCommands_.size()) + " system commands");
}

std::string PosixSystemActions::opener() const {
#if defined(__APPLE__)
    return findExecutable("open");
#else
    std::string p = findExecutable("xdg-open");
    if (p.empty()) p = findExecutable("gio");
    return p;
#endif
}

bool PosixSystemActions::openUrl(const std::string& url) {
    std::string tool = opener();
    if (tool.empty()) {
        LOG_ERROR("System", "No URL opener found on PATH");
        return false;
    }

    std::vector<std::string> argv{ tool };
    if (tool.size() >= 4 && tool.compare(tool.size() - 4, 4, "/gio") == 0) argv.push_back("open");
    argv.push_back(url);

    LOG_TRACE("System", "openUrl " + url);
    return launchDetached(argv);
}

bool PosixSystemActions::openTarget(const std::string& target) {
    std::string t = trim(target);
    if (t.empty()) return false;

    if (looksLikeUrl(t)) {
        return openUrl(normalizeUrl(t));
    }

    // 🔹 Alias → executable on PATH → anything the opener understands
    std::string resolved = aliases::resolve(t);
    std::string candidate = resolved.empty() ? t : resolved;

    std::string exe = findExecutable(candidate);
    if (exe.empty() && resolved.empty()) exe = findExecutable(toLower(t));
    if (!exe.empty()) {
        LOG_TRACE("System", "launch " + exe);
        return launchDetached({ exe });
    }

    if (!resolved.empty()) {
        std::string tool = opener();
        if (!tool.empty()) {
            LOG_TRACE("System", "open via opener: " + resolved);
            return launchDetached({ tool, resolved });
        }
    }

    // Unknown app: search for it instead
    LOG_DEBUG("System", "No app for \"" + t + "\", falling back to web search");
    return openUrl(googleSearchUrl(t));
}

std::string closePattern(const std::string& target) {
    std::string t = trim(target);
    std::string resolved = aliases::resolveExact(t);
    return resolved.empty() ? t : resolved;
}

bool PosixSystemActions::closeTarget(const std::string& target) {
    std::string t = trim(target);
    if (t.empty()) return false;

    std::string pattern = closePattern(t);

    // pkill exits 1 when nothing matched; the request was still issued
    int rc = runProcess({ "pkill", "-f", pattern });
    LOG_TRACE("System", "pkill -f " + pattern + " → " + std::to_string(rc));
    return rc >= 0;
}

bool PosixSystemActions::hasSystemCommand(const std::string& command) const {
    return systemCommands_.count(toLower(trim(command))) > 0;
}

bool PosixSystemActions::runSystemCommand(const std::string& command) {
    auto it = systemCommands_.find(toLower(trim(command)));
    if (it == systemCommands_.end()) {
        LOG_DEBUG("System", "Unknown system command acknowledged: " + command);
        return true;
    }
    int rc = runProcess(it->second);
    if (rc != 0) {
        LOG_ERROR("System", "System command \"" + command + "\" exited with " + std::to_string(rc));
    }
    return rc >= 0;
}
