#include "commands_apps.hpp"
#include "commands_helpers.hpp"
#include "error_manager.hpp"
#include "response_manager.hpp"
#include "system_actions.hpp"
#include "logger.hpp"

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
static CommandResult issued(const std::string& message, const std::string& voice = "") {
    CommandResult r;
    r.message   = message;
    r.success   = true;
    r.errorCode = "ERR_NONE";
    r.voice     = voice;
    r.category  = "routine";
    return r;
}

static CommandResult openSearchPage(CommandContext& ctx,
                                    const std::string& url,
                                    const std::string& message) {
    if (!ctx.caps.system) {
        return ErrorManager::report("ERR_CAPABILITY_MISSING", "system actions");
    }
    if (!ctx.caps.system->openUrl(url)) {
        return ErrorManager::report("ERR_WEB_OPEN_FAILED", url);
    }
    return issued("[Web] " + message);
}

// ------------------------------------------------------------
// [Apps] open
// ------------------------------------------------------------
CommandResult cmdOpen(CommandContext& ctx, const std::string& arg) {
    std::string target = trim(arg);
    if (target.empty()) {
        return ErrorManager::report("ERR_APP_NO_ARGUMENT", "open");
    }
    if (!ctx.caps.system) {
        return ErrorManager::report("ERR_CAPABILITY_MISSING", "system actions");
    }

    LOG_TRACE("Apps", "open \"" + target + "\"");
    if (!ctx.caps.system->openTarget(target)) {
        return ErrorManager::report("ERR_APP_LAUNCH_FAILED", target);
    }
    return issued("[App] " + ResponseManager::get("open_app_success") + target);
}

// ------------------------------------------------------------
// [Apps] close
// ------------------------------------------------------------
CommandResult cmdClose(CommandContext& ctx, const std::string& arg) {
    std::string target = trim(arg);
    if (target.empty()) {
        return ErrorManager::report("ERR_APP_NO_ARGUMENT", "close");
    }
    if (!ctx.caps.system) {
        return ErrorManager::report("ERR_CAPABILITY_MISSING", "system actions");
    }

    LOG_TRACE("Apps", "close \"" + target + "\"");
    if (!ctx.caps.system->closeTarget(target)) {
        return ErrorManager::report("ERR_APP_CLOSE_FAILED", target);
    }
    return issued("[App] " + ResponseManager::get("close_app") + target);
}

// ------------------------------------------------------------
// [Apps] play
// ------------------------------------------------------------
CommandResult cmdPlay(CommandContext& ctx, const std::string& arg) {
    std::string what = trim(arg);
    if (what.empty()) {
        return ErrorManager::report("ERR_APP_NO_ARGUMENT", "play");
    }
    return openSearchPage(ctx, youtubeSearchUrl(what), ResponseManager::get("play") + what);
}

// ------------------------------------------------------------
// [System] configured system commands
// ------------------------------------------------------------
CommandResult cmdSystem(CommandContext& ctx, const std::string& arg) {
    std::string command = trim(arg);
    if (command.empty()) {
        return ErrorManager::report("ERR_APP_NO_ARGUMENT", "system");
    }
    if (!ctx.caps.system) {
        return ErrorManager::report("ERR_CAPABILITY_MISSING", "system actions");
    }

    if (!ctx.caps.system->runSystemCommand(command)) {
        return ErrorManager::report("ERR_SYSTEM_COMMAND_FAILED", command);
    }

    std::string line = ResponseManager::get("system_command") + command;
    return issued("[System] " + line, line);
}

// ------------------------------------------------------------
// [Web] Google / YouTube
// ------------------------------------------------------------
CommandResult cmdGoogleSearch(CommandContext& ctx, const std::string& arg) {
    std::string query = trim(arg);
    return openSearchPage(ctx, googleSearchUrl(query), ResponseManager::get("search_google") + query);
}

CommandResult cmdYouTubeSearch(CommandContext& ctx, const std::string& arg) {
    std::string query = trim(arg);
    if (query.empty()) {
        return openSearchPage(ctx, youtubeSearchUrl(""), ResponseManager::get("youtube_home"));
    }
    return openSearchPage(ctx, youtubeSearchUrl(query), ResponseManager::get("search_youtube") + query);
}
