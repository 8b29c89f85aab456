#pragma once
#include "commands_core.hpp"

// =============================================================
// App / OS commands (caps.system)
// =============================================================

// open <app | alias | url>
CommandResult cmdOpen(CommandContext& ctx, const std::string& arg);

// close <app>  (pkill -f)
CommandResult cmdClose(CommandContext& ctx, const std::string& arg);

// play <song or video>  → YouTube search
CommandResult cmdPlay(CommandContext& ctx, const std::string& arg);

// system <command>  → configured argv, spoken confirmation
CommandResult cmdSystem(CommandContext& ctx, const std::string& arg);

// =============================================================
// Web search commands
// =============================================================
CommandResult cmdGoogleSearch(CommandContext& ctx, const std::string& arg);
CommandResult cmdYouTubeSearch(CommandContext& ctx, const std::string& arg);
