#pragma once
#include "commands_core.hpp"

// remind me <when/what>  → appended to caps.reminders, "Reminder saved." spoken
CommandResult cmdReminder(CommandContext& ctx, const std::string& arg);
