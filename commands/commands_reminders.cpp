#include "commands_reminders.hpp"
#include "commands_helpers.hpp"
#include "error_manager.hpp"
#include "response_manager.hpp"
#include "reminders.hpp"
#include "logger.hpp"

// ------------------------------------------------------------
// [Reminder] Save a reminder line
// ------------------------------------------------------------
CommandResult cmdReminder(CommandContext& ctx, const std::string& arg) {
    if (!ctx.caps.reminders) {
        return ErrorManager::report("ERR_CAPABILITY_MISSING", "reminder store");
    }

    std::string text = trim(arg);
    if (text.empty()) text = trim(ctx.utterance);

    try {
        ctx.caps.reminders->append(text);
    } catch (const IoError& e) {
        return ErrorManager::report("ERR_REMINDER_WRITE_FAILED", e.what());
    }

    LOG_DEBUG("Reminder", "Saved: " + text);

    CommandResult r;
    r.message   = "[Reminder] " + text;
    r.success   = true;
    r.errorCode = "ERR_NONE";
    r.voice     = ResponseManager::get("reminder_saved");
    r.category  = "routine";
    return r;
}
