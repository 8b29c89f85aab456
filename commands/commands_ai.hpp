#pragma once
#include "commands_core.hpp"

// =============================================================
// Reply commands
// =============================================================

/**
 * @brief Conversational reply (catch-all).
 *
 * Uses caps.chat; the argument falls back to the whole utterance.
 * The reply text is also the voice line.
 */
CommandResult cmdGeneral(CommandContext& ctx, const std::string& arg);

/**
 * @brief Web-augmented reply for time-sensitive questions.
 *
 * Uses caps.realtime with the same fallback and voice rules as cmdGeneral.
 */
CommandResult cmdRealtime(CommandContext& ctx, const std::string& arg);
