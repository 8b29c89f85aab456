#include "commands_ai.hpp"
#include "commands_helpers.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "ai.hpp"

// ------------------------------------------------------------
// Shared reply path
// ------------------------------------------------------------
static CommandResult runReply(ChatService* service,
                              const std::string& query,
                              const char* failCode,
                              const char* tag) {
    if (!service) {
        return ErrorManager::report("ERR_CAPABILITY_MISSING", std::string(tag) + " service");
    }

    std::string answer;
    try {
        answer = service->reply(query);
    } catch (const ServiceError& e) {
        return ErrorManager::report(failCode, e.what());
    } catch (const IoError& e) {
        // Reply was produced but the transcript could not be persisted
        LOG_ERROR(tag, std::string("Transcript save failed: ") + e.what());
        return ErrorManager::report(failCode, e.what());
    }

    LOG_TRACE(tag, "Reply length=" + std::to_string(answer.size()));

    CommandResult r;
    r.message   = answer;
    r.success   = true;
    r.errorCode = "ERR_NONE";
    r.voice     = answer;
    r.category  = "routine";
    return r;
}

// ------------------------------------------------------------
// [AI] General conversation
// ------------------------------------------------------------
CommandResult cmdGeneral(CommandContext& ctx, const std::string& arg) {
    std::string query = trim(arg);
    if (query.empty()) query = trim(ctx.utterance);
    return runReply(ctx.caps.chat, query, "ERR_CHAT_BACKEND_FAILED", "Chat");
}

// ------------------------------------------------------------
// [AI] Real-time (search grounded)
// ------------------------------------------------------------
CommandResult cmdRealtime(CommandContext& ctx, const std::string& arg) {
    std::string query = trim(arg);
    if (query.empty()) query = trim(ctx.utterance);
    return runReply(ctx.caps.realtime, query, "ERR_REALTIME_BACKEND_FAILED", "Realtime");
}
