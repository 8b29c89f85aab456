#include "commands_core.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "voice/voice_speak.hpp"

#include <exception>

std::string outcomeName(DispatchOutcome outcome) {
    switch (outcome) {
        case DispatchOutcome::Success: return "success";
        case DispatchOutcome::Failure: return "failure";
        case DispatchOutcome::Halt:    return "halt";
    }
    return "unknown";
}

// ------------------------------------------------------------
// Command Registration
// ------------------------------------------------------------
ActionDispatcher::ActionDispatcher(Capabilities caps)
    : caps_(caps) {}

void ActionDispatcher::registerHandler(IntentTag tag, CommandFunc handler) {
    handlers_[tag] = handler;
}

bool ActionDispatcher::hasHandler(IntentTag tag) const {
    return handlers_.count(tag) > 0;
}

void registerDefaultCommands(ActionDispatcher& dispatcher) {
    // --- AI ---
    dispatcher.registerHandler(IntentTag::General,       cmdGeneral);
    dispatcher.registerHandler(IntentTag::Realtime,      cmdRealtime);

    // --- Web ---
    dispatcher.registerHandler(IntentTag::GoogleSearch,  cmdGoogleSearch);
    dispatcher.registerHandler(IntentTag::YouTubeSearch, cmdYouTubeSearch);

    // --- Apps / OS ---
    dispatcher.registerHandler(IntentTag::Open,          cmdOpen);
    dispatcher.registerHandler(IntentTag::Close,         cmdClose);
    dispatcher.registerHandler(IntentTag::Play,          cmdPlay);
    dispatcher.registerHandler(IntentTag::System,        cmdSystem);

    // --- Reminders ---
    dispatcher.registerHandler(IntentTag::Reminder,      cmdReminder);
}

// ------------------------------------------------------------
// Core Dispatch
// ------------------------------------------------------------
DispatchResult ActionDispatcher::dispatch(const IntentSegment& segment,
                                          const std::string& utterance) const {
    DispatchResult out;
    out.segment = segment;

    if (segment.tag == IntentTag::Exit) {
        LOG_TRACE("Dispatch", "exit → halt");
        out.outcome = DispatchOutcome::Halt;
        out.errorCode = "ERR_NONE";
        return out;
    }

    // Unrecognized tags fall back to the conversational handler
    // with the whole utterance.
    std::string arg = segment.argument;
    auto it = handlers_.find(segment.tag);
    if (segment.tag == IntentTag::Unknown || it == handlers_.end()) {
        LOG_DEBUG("Dispatch", "No handler for \"" + intentTagName(segment.tag) +
                              "\", defaulting to general");
        it = handlers_.find(IntentTag::General);
        if (!utterance.empty()) arg = utterance;
    }

    if (it == handlers_.end()) {
        CommandResult r = ErrorManager::report("ERR_CAPABILITY_MISSING", "no general handler");
        out.outcome = DispatchOutcome::Failure;
        out.text = r.message;
        out.errorCode = r.errorCode;
        return out;
    }

    LOG_TRACE("Dispatch", "tag=\"" + intentTagName(segment.tag) + "\" arg=\"" + arg + "\"");

    CommandResult result;
    try {
        CommandContext ctx{ caps_, utterance };
        result = it->second(ctx, arg);
    } catch (const std::exception& e) {
        result = ErrorManager::report("ERR_HANDLER_EXCEPTION",
                                      intentTagName(segment.tag) + ": " + e.what());
    } catch (...) {
        result = ErrorManager::report("ERR_HANDLER_EXCEPTION",
                                      intentTagName(segment.tag) + ": non-standard exception");
    }

    if (!result.success) {
        if (result.errorCode.empty()) result.errorCode = "ERR_HANDLER_EXCEPTION";
        LOG_DEBUG("Dispatch", "Segment failed: " + result.errorCode);
        out.outcome = DispatchOutcome::Failure;
        out.text = result.message;
        out.errorCode = result.errorCode;
        return out;
    }

    out.outcome = DispatchOutcome::Success;
    out.text = result.message;
    out.errorCode = result.errorCode.empty() ? "ERR_NONE" : result.errorCode;

    // 🔹 Speak without waiting; busy/failed speech never fails the segment
    if (!result.voice.empty() && caps_.speech) {
        try {
            caps_.speech->speakAsync(result.voice);
        } catch (const std::exception& e) {
            LOG_ERROR("Dispatch", std::string("Speech hand-off failed: ") + e.what());
        }
    }
    return out;
}

// ------------------------------------------------------------
// Batch driver
// ------------------------------------------------------------
ActionDispatcher::BatchRun::BatchRun(const ActionDispatcher& owner,
                                     IntentSegments segments,
                                     std::string utterance)
    : owner_(&owner),
      segments_(std::move(segments)),
      utterance_(std::move(utterance)) {}

std::optional<DispatchResult> ActionDispatcher::BatchRun::next() {
    if (done()) return std::nullopt;

    DispatchResult r = owner_->dispatch(segments_[index_], utterance_);
    ++index_;
    if (r.outcome == DispatchOutcome::Halt) {
        halted_ = true;
    }
    return r;
}

ActionDispatcher::BatchRun ActionDispatcher::runBatch(IntentSegments segments,
                                                      std::string utterance) const {
    return BatchRun(*this, std::move(segments), std::move(utterance));
}
