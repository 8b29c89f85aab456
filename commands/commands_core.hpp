#pragma once
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include "intent.hpp"

// Forward declarations (capabilities live in their own headers)
class ChatService;
class SystemActions;
class ReminderStore;
class SpeechSink;

// ------------------------------------------------------------
// CommandResult: unified return type for all command handlers
// ------------------------------------------------------------
struct CommandResult {
    std::string message;    // user-facing text
    bool success = false;   // true if command succeeded
    std::string errorCode;  // "ERR_NONE" or an ErrorManager code
    std::string voice;      // text to speak (empty = silent)
    std::string category;   // "routine", "summary", "error"
};

// ------------------------------------------------------------
// Capabilities injected into handlers. Any may be null; a
// handler whose capability is missing reports a failure.
// ------------------------------------------------------------
struct Capabilities {
    ChatService*   chat      = nullptr;  // conversational reply
    ChatService*   realtime  = nullptr;  // web-augmented reply
    SystemActions* system    = nullptr;  // open / close / system commands
    ReminderStore* reminders = nullptr;
    SpeechSink*    speech    = nullptr;  // fire-and-forget speech output
};

struct CommandContext {
    const Capabilities& caps;
    const std::string& utterance;   // whole original utterance
};

// ------------------------------------------------------------
// Function pointer type for commands
// ------------------------------------------------------------
using CommandFunc = CommandResult(*)(CommandContext& ctx, const std::string& arg);

// ------------------------------------------------------------
// Dispatch results
// ------------------------------------------------------------
enum class DispatchOutcome {
    Success,
    Failure,
    Halt        // exit intent: stops the batch and the session
};

struct DispatchResult {
    IntentSegment segment;
    DispatchOutcome outcome = DispatchOutcome::Failure;
    std::string text;        // reply / confirmation, or failure reason
    std::string errorCode;
};

std::string outcomeName(DispatchOutcome outcome);

// ------------------------------------------------------------
// ActionDispatcher
// ------------------------------------------------------------
class ActionDispatcher {
public:
    explicit ActionDispatcher(Capabilities caps);

    void registerHandler(IntentTag tag, CommandFunc handler);
    bool hasHandler(IntentTag tag) const;

    // Run one segment. Never throws: handler exceptions become Failure.
    DispatchResult dispatch(const IntentSegment& segment, const std::string& utterance) const;

    // Single-pass cursor over one utterance's segments, in order.
    // Stops after the first Halt; cannot be rewound.
    class BatchRun {
    public:
        std::optional<DispatchResult> next();
        bool done() const { return halted_ || index_ >= segments_.size(); }
        bool halted() const { return halted_; }
        size_t position() const { return index_; }

    private:
        friend class ActionDispatcher;
        BatchRun(const ActionDispatcher& owner, IntentSegments segments, std::string utterance);

        const ActionDispatcher* owner_;
        IntentSegments segments_;
        std::string utterance_;
        size_t index_ = 0;
        bool halted_ = false;
    };

    BatchRun runBatch(IntentSegments segments, std::string utterance) const;

    const Capabilities& capabilities() const { return caps_; }

private:
    Capabilities caps_;
    std::unordered_map<IntentTag, CommandFunc> handlers_;
};

// Install the standard tag → handler table
void registerDefaultCommands(ActionDispatcher& dispatcher);

#include "commands_ai.hpp"
#include "commands_apps.hpp"
#include "commands_reminders.hpp"
