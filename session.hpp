#pragma once
#include <string>
#include <vector>
#include <optional>
#include <istream>
#include <ostream>
#include <nlohmann/json_fwd.hpp>

#include "nlp.hpp"
#include "commands/commands_core.hpp"

namespace Voice { class VoiceInput; }

enum class InputMode {
    Text,
    Voice,
    Both
};

std::string inputModeName(InputMode mode);
std::optional<InputMode> parseInputMode(const std::string& name);

struct SessionConfig {
    std::string assistantName = "Aria";
    int pacingMs = 300;                 // delay between segments of one utterance
    InputMode mode = InputMode::Text;

    // "assistant_name" and the "session" section
    static SessionConfig fromJson(const nlohmann::json& cfg);
};

// Result of one utterance: per-segment results in order
struct UtteranceOutcome {
    std::vector<DispatchResult> results;
    bool halted = false;        // exit intent seen
    bool interrupted = false;   // SIGINT between segments
};

// ------------------------------------------------------------
// Session: one utterance per cycle until exit, EOF or SIGINT.
// Replies are echoed as "<Assistant>: <text>".
// ------------------------------------------------------------
class Session {
public:
    Session(const NLP& nlp,
            const ActionDispatcher& dispatcher,
            SessionConfig config,
            std::istream& in,
            std::ostream& out,
            Voice::VoiceInput* voice = nullptr);

    // Classify + run the batch for one utterance
    UtteranceOutcome handleUtterance(const std::string& text);

    // Main loop; returns the number of utterances handled
    size_t run();

    InputMode mode() const { return config_.mode; }
    void setMode(InputMode mode);

    // --- Interrupt flag (SIGINT) ---
    static bool installSignalHandlers();
    static void requestInterrupt();
    static bool interrupted();
    static void clearInterrupt();

private:
    std::optional<std::string> nextUtterance();
    std::optional<std::string> readTyped(const std::string& prompt);
    std::string listenOnce();
    bool handleModeCommand(const std::string& line);
    void say(const std::string& text);

    const NLP& nlp_;
    const ActionDispatcher& dispatcher_;
    SessionConfig config_;
    std::istream& in_;
    std::ostream& out_;
    Voice::VoiceInput* voice_;
};
