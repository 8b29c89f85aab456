#include "session.hpp"
#include "commands/commands_helpers.hpp"
#include "response_manager.hpp"
#include "voice/voice.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <signal.h>
#include <thread>

// ------------------------------------------------------------
// Interrupt flag
// ------------------------------------------------------------
static std::atomic<bool> g_interrupted{false};

static void onSigint(int) {
    g_interrupted.store(true);
}

// No SA_RESTART: a blocking read on stdin fails with EINTR so the
// prompt returns as soon as Ctrl+C arrives.
bool Session::installSignalHandlers() {
    struct sigaction act {};
    act.sa_handler = onSigint;
    sigemptyset(&act.sa_mask);
    act.sa_flags = 0;

    if (sigaction(SIGINT, &act, nullptr) < 0) {
        LOG_ERROR("Session", "Could not install the SIGINT handler");
        return false;
    }
    return true;
}

void Session::requestInterrupt() { g_interrupted.store(true); }
bool Session::interrupted()      { return g_interrupted.load(); }
void Session::clearInterrupt()   { g_interrupted.store(false); }

// ------------------------------------------------------------
// Modes
// ------------------------------------------------------------
std::string inputModeName(InputMode mode) {
    switch (mode) {
        case InputMode::Text:  return "text";
        case InputMode::Voice: return "voice";
        case InputMode::Both:  return "both";
    }
    return "text";
}

std::optional<InputMode> parseInputMode(const std::string& name) {
    std::string n = toLower(trim(name));
    if (n == "text")  return InputMode::Text;
    if (n == "voice") return InputMode::Voice;
    if (n == "both")  return InputMode::Both;
    return std::nullopt;
}

SessionConfig SessionConfig::fromJson(const nlohmann::json& cfg) {
    SessionConfig c;
    if (!cfg.is_object()) return c;

    c.assistantName = cfg.value("assistant_name", c.assistantName);
    if (cfg.contains("session") && cfg["session"].is_object()) {
        const auto& s = cfg["session"];
        c.pacingMs = s.value("pacing_ms", c.pacingMs);
        if (auto m = parseInputMode(s.value("mode", std::string("text")))) c.mode = *m;
    }
    if (c.pacingMs < 0) c.pacingMs = 0;
    return c;
}

// ------------------------------------------------------------
// Session
// ------------------------------------------------------------
Session::Session(const NLP& nlp,
                 const ActionDispatcher& dispatcher,
                 SessionConfig config,
                 std::istream& in,
                 std::ostream& out,
                 Voice::VoiceInput* voice)
    : nlp_(nlp),
      dispatcher_(dispatcher),
      config_(std::move(config)),
      in_(in),
      out_(out),
      voice_(voice) {
    if (config_.mode != InputMode::Text && !voice_) {
        LOG_DEBUG("Session", "No speech input available, using text mode");
        config_.mode = InputMode::Text;
    }
}

void Session::say(const std::string& text) {
    out_ << config_.assistantName << ": " << text << "\n";
    out_.flush();
}

void Session::setMode(InputMode mode) {
    if (mode != InputMode::Text && !voice_) {
        say("Speech input is not available; staying in text mode.");
        config_.mode = InputMode::Text;
        return;
    }
    config_.mode = mode;
    LOG_DEBUG("Session", "Input mode → " + inputModeName(mode));
    say(ResponseManager::get("mode_switch") + inputModeName(mode) + ".");
}

UtteranceOutcome Session::handleUtterance(const std::string& text) {
    UtteranceOutcome outcome;

    std::string rule;
    IntentSegments segments = nlp_.classify(text, rule);
    LOG_TRACE("Session", "rule=" + rule + " segments=" + std::to_string(segments.size()));

    auto batch = dispatcher_.runBatch(segments, text);
    bool first = true;
    while (!batch.done()) {
        if (interrupted()) {
            LOG_DEBUG("Session", "Interrupted between segments");
            outcome.interrupted = true;
            break;
        }
        // 🔹 Pace side effects (two apps opening at once, etc.)
        if (!first && config_.pacingMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.pacingMs));
        }
        first = false;

        auto r = batch.next();
        if (!r) break;

        LOG_TRACE("Session", intentTagName(r->segment.tag) + " → " + outcomeName(r->outcome));
        if (r->outcome == DispatchOutcome::Success && !r->text.empty()) {
            say(r->text);
        }
        outcome.results.push_back(std::move(*r));
    }

    outcome.halted = batch.halted();
    return outcome;
}

// ------------------------------------------------------------
// Input
// ------------------------------------------------------------
std::optional<std::string> Session::readTyped(const std::string& prompt) {
    out_ << prompt;
    out_.flush();

    std::string line;
    if (!std::getline(in_, line)) {
        if (interrupted()) {
            // Read cut short by SIGINT, not end of input
            in_.clear();
            out_ << "\n";
        }
        return std::nullopt;
    }
    return line;
}

std::string Session::listenOnce() {
    if (!voice_) return "";
    out_ << "[listening...]\n";
    out_.flush();

    std::string heard = voice_->listen(&g_interrupted);
    if (!heard.empty()) out_ << "You (voice): " << heard << "\n";
    return heard;
}

static std::string stripTypedPrefix(const std::string& line) {
    std::string t = trim(line);
    if (t.size() >= 2 && (t[0] == 't' || t[0] == 'T') && t[1] == ':') {
        return trim(t.substr(2));
    }
    return t;
}

std::optional<std::string> Session::nextUtterance() {
    switch (config_.mode) {
        case InputMode::Text:
            return readTyped("> ");

        case InputMode::Voice: {
            std::string heard = listenOnce();
            if (!heard.empty() || interrupted()) return heard;

            // Nothing heard: let the user type instead
            auto line = readTyped("(nothing heard) t: <text> or Enter to listen again > ");
            if (!line) return std::nullopt;
            return stripTypedPrefix(*line);
        }

        case InputMode::Both: {
            auto line = readTyped("> (Enter to speak) ");
            if (!line) return std::nullopt;
            std::string typed = stripTypedPrefix(*line);
            if (!typed.empty()) return typed;
            return listenOnce();
        }
    }
    return std::nullopt;
}

bool Session::handleModeCommand(const std::string& line) {
    std::string lowered = toLower(line);
    if (lowered.rfind("mode ", 0) != 0) return false;

    auto mode = parseInputMode(lowered.substr(5));
    if (!mode) {
        say("Unknown mode. Use: mode text | mode voice | mode both");
        return true;
    }
    setMode(*mode);
    return true;
}

size_t Session::run() {
    LOG_PHASE("Session loop start", true);
    size_t handled = 0;

    while (!interrupted()) {
        auto line = nextUtterance();
        if (!line) {
            if (!interrupted()) LOG_DEBUG("Session", "Input closed");
            break;
        }

        std::string text = trim(*line);
        if (text.empty()) continue;
        if (handleModeCommand(text)) continue;

        auto outcome = handleUtterance(text);
        ++handled;
        if (outcome.halted) {
            say(ResponseManager::get("farewell"));
            LOG_PHASE("Exit requested", true);
            break;
        }
    }

    if (interrupted()) LOG_PHASE("Session interrupted", true);
    LOG_PHASE("Session loop end", true);
    return handled;
}
