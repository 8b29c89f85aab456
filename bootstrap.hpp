#pragma once
#include <memory>
#include <optional>
#include <filesystem>
#include <nlohmann/json.hpp>

#include "nlp.hpp"
#include "ai.hpp"
#include "chat_log.hpp"
#include "reminders.hpp"
#include "system_actions.hpp"
#include "commands/commands_core.hpp"
#include "voice/voice.hpp"
#include "voice/voice_speak.hpp"

struct BootstrapOptions {
    std::filesystem::path configPath;   // empty → ./aria_config.json
    bool speech = true;                 // --no-speech turns it off
    std::optional<bool> voiceInput;     // unset → from session.mode
};

// Everything the session needs, owned in one place.
// Optional pieces (speech, voiceInput) are null when unavailable.
struct Services {
    nlohmann::json config;
    NlpVocabulary vocab = NlpVocabulary::defaults();

    std::unique_ptr<JsonTranscriptStore> transcript;
    std::unique_ptr<ChatBot> chat;
    std::unique_ptr<RealtimeSearchEngine> realtime;
    std::unique_ptr<PosixSystemActions> system;
    std::unique_ptr<FileReminderStore> reminders;
    std::unique_ptr<Voice::SpeechOutput> speech;
    std::unique_ptr<Voice::VoiceInput> voiceInput;

    Capabilities capabilities() const;
};

// Load configs and build the services
Services runBootstrapChecks(const BootstrapOptions& options);

// Speech controller from the "voice" section; nullptr if no synthesizer
std::unique_ptr<Voice::SpeechOutput> createSpeechOutput(const nlohmann::json& config);
