#include "bootstrap.hpp"
#include "bootstrap_config.hpp"
#include "nlp_rules.hpp"
#include "resources.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

Capabilities Services::capabilities() const {
    Capabilities caps;
    caps.chat      = chat.get();
    caps.realtime  = realtime.get();
    caps.system    = system.get();
    caps.reminders = reminders.get();
    caps.speech    = speech.get();
    return caps;
}

std::unique_ptr<Voice::SpeechOutput> createSpeechOutput(const nlohmann::json& config) {
    const nlohmann::json voiceCfg = config.value("voice", nlohmann::json::object());

    auto synth = Voice::createSynthesizer(voiceCfg);
    if (!synth) return nullptr;

    int pollMs = voiceCfg.value("poll_interval_ms", 30);
    auto player = std::make_unique<Voice::SfmlAudioPlayer>(pollMs, voiceCfg.value("tail_delay_ms", 50));

    fs::path speechDir = dataFile(config, "speech_dir", "speech");
    return std::make_unique<Voice::SpeechOutput>(std::move(synth), std::move(player), speechDir, pollMs);
}

Services runBootstrapChecks(const BootstrapOptions& options) {
    // ============================================================
    // Bootstrap start
    // ============================================================
    LOG_PHASE("Bootstrap begin", true);
    Services s;

    // ============================================================
    // Centralized config bootstrap
    // ============================================================
    fs::path cfgPath = options.configPath.empty()
                         ? fs::current_path() / ARIA_CONFIG_FILE
                         : options.configPath;
    beginPhaseGroup();
    s.config = bootstrap_config::initAll(cfgPath);
    endPhaseGroup();
    LOG_PHASE("Configs initialized", true);

    // ============================================================
    // Classifier vocabulary (optional override)
    // ============================================================
    fs::path vocabPath = fs::path(getResourcePath()) / ARIA_VOCAB_FILE;
    if (fs::exists(vocabPath)) {
        std::string err;
        if (loadNlpVocabulary(vocabPath.string(), s.vocab, &err)) {
            LOG_PHASE("Classifier vocabulary load", true);
        } else {
            LOG_ERROR("Config", "Classifier vocabulary ignored: " + err);
            LOG_PHASE("Classifier vocabulary load", false);
        }
    }

    // ============================================================
    // Capabilities
    // ============================================================
    AiBackendConfig aiCfg = AiBackendConfig::fromJson(s.config);
    s.transcript = std::make_unique<JsonTranscriptStore>(dataFile(s.config, "transcript", "ChatLog.json"));
    s.chat       = std::make_unique<ChatBot>(aiCfg, *s.transcript);
    s.realtime   = std::make_unique<RealtimeSearchEngine>(aiCfg, *s.transcript);
    s.system     = std::make_unique<PosixSystemActions>(
                       s.config.value("system_commands", nlohmann::json::object()));
    s.reminders  = std::make_unique<FileReminderStore>(dataFile(s.config, "reminders", "reminders.txt"));
    LOG_DEBUG("Config", "AI backend=" + aiCfg.backend + " model=" + aiCfg.model);
    LOG_PHASE("Capabilities ready", true);

    // ============================================================
    // Voice output
    // ============================================================
    bool speechEnabled = options.speech && s.config["voice"].value("enabled", true);
    if (speechEnabled) {
        s.speech = createSpeechOutput(s.config);
        LOG_PHASE("Speech output init", s.speech != nullptr);
    } else {
        LOG_PHASE("Speech output skipped", true);
    }

    // ============================================================
    // Voice input
    // ============================================================
    bool wantVoice = options.voiceInput.value_or(
        s.config["session"].value("mode", "text") != "text");
    if (wantVoice) {
        std::string model = s.config["whisper"].value("model", "ggml-base.en.bin");
        fs::path modelPath = fs::path(getResourcePath()) / "models" / model;
        s.voiceInput = Voice::VoiceInput::create(modelPath, Voice::CaptureSettings::fromJson(s.config));
        LOG_PHASE("Voice input init", s.voiceInput != nullptr);
    }

    // ============================================================
    // Bootstrap complete
    // ============================================================
    LOG_PHASE("Bootstrap complete", true);
    return s;
}
