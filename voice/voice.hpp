#pragma once
#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>

// Forward declare
struct whisper_context;

namespace Voice {

    struct CaptureSettings {
        int inputDeviceIndex   = -1;     // -1 → PortAudio default
        double silenceThreshold = 0.02;  // RMS
        int silenceTimeoutMs   = 4000;   // give up after this much quiet
        int minSpeechMs        = 500;
        int minSilenceMs       = 1200;   // end of utterance
        int maxCaptureMs       = 15000;
        std::string language   = "en";

        // "voice" and "whisper" sections of aria_config.json
        static CaptureSettings fromJson(const nlohmann::json& cfg);
    };

    // RMS below threshold (empty counts as silence)
    bool isSilence(const std::vector<float>& pcm, double threshold);

    // What a quiet chunk means for the capture loop
    enum class SilenceVerdict { KeepListening, EndOfSpeech, TimedOut };

    // Speech shorter than minSpeechMs still ends after silenceTimeoutMs of quiet
    SilenceVerdict judgeSilence(const CaptureSettings& settings,
                                bool inSpeech,
                                long long msSinceStart,
                                long long msSinceSpeech,
                                long long msSpeech);

    // =========================================================
    // VoiceInput: microphone (16 kHz mono float) → whisper text.
    // Owns the whisper context and the PortAudio session.
    // =========================================================
    class VoiceInput {
    public:
        // nullptr when the model is missing or no input device exists
        static std::unique_ptr<VoiceInput> create(const std::filesystem::path& modelPath,
                                                  const CaptureSettings& settings);
        ~VoiceInput();

        VoiceInput(const VoiceInput&) = delete;
        VoiceInput& operator=(const VoiceInput&) = delete;

        // Capture one utterance and transcribe it; "" when nothing was heard.
        // Returns early (empty) once 'interrupt' is raised.
        std::string listen(const std::atomic<bool>* interrupt = nullptr);

    private:
        VoiceInput(whisper_context* ctx, int deviceIndex, CaptureSettings settings);

        std::string transcribe(const std::vector<float>& pcm);

        whisper_context* ctx_;
        int deviceIndex_;
        CaptureSettings settings_;
    };

} // namespace Voice
