#include "voice.hpp"
#include "error_manager.hpp"
#include "response_manager.hpp"
#include "logger.hpp"

#include <whisper.h>
#include <portaudio.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cmath>
#include <mutex>

namespace fs = std::filesystem;

namespace Voice {

// ---------------- Settings ----------------
CaptureSettings CaptureSettings::fromJson(const nlohmann::json& cfg) {
    CaptureSettings s;
    if (!cfg.is_object()) return s;

    if (cfg.contains("voice") && cfg["voice"].is_object()) {
        const auto& v = cfg["voice"];
        s.inputDeviceIndex = v.value("input_device_index", s.inputDeviceIndex);
        s.silenceThreshold = v.value("silence_threshold", s.silenceThreshold);
        s.silenceTimeoutMs = v.value("silence_timeout_ms", s.silenceTimeoutMs);
        s.maxCaptureMs     = v.value("max_capture_ms", s.maxCaptureMs);
    }
    if (cfg.contains("whisper") && cfg["whisper"].is_object()) {
        const auto& w = cfg["whisper"];
        s.minSpeechMs  = w.value("min_speech_ms", s.minSpeechMs);
        s.minSilenceMs = w.value("min_silence_ms", s.minSilenceMs);
        s.language     = w.value("language", s.language);
    }
    return s;
}

// ---------------- Audio Data ----------------
struct AudioData {
    std::vector<float> buffer;
    std::mutex mtx;
};

// ============================================================
// PortAudio Helpers
// ============================================================
static int recordCallback(const void* input,
                          void* /*output*/,
                          unsigned long frameCount,
                          const PaStreamCallbackTimeInfo*,
                          PaStreamCallbackFlags,
                          void* userData) {
    AudioData* data = reinterpret_cast<AudioData*>(userData);
    const float* in = reinterpret_cast<const float*>(input);
    if (in) {
        std::lock_guard<std::mutex> lock(data->mtx);
        data->buffer.insert(data->buffer.end(), in, in + frameCount);
    }
    return paContinue;
}

// ============================================================
// Silence Detection
// ============================================================
bool isSilence(const std::vector<float>& pcm, double threshold) {
    if (pcm.empty()) return true;
    double energy = 0.0;
    for (float s : pcm) energy += s * s;
    energy /= pcm.size();
    double rms = std::sqrt(energy);
    return rms < threshold;
}

SilenceVerdict judgeSilence(const CaptureSettings& settings,
                            bool inSpeech,
                            long long msSinceStart,
                            long long msSinceSpeech,
                            long long msSpeech) {
    if (!inSpeech) {
        return (msSinceStart >= settings.silenceTimeoutMs) ? SilenceVerdict::TimedOut
                                                           : SilenceVerdict::KeepListening;
    }
    if (msSinceSpeech >= settings.minSilenceMs && msSpeech >= settings.minSpeechMs) {
        return SilenceVerdict::EndOfSpeech;
    }
    if (msSinceSpeech >= settings.silenceTimeoutMs) return SilenceVerdict::TimedOut;
    return SilenceVerdict::KeepListening;
}

// ============================================================
// Factory
// ============================================================
std::unique_ptr<VoiceInput> VoiceInput::create(const fs::path& modelPath,
                                               const CaptureSettings& settings) {
    LOG_DEBUG("Voice", "Looking for Whisper model at: " + modelPath.string());

    std::error_code ec;
    if (!fs::exists(modelPath, ec)) {
        LOG_ERROR("Voice", "Whisper model missing: " + modelPath.string());
        ErrorManager::report("ERR_VOICE_NOT_INITIALIZED", modelPath.string());
        return nullptr;
    }

    if (Pa_Initialize() != paNoError) {
        ErrorManager::report("ERR_VOICE_NO_DEVICE", "Pa_Initialize failed");
        return nullptr;
    }

    int deviceIndex = (settings.inputDeviceIndex >= 0)
                        ? settings.inputDeviceIndex
                        : Pa_GetDefaultInputDevice();
    if (deviceIndex == paNoDevice || deviceIndex < 0 || deviceIndex >= Pa_GetDeviceCount()) {
        Pa_Terminate();
        ErrorManager::report("ERR_VOICE_NO_DEVICE", "index " + std::to_string(deviceIndex));
        return nullptr;
    }

    whisper_context_params cparams = whisper_context_default_params();
    whisper_context* ctx = whisper_init_from_file_with_params(modelPath.string().c_str(), cparams);
    if (!ctx) {
        Pa_Terminate();
        LOG_ERROR("Voice", "Failed to load Whisper model: " + modelPath.string());
        ErrorManager::report("ERR_VOICE_NOT_INITIALIZED", "whisper init failed");
        return nullptr;
    }

    LOG_PHASE("Whisper model load", true);
    return std::unique_ptr<VoiceInput>(new VoiceInput(ctx, deviceIndex, settings));
}

VoiceInput::VoiceInput(whisper_context* ctx, int deviceIndex, CaptureSettings settings)
    : ctx_(ctx), deviceIndex_(deviceIndex), settings_(std::move(settings)) {}

// ============================================================
// Shutdown
// ============================================================
VoiceInput::~VoiceInput() {
    LOG_DEBUG("Voice", "Releasing capture resources");
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
    Pa_Terminate();
}

// ============================================================
// Voice Input (Speech → Text)
// ============================================================
std::string VoiceInput::listen(const std::atomic<bool>* interrupt) {
    AudioData data;
    PaStream* stream = nullptr;

    const PaDeviceInfo* devInfo = Pa_GetDeviceInfo(deviceIndex_);
    if (!devInfo) {
        ErrorManager::report("ERR_VOICE_NO_DEVICE", "no device info");
        return "";
    }
    LOG_DEBUG("Voice", "Using input device: " + std::string(devInfo->name));

    PaStreamParameters inputParams;
    inputParams.device = deviceIndex_;
    inputParams.channelCount = 1;
    inputParams.sampleFormat = paFloat32;
    inputParams.suggestedLatency = devInfo->defaultLowInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    if (Pa_OpenStream(&stream, &inputParams, nullptr, 16000, 512,
                      paNoFlag, recordCallback, &data) != paNoError) {
        ErrorManager::report("ERR_VOICE_NO_DEVICE", "Pa_OpenStream failed");
        return "";
    }
    if (Pa_StartStream(stream) != paNoError) {
        Pa_CloseStream(stream);
        ErrorManager::report("ERR_VOICE_NO_DEVICE", "Pa_StartStream failed");
        return "";
    }
    LOG_DEBUG("Voice", "Listening...");

    std::vector<float> rollingBuffer;
    auto started     = std::chrono::steady_clock::now();
    auto lastSpeech  = started;
    auto speechStart = started;
    bool inSpeech = false;

    auto msSince = [](std::chrono::steady_clock::time_point t) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - t).count();
    };

    while (true) {
        if (interrupt && interrupt->load()) {
            LOG_DEBUG("Voice", "Capture interrupted");
            rollingBuffer.clear();
            break;
        }
        if (msSince(started) >= settings_.maxCaptureMs) {
            LOG_DEBUG("Voice", "Max capture length reached");
            break;
        }

        std::vector<float> chunk;
        {
            std::lock_guard<std::mutex> lock(data.mtx);
            if (data.buffer.size() >= 8000) {
                chunk.assign(data.buffer.begin(), data.buffer.begin() + 8000);
                data.buffer.erase(data.buffer.begin(), data.buffer.begin() + 8000);
            }
        }

        if (!chunk.empty()) {
            if (!isSilence(chunk, settings_.silenceThreshold)) {
                if (!inSpeech) {
                    speechStart = std::chrono::steady_clock::now();
                    inSpeech = true;
                    LOG_DEBUG("Voice", "Speech started");
                }
                lastSpeech = std::chrono::steady_clock::now();
                rollingBuffer.insert(rollingBuffer.end(), chunk.begin(), chunk.end());
            } else {
                auto msSpeech = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    lastSpeech - speechStart).count();
                SilenceVerdict v = judgeSilence(settings_, inSpeech, msSince(started),
                                                msSince(lastSpeech), msSpeech);
                if (v == SilenceVerdict::EndOfSpeech) {
                    LOG_DEBUG("Voice", "End of speech detected");
                    break;
                }
                if (v == SilenceVerdict::TimedOut) {
                    LOG_DEBUG("Voice", "Timeout reached");
                    break;
                }
            }
        }
        Pa_Sleep(50);
    }

    Pa_StopStream(stream);
    Pa_CloseStream(stream);
    LOG_DEBUG("Voice", "Stream stopped");

    std::string transcript = transcribe(rollingBuffer);
    if (!transcript.empty()) {
        LOG_DEBUG("Voice", "Heard: \"" + transcript + "\"");
    } else if (!(interrupt && interrupt->load())) {
        LOG_DEBUG("Voice", ResponseManager::get("voice_none"));
    }
    return transcript;
}

std::string VoiceInput::transcribe(const std::vector<float>& pcm) {
    if (pcm.empty()) return "";

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.no_timestamps = true;
    wparams.print_progress = false;
    wparams.print_realtime = false;
    wparams.language = settings_.language.c_str();

    std::string transcript;
    if (whisper_full(ctx_, wparams, pcm.data(), static_cast<int>(pcm.size())) != 0) {
        LOG_ERROR("Voice", "whisper_full failed");
        return "";
    }

    int n = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n; i++) {
        transcript += whisper_full_get_segment_text(ctx_, i);
        transcript += " ";
    }

    auto start = transcript.find_first_not_of(" \t\n\r");
    auto end   = transcript.find_last_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    return transcript.substr(start, end - start + 1);
}

} // namespace Voice
