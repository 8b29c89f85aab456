#pragma once
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <atomic>
#include <thread>
#include <future>
#include <functional>
#include <filesystem>
#include "voice_synth.hpp"
#include "voice_playback.hpp"

// ------------------------------------------------------------
// Fire-and-forget speech capability handed to command handlers
// ------------------------------------------------------------
class SpeechSink {
public:
    virtual ~SpeechSink() = default;
    virtual void speakAsync(const std::string& text) = 0;
};

namespace Voice {

    enum class SpeechState {
        Idle,
        Synthesizing,
        Playing
    };

    enum class SpeechStatus {
        Started,          // handed to the playback thread
        Completed,
        Cancelled,        // stopped, superseded, or paced out
        Busy,             // rejected, controller occupied
        SynthesisFailed,
        PlaybackFailed
    };

    std::string speechStatusName(SpeechStatus status);
    std::string speechStateName(SpeechState state);

    struct SpeechRequest {
        std::string text;
        // Called once after playback ends: true only on natural completion.
        // Runs on the playback thread; must not call back into the controller.
        std::function<void(bool completed)> onComplete;
    };

    // =========================================================
    // SpeechOutput: the single speech-output controller.
    //
    // At most one request is synthesizing or playing at any time.
    // - submit() while another submit is in progress → Busy (no queue).
    // - submit() while an earlier request is still playing → that
    //   playback is stopped and joined before synthesis starts.
    // - Every artifact is deleted when its playback ends, however
    //   it ends; onComplete runs after the delete.
    // =========================================================
    class SpeechOutput : public SpeechSink {
    public:
        SpeechOutput(std::unique_ptr<Synthesizer> synth,
                     std::unique_ptr<AudioPlayer> player,
                     std::filesystem::path artifactDir,
                     int pollIntervalMs = 30);
        ~SpeechOutput() override;

        SpeechOutput(const SpeechOutput&) = delete;
        SpeechOutput& operator=(const SpeechOutput&) = delete;

        // Without keepPlaying: returns Started once playback is handed off.
        // With keepPlaying: blocks until playback ends, calling it every
        // poll interval; returning false cancels. Returns the final status.
        SpeechStatus submit(SpeechRequest request,
                            const std::function<bool()>& keepPlaying = {});

        // SpeechSink: submit on a worker, result only logged
        void speakAsync(const std::string& text) override;

        void stop();                  // cancel current playback, join
        SpeechStatus wait();          // join current playback, its final status
        void shutdown();              // refuse new work, stop, join everything

        SpeechState state() const { return state_.load(); }
        bool isPlaying() const { return state_.load() == SpeechState::Playing; }

        const std::filesystem::path& artifactDir() const { return artifactDir_; }

    private:
        struct Playback {
            std::thread thread;
            std::atomic<bool> stop{false};
            std::atomic<bool> finished{false};
            std::atomic<SpeechStatus> status{SpeechStatus::Started};
        };

        std::filesystem::path newArtifactPath() const;
        void playbackMain(Playback& pb, std::filesystem::path artifact,
                          std::function<void(bool)> onComplete);
        SpeechStatus joinPlayback(bool cancel, const std::shared_ptr<Playback>& only = nullptr);
        void reapWorkers(bool all);

        std::unique_ptr<Synthesizer> synth_;
        std::unique_ptr<AudioPlayer> player_;
        std::filesystem::path artifactDir_;
        int pollIntervalMs_;

        std::atomic<bool> occupied_{false};
        std::atomic<SpeechState> state_{SpeechState::Idle};
        std::atomic<bool> shuttingDown_{false};

        std::mutex playbackMutex_;
        std::shared_ptr<Playback> current_;
        SpeechStatus lastStatus_ = SpeechStatus::Completed;

        std::mutex workersMutex_;
        std::vector<std::future<SpeechStatus>> workers_;
    };

} // namespace Voice
