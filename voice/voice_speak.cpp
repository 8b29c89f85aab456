#include "voice_speak.hpp"
#include "logger.hpp"

#include <chrono>
#include <random>

namespace fs = std::filesystem;

namespace Voice {

    // =========================================================
    // Helpers
    // =========================================================
    static std::string randomString(size_t length) {
        static const char charset[] =
            "0123456789"
            "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
            "abcdefghijklmnopqrstuvwxyz";
        static thread_local std::mt19937 rg{std::random_device{}()};
        static thread_local std::uniform_int_distribution<size_t> dist(0, sizeof(charset) - 2);

        std::string result;
        result.reserve(length);
        for (size_t i = 0; i < length; i++) {
            result.push_back(charset[dist(rg)]);
        }
        return result;
    }

    static std::string preview(const std::string& text) {
        return text.size() > 40 ? text.substr(0, 40) + "..." : text;
    }

    std::string speechStatusName(SpeechStatus status) {
        switch (status) {
            case SpeechStatus::Started:         return "started";
            case SpeechStatus::Completed:       return "completed";
            case SpeechStatus::Cancelled:       return "cancelled";
            case SpeechStatus::Busy:            return "busy";
            case SpeechStatus::SynthesisFailed: return "synthesis_failed";
            case SpeechStatus::PlaybackFailed:  return "playback_failed";
        }
        return "unknown";
    }

    std::string speechStateName(SpeechState state) {
        switch (state) {
            case SpeechState::Idle:         return "idle";
            case SpeechState::Synthesizing: return "synthesizing";
            case SpeechState::Playing:      return "playing";
        }
        return "unknown";
    }

    // =========================================================
    // Construction
    // =========================================================
    SpeechOutput::SpeechOutput(std::unique_ptr<Synthesizer> synth,
                               std::unique_ptr<AudioPlayer> player,
                               fs::path artifactDir,
                               int pollIntervalMs)
        : synth_(std::move(synth)),
          player_(std::move(player)),
          artifactDir_(std::move(artifactDir)),
          pollIntervalMs_(pollIntervalMs > 0 ? pollIntervalMs : 30) {
        std::error_code ec;
        fs::create_directories(artifactDir_, ec);
        if (ec) {
            LOG_ERROR("Speech", "Cannot create artifact dir " + artifactDir_.string() + ": " + ec.message());
        }
    }

    SpeechOutput::~SpeechOutput() {
        shutdown();
    }

    fs::path SpeechOutput::newArtifactPath() const {
        std::error_code ec;
        fs::create_directories(artifactDir_, ec);
        return artifactDir_ / ("speech_" + randomString(32) + ".wav");
    }

    // =========================================================
    // Playback thread
    // =========================================================
    void SpeechOutput::playbackMain(Playback& pb, fs::path artifact,
                                    std::function<void(bool)> onComplete) {
        SpeechStatus status = SpeechStatus::Completed;
        try {
            bool finished = player_->play(artifact, pb.stop);
            status = finished ? SpeechStatus::Completed : SpeechStatus::Cancelled;
        } catch (const std::exception& e) {
            LOG_ERROR("Speech", std::string("Playback failed: ") + e.what());
            status = SpeechStatus::PlaybackFailed;
        }

        // 🔹 Cleanup runs whatever happened above
        std::error_code ec;
        fs::remove(artifact, ec);
        if (ec) {
            LOG_ERROR("Speech", "Could not delete " + artifact.string() + ": " + ec.message());
        }

        if (onComplete) {
            try {
                onComplete(status == SpeechStatus::Completed);
            } catch (const std::exception& e) {
                LOG_ERROR("Speech", std::string("onComplete threw: ") + e.what());
            }
        }

        LOG_TRACE("Speech", "Playback " + speechStatusName(status) + ": " + artifact.filename().string());

        pb.status.store(status);
        state_.store(SpeechState::Idle);
        pb.finished.store(true);
    }

    // Join the current playback. With 'cancel', its stop flag is raised
    // first. With 'only', nothing happens unless it is still current.
    SpeechStatus SpeechOutput::joinPlayback(bool cancel, const std::shared_ptr<Playback>& only) {
        std::lock_guard<std::mutex> lock(playbackMutex_);
        if (!current_ || (only && current_ != only)) {
            return only ? only->status.load() : lastStatus_;
        }

        if (cancel) current_->stop.store(true);
        if (current_->thread.joinable()) current_->thread.join();

        lastStatus_ = current_->status.load();
        current_.reset();
        return lastStatus_;
    }

    // =========================================================
    // Submit
    // =========================================================
    SpeechStatus SpeechOutput::submit(SpeechRequest request,
                                      const std::function<bool()>& keepPlaying) {
        if (occupied_.exchange(true)) {
            LOG_DEBUG("Speech", "Busy, rejected: \"" + preview(request.text) + "\"");
            return SpeechStatus::Busy;
        }
        struct Release {
            std::atomic<bool>& flag;
            ~Release() { flag.store(false); }
        } release{ occupied_ };

        // Supersede whatever is still playing
        if (state_.load() == SpeechState::Playing) {
            LOG_TRACE("Speech", "Superseding current playback");
        }
        joinPlayback(true);

        // --- Synthesize ---
        state_.store(SpeechState::Synthesizing);
        fs::path artifact = newArtifactPath();
        try {
            synth_->synthesize(request.text, artifact);
        } catch (const std::exception& e) {
            std::error_code ec;
            fs::remove(artifact, ec);
            state_.store(SpeechState::Idle);
            LOG_ERROR("Speech", std::string("Synthesis failed: ") + e.what());
            return SpeechStatus::SynthesisFailed;
        }

        // --- Hand off to the playback thread ---
        auto pb = std::make_shared<Playback>();
        {
            std::lock_guard<std::mutex> lock(playbackMutex_);
            state_.store(SpeechState::Playing);
            current_ = pb;
            try {
                pb->thread = std::thread(
                    [this, pb, artifact, cb = std::move(request.onComplete)]() mutable {
                        playbackMain(*pb, artifact, std::move(cb));
                    });
            } catch (const std::system_error& e) {
                current_.reset();
                std::error_code ec;
                fs::remove(artifact, ec);
                state_.store(SpeechState::Idle);
                LOG_ERROR("Speech", std::string("Could not start playback thread: ") + e.what());
                return SpeechStatus::PlaybackFailed;
            }
        }
        LOG_DEBUG("Speech", "Speaking: \"" + preview(request.text) + "\"");

        if (!keepPlaying) return SpeechStatus::Started;

        // --- Caller-paced: poll until done or told to stop ---
        while (!pb->finished.load()) {
            if (!pb->stop.load()) {
                bool keep = true;
                try {
                    keep = keepPlaying();
                } catch (const std::exception& e) {
                    LOG_ERROR("Speech", std::string("Pacing predicate threw: ") + e.what());
                    keep = false;
                }
                if (!keep) {
                    LOG_TRACE("Speech", "Stopped by caller");
                    pb->stop.store(true);
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(pollIntervalMs_));
        }
        return joinPlayback(false, pb);
    }

    // =========================================================
    // Fire-and-forget
    // =========================================================
    void SpeechOutput::speakAsync(const std::string& text) {
        if (text.empty()) return;
        if (shuttingDown_.load()) {
            LOG_DEBUG("Speech", "Shutting down, dropped: \"" + preview(text) + "\"");
            return;
        }

        reapWorkers(false);

        std::lock_guard<std::mutex> lock(workersMutex_);
        workers_.push_back(std::async(std::launch::async, [this, text] {
            SpeechStatus s = submit({ text, {} });
            if (s != SpeechStatus::Started) {
                LOG_DEBUG("Speech", "speakAsync → " + speechStatusName(s));
            }
            return s;
        }));
    }

    void SpeechOutput::reapWorkers(bool all) {
        std::lock_guard<std::mutex> lock(workersMutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (!all && it->wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                ++it;
                continue;
            }
            try {
                it->get();
            } catch (const std::exception& e) {
                LOG_ERROR("Speech", std::string("Speech worker failed: ") + e.what());
            }
            it = workers_.erase(it);
        }
    }

    // =========================================================
    // Stop / Wait / Shutdown
    // =========================================================
    void SpeechOutput::stop() {
        joinPlayback(true);
    }

    SpeechStatus SpeechOutput::wait() {
        std::shared_ptr<Playback> pb;
        {
            std::lock_guard<std::mutex> lock(playbackMutex_);
            if (!current_) return lastStatus_;
            pb = current_;
        }
        while (!pb->finished.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(pollIntervalMs_));
        }
        return joinPlayback(false, pb);
    }

    void SpeechOutput::shutdown() {
        bool first = !shuttingDown_.exchange(true);
        reapWorkers(true);
        joinPlayback(true);
        if (first) LOG_PHASE("Speech output shutdown", true);
    }

} // namespace Voice
