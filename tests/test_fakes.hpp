#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <system_error>
#include <atomic>
#include <chrono>
#include <thread>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <unistd.h>

#include "ai.hpp"
#include "error_manager.hpp"
#include "reminders.hpp"
#include "system_actions.hpp"
#include "voice/voice_speak.hpp"

// ------------------------------------------------------------
// Capability fakes shared by the dispatcher / session tests
// ------------------------------------------------------------
class FakeChat : public ChatService {
public:
    explicit FakeChat(std::string answer = "hi there") : answer_(std::move(answer)) {}

    std::string reply(const std::string& query) override {
        queries.push_back(query);
        if (fail) throw ServiceError("backend down");
        return answer_;
    }

    std::vector<std::string> queries;
    bool fail = false;

private:
    std::string answer_;
};

class FakeSystem : public SystemActions {
public:
    bool openTarget(const std::string& target) override { opened.push_back(target); return ok; }
    bool closeTarget(const std::string& target) override { closed.push_back(target); return ok; }
    bool openUrl(const std::string& url) override { urls.push_back(url); return ok; }
    bool runSystemCommand(const std::string& command) override { commands.push_back(command); return ok; }

    std::vector<std::string> opened, closed, urls, commands;
    bool ok = true;
};

class FakeReminders : public ReminderStore {
public:
    void append(const std::string& text) override {
        if (fail) throw IoError("disk full");
        lines.push_back(text);
    }

    std::vector<std::string> lines;
    bool fail = false;
};

class FakeSpeech : public SpeechSink {
public:
    void speakAsync(const std::string& text) override {
        if (failing) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                    "no worker thread");
        }
        std::lock_guard<std::mutex> lock(mutex);
        spoken.push_back(text);
    }

    bool failing = false;
    std::mutex mutex;
    std::vector<std::string> spoken;
};

// ------------------------------------------------------------
// Speech controller fakes
// ------------------------------------------------------------

// Writes a real (tiny) file at 'out'; optionally slow or failing
class FakeSynthesizer : public Voice::Synthesizer {
public:
    void synthesize(const std::string& text, const std::filesystem::path& out) override {
        {
            std::lock_guard<std::mutex> lock(mutex);
            artifacts.push_back(out);
        }
        if (delayMs > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));

        std::ofstream f(out, std::ios::binary);
        f << "RIFF" << text;
        f.close();

        if (fail) throw SynthesisError("voice model missing");
    }

    std::vector<std::filesystem::path> artifactList() {
        std::lock_guard<std::mutex> lock(mutex);
        return artifacts;
    }

    std::atomic<int> delayMs{0};
    std::atomic<bool> fail{false};

private:
    std::mutex mutex;
    std::vector<std::filesystem::path> artifacts;
};

// "Plays" for durationMs, checking the cancel flag every few ms
class FakePlayer : public Voice::AudioPlayer {
public:
    bool play(const std::filesystem::path& path, const std::atomic<bool>& cancel) override {
        started++;
        if (!std::filesystem::exists(path)) throw PlaybackError("artifact missing");
        if (fail) throw PlaybackError("device lost");

        auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(durationMs.load());
        while (std::chrono::steady_clock::now() < until) {
            if (cancel.load()) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return true;
    }

    std::atomic<int> durationMs{50};
    std::atomic<bool> fail{false};
    std::atomic<int> started{0};
};

// Unique scratch directory, removed on destruction
struct TempDir {
    std::filesystem::path path;

    TempDir() {
        static std::atomic<int> counter{0};
        path = std::filesystem::temp_directory_path() /
               ("aria_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    size_t fileCount() const {
        size_t n = 0;
        for (auto it = std::filesystem::directory_iterator(path); it != std::filesystem::directory_iterator(); ++it) ++n;
        return n;
    }
};
