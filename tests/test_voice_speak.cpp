#include <gtest/gtest.h>
#include "voice/voice_speak.hpp"
#include "voice/voice_synth.hpp"
#include "test_fakes.hpp"

#include <future>

namespace fs = std::filesystem;
using namespace Voice;
using namespace std::chrono_literals;

// Spin until cond() or ~2 s
template <typename Cond>
static bool eventually(Cond cond) {
    for (int i = 0; i < 400; ++i) {
        if (cond()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return cond();
}

class SpeechOutputTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto s = std::make_unique<FakeSynthesizer>();
        auto p = std::make_unique<FakePlayer>();
        synth = s.get();
        player = p.get();
        speech = std::make_unique<SpeechOutput>(std::move(s), std::move(p), tmp.path / "speech", 5);
    }

    size_t artifactsOnDisk() const {
        size_t n = 0;
        for (auto& e : fs::directory_iterator(tmp.path / "speech")) {
            (void)e;
            ++n;
        }
        return n;
    }

    TempDir tmp;
    FakeSynthesizer* synth = nullptr;
    FakePlayer* player = nullptr;
    std::unique_ptr<SpeechOutput> speech;
};

TEST_F(SpeechOutputTest, PacedSubmitCompletesAndCleansUp) {
    std::atomic<int> calls{0};
    std::atomic<bool> completed{false};

    SpeechRequest req{ "hello", [&](bool ok) { calls++; completed = ok; } };
    auto status = speech->submit(req, [] { return true; });

    EXPECT_EQ(status, SpeechStatus::Completed);
    EXPECT_EQ(calls.load(), 1);
    EXPECT_TRUE(completed.load());
    EXPECT_EQ(artifactsOnDisk(), 0u);
    EXPECT_EQ(speech->state(), SpeechState::Idle);
}

TEST_F(SpeechOutputTest, ArtifactNamesAreRandomWavFiles) {
    speech->submit({ "one", {} }, [] { return true; });
    speech->submit({ "two", {} }, [] { return true; });

    auto names = synth->artifactList();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_NE(names[0], names[1]);
    for (const auto& p : names) {
        EXPECT_EQ(p.parent_path(), tmp.path / "speech");
        EXPECT_EQ(p.extension(), ".wav");
        EXPECT_EQ(p.filename().string().size(), std::string("speech_").size() + 32 + 4);
    }
}

TEST_F(SpeechOutputTest, UnpacedSubmitReturnsStartedThenWaitCompletes) {
    player->durationMs = 40;
    EXPECT_EQ(speech->submit({ "hi", {} }), SpeechStatus::Started);
    EXPECT_EQ(speech->wait(), SpeechStatus::Completed);
    EXPECT_EQ(artifactsOnDisk(), 0u);
}

TEST_F(SpeechOutputTest, SupersessionStopsAndDeletesThePreviousPlayback) {
    std::atomic<int> aCalls{0};
    std::atomic<bool> aCompleted{true};

    player->durationMs = 5000;
    ASSERT_EQ(speech->submit({ "first", [&](bool ok) { aCalls++; aCompleted = ok; } }),
              SpeechStatus::Started);
    ASSERT_TRUE(eventually([&] { return player->started.load() == 1; }));
    fs::path aArtifact = synth->artifactList().at(0);

    player->durationMs = 30;
    auto begin = std::chrono::steady_clock::now();
    ASSERT_EQ(speech->submit({ "second", {} }), SpeechStatus::Started);

    // A was stopped well before its natural end
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 2s);
    EXPECT_FALSE(fs::exists(aArtifact));
    EXPECT_EQ(aCalls.load(), 1);
    EXPECT_FALSE(aCompleted.load());

    EXPECT_EQ(speech->wait(), SpeechStatus::Completed);
    EXPECT_EQ(artifactsOnDisk(), 0u);
    EXPECT_EQ(player->started.load(), 2);
}

TEST_F(SpeechOutputTest, SubmitDuringSynthesisIsRejectedAsBusy) {
    synth->delayMs = 300;
    player->durationMs = 20;

    auto first = std::async(std::launch::async, [&] {
        return speech->submit({ "slow one", {} });
    });
    ASSERT_TRUE(eventually([&] { return speech->state() == SpeechState::Synthesizing; }));

    EXPECT_EQ(speech->submit({ "rejected", {} }), SpeechStatus::Busy);

    EXPECT_EQ(first.get(), SpeechStatus::Started);
    EXPECT_EQ(speech->wait(), SpeechStatus::Completed);

    // The rejected request never reached the synthesizer
    EXPECT_EQ(synth->artifactList().size(), 1u);
    EXPECT_EQ(artifactsOnDisk(), 0u);
}

TEST_F(SpeechOutputTest, PacedPlaybackHoldsTheControllerBusy) {
    player->durationMs = 5000;
    std::atomic<bool> keep{true};

    auto paced = std::async(std::launch::async, [&] {
        return speech->submit({ "long", {} }, [&] { return keep.load(); });
    });
    ASSERT_TRUE(eventually([&] { return speech->isPlaying(); }));

    EXPECT_EQ(speech->submit({ "other", {} }), SpeechStatus::Busy);

    keep = false;
    EXPECT_EQ(paced.get(), SpeechStatus::Cancelled);
    EXPECT_EQ(artifactsOnDisk(), 0u);
}

TEST_F(SpeechOutputTest, SynthesisFailureLeavesNothingBehind) {
    synth->fail = true;
    std::atomic<int> calls{0};

    auto status = speech->submit({ "broken", [&](bool) { calls++; } });

    EXPECT_EQ(status, SpeechStatus::SynthesisFailed);
    EXPECT_EQ(calls.load(), 0);
    EXPECT_EQ(player->started.load(), 0);
    EXPECT_EQ(artifactsOnDisk(), 0u);
    EXPECT_EQ(speech->state(), SpeechState::Idle);

    // Controller is usable again
    synth->fail = false;
    EXPECT_EQ(speech->submit({ "fine", {} }, [] { return true; }), SpeechStatus::Completed);
}

TEST_F(SpeechOutputTest, PlaybackFailureStillCleansUpAndNotifies) {
    player->fail = true;
    std::atomic<int> calls{0};
    std::atomic<bool> completed{true};

    auto status = speech->submit({ "x", [&](bool ok) { calls++; completed = ok; } },
                                 [] { return true; });

    EXPECT_EQ(status, SpeechStatus::PlaybackFailed);
    EXPECT_EQ(calls.load(), 1);
    EXPECT_FALSE(completed.load());
    EXPECT_EQ(artifactsOnDisk(), 0u);
    EXPECT_EQ(speech->state(), SpeechState::Idle);
}

TEST_F(SpeechOutputTest, CallerPacingCancelsEarly) {
    player->durationMs = 5000;
    int ticks = 0;

    auto begin = std::chrono::steady_clock::now();
    auto status = speech->submit({ "long", {} }, [&] { return ++ticks < 3; });

    EXPECT_EQ(status, SpeechStatus::Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 2s);
    EXPECT_EQ(artifactsOnDisk(), 0u);
}

TEST_F(SpeechOutputTest, ThrowingPacingPredicateCancels) {
    player->durationMs = 5000;
    auto status = speech->submit({ "long", {} }, []() -> bool { throw std::runtime_error("ui gone"); });
    EXPECT_EQ(status, SpeechStatus::Cancelled);
    EXPECT_EQ(artifactsOnDisk(), 0u);
}

TEST_F(SpeechOutputTest, StopCancelsCurrentPlayback) {
    player->durationMs = 5000;
    ASSERT_EQ(speech->submit({ "long", {} }), SpeechStatus::Started);
    ASSERT_TRUE(eventually([&] { return player->started.load() == 1; }));

    speech->stop();

    EXPECT_EQ(speech->state(), SpeechState::Idle);
    EXPECT_EQ(speech->wait(), SpeechStatus::Cancelled);
    EXPECT_EQ(artifactsOnDisk(), 0u);
}

TEST_F(SpeechOutputTest, SpeakAsyncRunsInTheBackgroundAndShutdownJoins) {
    player->durationMs = 5000;
    speech->speakAsync("background");
    ASSERT_TRUE(eventually([&] { return player->started.load() == 1; }));

    speech->shutdown();
    EXPECT_EQ(speech->state(), SpeechState::Idle);
    EXPECT_EQ(artifactsOnDisk(), 0u);

    // Refused after shutdown
    speech->speakAsync("late");
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(synth->artifactList().size(), 1u);
}

TEST_F(SpeechOutputTest, SpeakAsyncIgnoresEmptyText) {
    speech->speakAsync("");
    speech->shutdown();
    EXPECT_TRUE(synth->artifactList().empty());
}

TEST(SpeechStatusTest, Names) {
    EXPECT_EQ(speechStatusName(SpeechStatus::Busy), "busy");
    EXPECT_EQ(speechStatusName(SpeechStatus::SynthesisFailed), "synthesis_failed");
    EXPECT_EQ(speechStateName(SpeechState::Playing), "playing");
}

// ------------------------------------------------------------
// CommandSynthesizer (real child processes, no shell parsing of text)
// ------------------------------------------------------------
TEST(CommandSynthesizerTest, ExpandsPlaceholders) {
    CommandSynthesizer synth(std::vector<std::string>{ "espeak-ng", "-w", "{out}", "--", "{text}" });
    auto argv = synth.expand("it's \"quoted\"; rm -rf", "/tmp/a.wav");
    EXPECT_EQ(argv, (std::vector<std::string>{
        "espeak-ng", "-w", "/tmp/a.wav", "--", "it's \"quoted\"; rm -rf" }));
}

TEST(CommandSynthesizerTest, WritesArtifact) {
    TempDir tmp;
    fs::path out = tmp.path / "a.wav";
    CommandSynthesizer synth(std::vector<std::string>{
        "sh", "-c", "printf '%s' \"$1\" > \"$0\"", "{out}", "{text}" });

    ASSERT_NO_THROW(synth.synthesize("hello", out));
    EXPECT_TRUE(fs::exists(out));
    EXPECT_EQ(fs::file_size(out), 5u);
}

TEST(CommandSynthesizerTest, FailuresThrowSynthesisError) {
    using Argv = std::vector<std::string>;
    TempDir tmp;

    CommandSynthesizer failing(Argv{ "false" });
    EXPECT_THROW(failing.synthesize("x", tmp.path / "a.wav"), SynthesisError);

    // exits 0 but writes nothing
    CommandSynthesizer silent(Argv{ "true" });
    EXPECT_THROW(silent.synthesize("x", tmp.path / "b.wav"), SynthesisError);

    CommandSynthesizer missing(Argv{ "/nonexistent/aria-tts" });
    EXPECT_THROW(missing.synthesize("x", tmp.path / "c.wav"), SynthesisError);

    CommandSynthesizer empty(Argv{});
    EXPECT_THROW(empty.synthesize("x", tmp.path / "d.wav"), SynthesisError);
}
