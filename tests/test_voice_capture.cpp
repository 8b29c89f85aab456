#include <gtest/gtest.h>
#include "voice/voice.hpp"

#include <nlohmann/json.hpp>

using Voice::CaptureSettings;
using Voice::SilenceVerdict;
using Voice::judgeSilence;

TEST(CaptureSettingsTest, ReadsVoiceAndWhisperSections) {
    auto s = CaptureSettings::fromJson(nlohmann::json{
        {"voice", { {"silence_timeout_ms", 2500}, {"input_device_index", 3} }},
        {"whisper", { {"min_speech_ms", 200}, {"language", "de"} }}
    });
    EXPECT_EQ(s.silenceTimeoutMs, 2500);
    EXPECT_EQ(s.inputDeviceIndex, 3);
    EXPECT_EQ(s.minSpeechMs, 200);
    EXPECT_EQ(s.minSilenceMs, 1200);
    EXPECT_EQ(s.language, "de");
}

TEST(SilenceTest, RmsThreshold) {
    EXPECT_TRUE(Voice::isSilence({}, 0.02));
    EXPECT_TRUE(Voice::isSilence(std::vector<float>(100, 0.001f), 0.02));
    EXPECT_FALSE(Voice::isSilence(std::vector<float>(100, 0.5f), 0.02));
}

TEST(SilenceTest, QuietBeforeSpeechTimesOut) {
    CaptureSettings s;
    EXPECT_EQ(judgeSilence(s, false, 1000, 1000, 0), SilenceVerdict::KeepListening);
    EXPECT_EQ(judgeSilence(s, false, 4000, 4000, 0), SilenceVerdict::TimedOut);
}

TEST(SilenceTest, PauseAfterRealSpeechEndsTheUtterance) {
    CaptureSettings s;
    EXPECT_EQ(judgeSilence(s, true, 3000, 800, 1500), SilenceVerdict::KeepListening);
    EXPECT_EQ(judgeSilence(s, true, 3000, 1200, 1500), SilenceVerdict::EndOfSpeech);
}

TEST(SilenceTest, SingleNoisyChunkStillTimesOut) {
    CaptureSettings s;
    // One loud chunk: speech started and stopped at the same instant
    EXPECT_EQ(judgeSilence(s, true, 3000, 2500, 0), SilenceVerdict::KeepListening);
    EXPECT_EQ(judgeSilence(s, true, 4600, 4000, 0), SilenceVerdict::TimedOut);
}
