#pragma once
#include <atomic>
#include <filesystem>

namespace Voice {

    // =========================================================
    // AudioPlayer: plays one file to the end or until 'cancel'
    // is raised. Returns true on natural completion, false when
    // cancelled. Throws PlaybackError. The audio resource is
    // released before returning.
    // =========================================================
    class AudioPlayer {
    public:
        virtual ~AudioPlayer() = default;
        virtual bool play(const std::filesystem::path& path, const std::atomic<bool>& cancel) = 0;
    };

    // SFML streaming player (sf::Music)
    class SfmlAudioPlayer : public AudioPlayer {
    public:
        explicit SfmlAudioPlayer(int pollIntervalMs = 30, int tailDelayMs = 50);

        bool play(const std::filesystem::path& path, const std::atomic<bool>& cancel) override;

    private:
        int pollIntervalMs_;
        int tailDelayMs_;
    };

} // namespace Voice
