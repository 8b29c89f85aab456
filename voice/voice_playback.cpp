#include "voice_playback.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <SFML/Audio.hpp>
#include <chrono>
#include <thread>

namespace Voice {

    SfmlAudioPlayer::SfmlAudioPlayer(int pollIntervalMs, int tailDelayMs)
        : pollIntervalMs_(pollIntervalMs > 0 ? pollIntervalMs : 30),
          tailDelayMs_(tailDelayMs >= 0 ? tailDelayMs : 0) {}

    bool SfmlAudioPlayer::play(const std::filesystem::path& path, const std::atomic<bool>& cancel) {
        sf::Music music;
        if (!music.openFromFile(path)) {
            throw PlaybackError("Could not load file: " + path.string());
        }

        music.setVolume(100.f);
        music.play();

        LOG_DEBUG("Voice/Audio", "Playing: " + path.filename().string() +
            " (duration=" + std::to_string(music.getDuration().asSeconds()) + "s)");

        while (music.getStatus() == sf::SoundSource::Status::Playing) {
            if (cancel.load()) {
                music.stop();
                LOG_TRACE("Voice/Audio", "Cancelled: " + path.filename().string());
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(pollIntervalMs_));
        }

        // Let the device drain before the stream is released
        std::this_thread::sleep_for(std::chrono::milliseconds(tailDelayMs_));
        return true;
    }

} // namespace Voice
