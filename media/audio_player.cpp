#include "audio_player.hpp"
#include "logger.hpp"

#include <algorithm>

void AudioPlayer::play(std::shared_ptr<const sf::SoundBuffer> buffer) {
    if (!buffer) {
        LOG_WARN("Audio", "play() called without a buffer");
        return;
    }

    if (active_.size() >= kMaxVoices) {
        active_.front().sound->stop();
        active_.erase(active_.begin());
    }

    ActiveSound entry;
    entry.sound = std::make_unique<sf::Sound>(*buffer);
    entry.buffer = std::move(buffer);
    entry.sound->play();
    active_.push_back(std::move(entry));
}

void AudioPlayer::fadeOutAll(float seconds) {
    if (seconds <= 0.f) {
        stopAll();
        return;
    }
    for (auto& s : active_) {
        if (s.fadeTotal == 0.f) {
            s.fadeTotal = seconds;
            s.fadeRemaining = seconds;
        }
    }
    LOG_DEBUG("Audio", "Fading out " + std::to_string(active_.size()) + " sound(s)");
}

void AudioPlayer::stopAll() {
    for (auto& s : active_) {
        s.sound->stop();
    }
    active_.clear();
}

void AudioPlayer::update(float dt) {
    for (auto& s : active_) {
        if (s.fadeTotal <= 0.f) continue;

        s.fadeRemaining -= dt;
        if (s.fadeRemaining <= 0.f) {
            s.sound->stop();
        } else {
            s.sound->setVolume(100.f * s.fadeRemaining / s.fadeTotal);
        }
    }

    active_.erase(
        std::remove_if(active_.begin(), active_.end(),
            [](const ActiveSound& s) {
                return s.sound->getStatus() == sf::SoundSource::Status::Stopped;
            }),
        active_.end()
    );
}
