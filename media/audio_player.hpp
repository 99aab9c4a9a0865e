#pragma once
#include <memory>
#include <vector>
#include <SFML/Audio/Sound.hpp>
#include <SFML/Audio/SoundBuffer.hpp>

// -------------------------------------------------------------
// AudioPlayer: fire-and-forget sound playback
// Finished sounds are dropped in update(); fadeOutAll() ramps every
// playing sound to silence (used when the mute command arrives).
// -------------------------------------------------------------
class AudioPlayer {
public:
    /// Upper bound on simultaneous sounds; the oldest is cut.
    static constexpr std::size_t kMaxVoices = 16;

    void play(std::shared_ptr<const sf::SoundBuffer> buffer);
    void fadeOutAll(float seconds);
    void stopAll();

    // Advance fades and drop stopped sounds. dt in seconds.
    void update(float dt);

private:
    struct ActiveSound {
        std::shared_ptr<const sf::SoundBuffer> buffer;  // outlives 'sound'
        std::unique_ptr<sf::Sound> sound;
        float fadeTotal = 0.f;        // 0 = not fading
        float fadeRemaining = 0.f;
    };

    std::vector<ActiveSound> active_;
};
