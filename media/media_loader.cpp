#include "media_loader.hpp"
#include "logger.hpp"

#include <SFML/Audio/SoundBuffer.hpp>
#include <SFML/Graphics/Texture.hpp>

namespace Media {

bool loadSound(const std::filesystem::path& path, bambam::Resource& out) {
    auto buffer = std::make_shared<sf::SoundBuffer>();
    if (!buffer->loadFromFile(path)) {
        LOG_DEBUG("Media", "SFML could not decode sound: " + path.string());
        return false;
    }

    out.name = path.filename().string();
    out.path = path;
    out.sound = std::move(buffer);
    LOG_TRACE("Media", "Sound loaded: " + out.name);
    return true;
}

bool loadImage(const std::filesystem::path& path, bambam::Resource& out) {
    auto texture = std::make_shared<sf::Texture>();
    if (!texture->loadFromFile(path)) {
        LOG_DEBUG("Media", "SFML could not decode image: " + path.string());
        return false;
    }
    texture->setSmooth(true);

    out.name = path.filename().string();
    out.path = path;
    out.texture = std::move(texture);
    LOG_TRACE("Media", "Image loaded: " + out.name + " (" +
                       std::to_string(out.texture->getSize().x) + "x" +
                       std::to_string(out.texture->getSize().y) + ")");
    return true;
}

} // namespace Media
