#include "pch.hpp"
#include "bootstrap.hpp"
#include "bootstrap_config.hpp"
#include "resources.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "ui_draw.hpp"
#include "media/audio_player.hpp"
#include "media/media_loader.hpp"
#include "media/sfml_input.hpp"
#include "engine/response_engine.hpp"

namespace fs = std::filesystem;

// ============================================================
// Resource loading (sounds come from the extension when it has any)
// ============================================================
static bool loadResources(const BootstrapResult& boot,
                          std::shared_ptr<const bambam::ResourceSet>& sounds,
                          std::shared_ptr<const bambam::ResourceSet>& images) {
    const Settings& s = boot.settings;
    const std::vector<fs::path> dataDirs = dataDirectories();

    auto soundSet = std::make_shared<bambam::ResourceSet>();
    if (s.soundEnabled) {
        std::vector<fs::path> files;
        if (boot.extension) {
            files = globData({boot.extension->directory}, SOUND_PATTERNS);
            LOG_DEBUG("Resources", "Extension provides " + std::to_string(files.size()) + " sound file(s)");
        }
        if (files.empty()) {
            files = globData(dataDirs, SOUND_PATTERNS);
        }

        if (!bambam::loadItems(files, s.soundBlacklist, Media::loadSound,
                               bambam::ResourceCategory::Sounds, *soundSet)) {
            LOG_PHASE("Sound load", false);
            return false;
        }
        LOG_DEBUG("Resources", std::to_string(soundSet->size()) + " sound(s) loaded");
    }
    LOG_PHASE("Sound load", true);

    auto imageSet = std::make_shared<bambam::ResourceSet>();
    if (!bambam::loadItems(globData(dataDirs, IMAGE_PATTERNS), s.imageBlacklist, Media::loadImage,
                           bambam::ResourceCategory::Images, *imageSet)) {
        LOG_PHASE("Image load", false);
        return false;
    }
    LOG_DEBUG("Resources", std::to_string(imageSet->size()) + " image(s) loaded");
    LOG_PHASE("Image load", true);

    sounds = std::move(soundSet);
    images = std::move(imageSet);
    return true;
}

// ============================================================
// Main entry point
// ============================================================
int main(int argc, char* argv[]) {
    LOG_PHASE("Startup begin", true);

    BootstrapResult boot = runBootstrapChecks(argc, argv);
    if (!boot.proceed) {
        shutdownLogger();
        return boot.exitCode;
    }

    const bambam::EngineOptions options = bootstrap_config::engineOptions(boot.settings);
    std::mt19937 rng = bambam::makeGenerator(options.randomSeed);
    if (options.randomSeed) {
        LOG_DEBUG("Engine", "Random seed: " + std::to_string(*options.randomSeed));
    }

    // ============================================================
    // Window (pixel formats need a context before textures load)
    // ============================================================
    sf::RenderWindow window(sf::VideoMode::getDesktopMode(), kWindowTitle, sf::State::Fullscreen);
    window.setFramerateLimit(kFrameRate);
    window.setKeyRepeatEnabled(false);
    LOG_PHASE("Window created", true);

    std::shared_ptr<const bambam::ResourceSet> sounds;
    std::shared_ptr<const bambam::ResourceSet> images;
    if (!loadResources(boot, sounds, images)) {
        shutdownLogger();
        return 1;
    }

    std::unique_ptr<bambam::ResponseEngine> engine;
    const bambam::Extension* ext = boot.extension ? &*boot.extension : nullptr;
    if (!bambam::buildEngine(options, rng, sounds, images, ext, engine)) {
        LOG_PHASE("Engine build", false);
        shutdownLogger();
        return 1;
    }
    LOG_PHASE("Engine build", true);

    sf::Font font;
    if (!font.openFromFile(boot.fontPath)) {
        ErrorManager::report("ERR_FONT_MISSING", boot.fontPath);
        shutdownLogger();
        return 1;
    }

    Canvas canvas;
    if (!initCanvas(canvas, window.getSize(), boot.settings.dark)) {
        shutdownLogger();
        return 1;
    }
    drawWelcome(canvas, font);

    LOG_PHASE("Startup complete, entering main loop", true);

    // ============================================================
    // Event loop
    // ============================================================
    AudioPlayer audio;
    EventTranslator translator;
    std::vector<bambam::InputEvent> events;
    sf::Clock frameClock;
    int exitCode = 0;
    bool running = true;

    while (running && window.isOpen()) {
        events.clear();
        while (auto evOpt = window.pollEvent()) {
            translator.feed(*evOpt, events);
        }
        translator.flush(events);

        for (const auto& ev : events) {
            // First key or button only dismisses the welcome screen
            if (canvas.welcomeShown &&
                (ev.kind == bambam::EventKind::KeyDown ||
                 ev.kind == bambam::EventKind::DeviceButtonDown)) {
                clearCanvas(canvas, font);
                continue;
            }

            bambam::EngineAction action = engine->handle(ev);

            if (!action.success) {
                LOG_ERROR("Engine", action.errorCode + ": " + action.message);
                exitCode = 1;
                running = false;
                break;
            }
            if (action.terminate) {
                LOG_PHASE("Shutdown requested", true);
                running = false;
                break;
            }

            if (action.command == bambam::CommandWord::Mute) {
                audio.fadeOutAll(kMuteFadeSeconds);
            }
            if (action.clearCanvas) {
                clearCanvas(canvas, font);
            }
            if (action.sound && action.sound->resource) {
                audio.play(action.sound->resource->sound);
            }
            if (action.image) {
                drawResponse(canvas, font, *action.image, rng);
            }
        }

        audio.update(frameClock.restart().asSeconds());
        presentFrame(window, canvas);
    }

    // ============================================================
    // Shutdown cleanup
    // ============================================================
    audio.stopAll();
    window.close();
    LOG_PHASE("Shutdown complete", true);
    shutdownLogger();
    return exitCode;
}
