#include "bootstrap.hpp"
#include "cli_args.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <SFML/Audio/PlaybackDevice.hpp>
#include <SFML/Window/Joystick.hpp>

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

static BootstrapResult stopWith(BootstrapResult result, int exitCode) {
    result.proceed = false;
    result.exitCode = exitCode;
    return result;
}

BootstrapResult runBootstrapChecks(int argc, char** argv) {
    BootstrapResult result;
    const std::string program = (argc > 0 && argv[0]) ? fs::path(argv[0]).filename().string() : "bambam";

    // ============================================================
    // Command line
    // ============================================================
    CommandLine cli;
    std::string cliError;
    if (!parseCommandLine(argc, argv, cli, &cliError)) {
        ErrorManager::report("ERR_CLI_ARGS", cliError);
        std::cerr << usageText(program);
        return stopWith(result, 1);
    }
    if (cli.help) {
        std::cout << usageText(program);
        return stopWith(result, 0);
    }

    // ============================================================
    // Settings (bambam.json + command line)
    // ============================================================
    beginPhaseGroup();
    const fs::path cfgPath = cli.configPath ? fs::path(*cli.configPath) : settingsPath();
    nlohmann::json cfg;
    bootstrap_config::loadConfig(cfgPath, bootstrap_config::defaultSettings(), cfg,
                                 SETTINGS_FILE, "ERR_CONFIG_INVALID");
    result.settings = bootstrap_config::settingsFromJson(cfg);
    applyCommandLine(cli, result.settings);
    endPhaseGroup();

    initLogger(result.settings.logFile);
    LOG_PHASE("Bootstrap begin", true);
    LOG_DEBUG("Config", "Settings file: " + cfgPath.string());

    // ============================================================
    // Error table overrides
    // ============================================================
    const fs::path errorsPath = fs::path(getResourcePath()) / "errors.json";
    if (fs::exists(errorsPath)) {
        std::string err;
        if (!ErrorManager::load(errorsPath.string(), &err)) {
            LOG_WARN("Config", "errors.json ignored: " + err);
        }
    }
    LOG_PHASE("Error table ready", true);

    // ============================================================
    // Fonts
    // ============================================================
    result.fontPath = findAnyFontInResources();
    if (result.fontPath.empty()) {
        ErrorManager::report("ERR_FONT_MISSING", getResourcePath());
        return stopWith(result, 1);
    }

    // ============================================================
    // Audio device
    // ============================================================
    if (result.settings.soundEnabled) {
        const std::optional<std::string> device = sf::PlaybackDevice::getDefaultDevice();
        if (!device) {
            result.settings.soundEnabled = false;
        } else {
            LOG_DEBUG("Audio", "Playback device: " + *device);
        }
    }
    if (!result.settings.soundEnabled) {
        LOG_WARN("Audio", "Warning, sound disabled.");
    }
    LOG_PHASE("Audio check", true);

    // ============================================================
    // Extension
    // ============================================================
    if (!result.settings.extension.empty()) {
        const std::string& name = result.settings.extension;
        fs::path dir = findExtensionDirectory(name);
        if (dir.empty()) {
            ErrorManager::report("ERR_EXT_NOT_FOUND", name);
            LOG_PHASE("Extension load", false);
            return stopWith(result, 1);
        }

        bambam::Extension ext;
        if (!bambam::loadExtension(dir, result.settings.soundEnabled, ext)) {
            LOG_PHASE("Extension load", false);
            return stopWith(result, 1);
        }
        ext.name = name;
        LOG_DEBUG("Config", "Extension '" + name + "': " +
                            std::to_string(ext.imageRules.size()) + " image rule(s), " +
                            std::to_string(ext.soundRules ? ext.soundRules->size() : 0) +
                            " sound rule(s)");
        result.extension = std::move(ext);
        LOG_PHASE("Extension load", true);
    }

    // ============================================================
    // Joysticks
    // ============================================================
    sf::Joystick::update();
    unsigned connected = 0;
    for (unsigned i = 0; i < sf::Joystick::Count; ++i) {
        if (!sf::Joystick::isConnected(i)) continue;
        ++connected;
        LOG_DEBUG("Input", "Joystick " + std::to_string(i) + ": " +
                           sf::Joystick::getIdentification(i).name.toAnsiString() +
                           " (" + std::to_string(sf::Joystick::getButtonCount(i)) + " buttons)");
    }
    LOG_DEBUG("Input", std::to_string(connected) + " joystick(s) connected");
    LOG_PHASE("Joystick scan", true);

    LOG_PHASE("Bootstrap complete", true);
    return result;
}
