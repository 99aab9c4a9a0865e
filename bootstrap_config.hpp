#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <filesystem>

#include "engine/response_engine.hpp"

inline constexpr const char* SETTINGS_FILE = "bambam.json";

// ------------------------------------------------------------
// Settings: bambam.json after defaults and command line
// ------------------------------------------------------------
struct Settings {
    bool uppercase = false;
    bool deterministicSounds = false;
    bool dark = false;
    bool mute = false;                       // start muted
    bool soundEnabled = true;
    std::vector<std::string> soundBlacklist; // glob patterns
    std::vector<std::string> imageBlacklist;
    std::string extension;                   // empty = built-in rules
    long long randomSeed = -1;               // -1 = unseeded
    std::string logFile = "bambam.log";      // empty = console only
};

// Centralized settings bootstrap
namespace bootstrap_config {

    // Generic loader → ensures defaults, patches missing keys, saves back
    bool loadConfig(const std::filesystem::path& path,
                    const nlohmann::json& defaults,
                    nlohmann::json& outConfig,
                    const std::string& name,
                    const std::string& errorCode = "");

    // Canonical defaults
    nlohmann::json defaultSettings();

    // JSON (already patched with defaults) → Settings
    Settings settingsFromJson(const nlohmann::json& cfg);

    // Settings → engine construction parameters
    bambam::EngineOptions engineOptions(const Settings& settings);
}
