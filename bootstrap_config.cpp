#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <system_error>

namespace fs = std::filesystem;

// ----------------- helpers -----------------
static bool mergeDefaults(nlohmann::json& cfg,
                          const nlohmann::json& defs,
                          const std::string& prefix = "",
                          int* patchedCount = nullptr) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (mergeDefaults(cfg[key], defVal,
                              prefix.empty() ? key : prefix + "." + key,
                              patchedCount))
                patched = true;
        } else if (cfg[key].type() != defVal.type() &&
                   !(cfg[key].is_number_integer() && defVal.is_number_integer())) {
            LOG_WARN("Config", "Key '" + (prefix.empty() ? key : prefix + "." + key) +
                               "' has the wrong type, using default");
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        }
    }
    return patched;
}

static void saveConfig(const fs::path& path, const nlohmann::json& cfg) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        LOG_WARN("Config", "Could not write " + path.string());
        return;
    }
    out << cfg.dump(2) << "\n";
}

static std::vector<std::string> stringList(const nlohmann::json& j) {
    std::vector<std::string> out;
    if (!j.is_array()) return out;
    for (const auto& v : j) {
        if (v.is_string()) {
            out.push_back(v.get<std::string>());
        } else {
            LOG_WARN("Config", "Ignoring non-string pattern: " + v.dump());
        }
    }
    return out;
}

namespace bootstrap_config {

// ----------------- defaults -----------------
nlohmann::json defaultSettings() {
    return {
        {"uppercase", false},
        {"deterministic_sounds", false},
        {"dark", false},
        {"mute", false},
        {"sound_enabled", true},
        {"sound_blacklist", nlohmann::json::array()},
        {"image_blacklist", nlohmann::json::array()},
        {"extension", ""},
        {"random_seed", -1},
        {"log_file", "bambam.log"}
    };
}

// ----------------- loader -----------------
bool loadConfig(const fs::path& path,
                const nlohmann::json& defaults,
                nlohmann::json& outConfig,
                const std::string& name,
                const std::string& errorCode) {
    if (!fs::exists(path)) {
        outConfig = defaults;
        saveConfig(path, outConfig);

        LOG_PHASE(name + " created", true);
        return true;
    }

    auto resetToDefaults = [&](const std::string& reason) {
        LOG_ERROR("Config", name + " invalid → reset to defaults (" + reason + ")");
        LOG_PHASE(name + " load", false);

        if (!errorCode.empty())
            ErrorManager::report(errorCode, path.string());

        outConfig = defaults;
        saveConfig(path, outConfig);
        return false;
    };

    try {
        std::ifstream f(path);
        f >> outConfig;
    } catch (const nlohmann::json::exception& e) {
        return resetToDefaults(e.what());
    }

    if (!outConfig.is_object()) {
        return resetToDefaults("expected a JSON object");
    }

    int patchedCount = 0;
    if (mergeDefaults(outConfig, defaults, "", &patchedCount)) {
        saveConfig(path, outConfig);
        LOG_PHASE(name + " patched", true);
        LOG_DEBUG("Config", name + " patched (" + std::to_string(patchedCount) + " keys)");
    } else {
        LOG_PHASE(name + " load", true);
    }
    return true;
}

// ----------------- conversion -----------------
// -1 (unseeded) or a value that fits the 32-bit generator seed
static long long seedFrom(const nlohmann::json& cfg) {
    auto it = cfg.find("random_seed");
    if (it == cfg.end() || !it->is_number_integer()) return -1;

    if (it->is_number_unsigned()) {
        if (it->get<std::uint64_t>() <= std::numeric_limits<std::uint32_t>::max()) {
            return it->get<long long>();
        }
    } else if (it->get<long long>() == -1) {
        return -1;
    }
    LOG_WARN("Config", "Key 'random_seed' out of range (" + it->dump() + "), using default");
    return -1;
}

Settings settingsFromJson(const nlohmann::json& cfg) {
    const nlohmann::json defs = defaultSettings();
    auto flag = [&](const char* key) {
        return cfg.value(key, defs[key].get<bool>());
    };

    Settings s;
    s.uppercase           = flag("uppercase");
    s.deterministicSounds = flag("deterministic_sounds");
    s.dark                = flag("dark");
    s.mute                = flag("mute");
    s.soundEnabled        = flag("sound_enabled");
    s.soundBlacklist      = stringList(cfg.value("sound_blacklist", nlohmann::json::array()));
    s.imageBlacklist      = stringList(cfg.value("image_blacklist", nlohmann::json::array()));
    s.extension           = cfg.value("extension", std::string());
    s.randomSeed          = seedFrom(cfg);
    s.logFile             = cfg.value("log_file", std::string("bambam.log"));
    return s;
}

bambam::EngineOptions engineOptions(const Settings& settings) {
    bambam::EngineOptions opts;
    opts.uppercaseLetters    = settings.uppercase;
    opts.deterministicSounds = settings.deterministicSounds;
    opts.startMuted          = settings.mute;
    opts.soundEnabled        = settings.soundEnabled;
    if (settings.randomSeed >= 0) {
        opts.randomSeed = static_cast<std::uint32_t>(settings.randomSeed);
    }
    if (!settings.extension.empty()) {
        opts.activeExtensionName = settings.extension;
    }
    return opts;
}

} // namespace bootstrap_config
