#pragma once
#include <optional>
#include <string>
#include <vector>

#include "bootstrap_config.hpp"

// ------------------------------------------------------------
// Command line overrides (applied on top of bambam.json)
// ------------------------------------------------------------
struct CommandLine {
    std::optional<std::string> configPath;  // --config PATH
    bool uppercase = false;                 // -u, --uppercase
    bool deterministicSounds = false;       // -d, --deterministic-sounds
    bool dark = false;                      // -D, --dark
    bool mute = false;                      // -m, --mute
    bool noSound = false;                   // --nosound
    bool help = false;                      // -h, --help
    std::vector<std::string> soundBlacklist;
    std::vector<std::string> imageBlacklist;
    std::optional<std::string> extension;   // -e, --extension NAME
    std::optional<long long> seed;          // --seed N
};

// Returns false on an unknown flag or a flag missing its value
bool parseCommandLine(int argc, char** argv, CommandLine& out, std::string* err = nullptr);

// Flags only ever switch features on; blacklists are appended.
void applyCommandLine(const CommandLine& cli, Settings& settings);

std::string usageText(const std::string& program);
