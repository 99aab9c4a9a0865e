#pragma once
#include <optional>
#include <string>

#include "bootstrap_config.hpp"
#include "engine/declarative_mapper.hpp"

// ------------------------------------------------------------
// Everything startup decided before the window opens
// ------------------------------------------------------------
struct BootstrapResult {
    bool proceed = true;       // false: exit now with exitCode
    int exitCode = 0;
    Settings settings;
    std::string fontPath;
    std::optional<bambam::Extension> extension;
};

// Command line, bambam.json, logger, error table, font, audio
// device, extension and joysticks, in that order.
BootstrapResult runBootstrapChecks(int argc, char** argv);
