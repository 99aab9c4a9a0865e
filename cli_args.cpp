#include "cli_args.hpp"

#include <cstdint>
#include <limits>
#include <sstream>

bool parseCommandLine(int argc, char** argv, CommandLine& out, std::string* err) {
    auto fail = [&](const std::string& msg) {
        if (err) *err = msg;
        return false;
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        // --flag=value form
        std::string name = arg;
        std::optional<std::string> inlineValue;
        if (arg.rfind("--", 0) == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                name = arg.substr(0, eq);
                inlineValue = arg.substr(eq + 1);
            }
        }

        auto takeValue = [&](std::string& value) {
            if (inlineValue) {
                value = *inlineValue;
                return true;
            }
            if (i + 1 >= argc) {
                return false;
            }
            value = argv[++i];
            return true;
        };

        std::string value;
        if (name == "-u" || name == "--uppercase") {
            out.uppercase = true;
        } else if (name == "-d" || name == "--deterministic-sounds") {
            out.deterministicSounds = true;
        } else if (name == "-D" || name == "--dark") {
            out.dark = true;
        } else if (name == "-m" || name == "--mute") {
            out.mute = true;
        } else if (name == "--nosound") {
            out.noSound = true;
        } else if (name == "-h" || name == "--help") {
            out.help = true;
        } else if (name == "--sound_blacklist") {
            if (!takeValue(value)) return fail(name + " needs a pattern");
            out.soundBlacklist.push_back(value);
        } else if (name == "--image_blacklist") {
            if (!takeValue(value)) return fail(name + " needs a pattern");
            out.imageBlacklist.push_back(value);
        } else if (name == "-e" || name == "--extension") {
            if (!takeValue(value)) return fail(name + " needs an extension name");
            out.extension = value;
        } else if (name == "--config") {
            if (!takeValue(value)) return fail(name + " needs a path");
            out.configPath = value;
        } else if (name == "--seed") {
            if (!takeValue(value)) return fail(name + " needs a number");
            try {
                size_t used = 0;
                long long seed = std::stoll(value, &used);
                if (used != value.size() || seed < 0 ||
                    seed > static_cast<long long>(std::numeric_limits<std::uint32_t>::max())) {
                    return fail("--seed expects an integer from 0 to 4294967295, got '" + value + "'");
                }
                out.seed = seed;
            } catch (const std::exception&) {
                return fail("--seed expects an integer from 0 to 4294967295, got '" + value + "'");
            }
        } else {
            return fail("Unknown argument: " + arg);
        }
    }
    return true;
}

void applyCommandLine(const CommandLine& cli, Settings& settings) {
    if (cli.uppercase)           settings.uppercase = true;
    if (cli.deterministicSounds) settings.deterministicSounds = true;
    if (cli.dark)                settings.dark = true;
    if (cli.mute)                settings.mute = true;
    if (cli.noSound)             settings.soundEnabled = false;
    if (cli.extension)           settings.extension = *cli.extension;
    if (cli.seed)                settings.randomSeed = *cli.seed;

    settings.soundBlacklist.insert(settings.soundBlacklist.end(),
                                   cli.soundBlacklist.begin(), cli.soundBlacklist.end());
    settings.imageBlacklist.insert(settings.imageBlacklist.end(),
                                   cli.imageBlacklist.begin(), cli.imageBlacklist.end());
}

std::string usageText(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "A keyboard mashing game for babies.\n\n"
        << "  -u, --uppercase             Show UPPER-CASE letters.\n"
        << "  -d, --deterministic-sounds  Same key, same sound.\n"
        << "  -D, --dark                  Dark background instead of a light one.\n"
        << "  -m, --mute                  Start muted (type \"unmute\" to enable sound).\n"
        << "      --nosound               Disable audio entirely.\n"
        << "      --sound_blacklist PAT   Never play sounds matching PAT (repeatable).\n"
        << "      --image_blacklist PAT   Never show images matching PAT (repeatable).\n"
        << "  -e, --extension NAME        Use extensions/NAME/event_map.json.\n"
        << "      --seed N                Seed the random generator (reproducible runs).\n"
        << "      --config PATH           Settings file (default bambam.json).\n"
        << "  -h, --help                  Show this help.\n\n"
        << "Commands typed while playing: quit, mute, unmute\n";
    return oss.str();
}
