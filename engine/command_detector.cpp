#include "command_detector.hpp"
#include "input_event.hpp"

namespace bambam {

namespace {

struct CommandEntry {
    CommandWord word;
    const char32_t* text;
};

// Priority order matters: "unmute" must win over "mute"
constexpr CommandEntry kCommands[] = {
    { CommandWord::Quit,   U"quit"   },
    { CommandWord::Unmute, U"unmute" },
    { CommandWord::Mute,   U"mute"   },
};

} // namespace

const char* commandName(CommandWord cmd) {
    switch (cmd) {
        case CommandWord::Quit:   return "quit";
        case CommandWord::Mute:   return "mute";
        case CommandWord::Unmute: return "unmute";
    }
    return "unknown";
}

std::optional<CommandWord> CommandDetector::observe(char32_t character) {
    buffer_.push_back(toLowerChar(character));
    if (buffer_.size() > kMaxBuffer) {
        buffer_.erase(0, buffer_.size() - kMaxBuffer);
    }

    for (const auto& entry : kCommands) {
        if (buffer_.find(entry.text) != std::u32string::npos) {
            buffer_.clear();
            return entry.word;
        }
    }
    return std::nullopt;
}

void CommandDetector::reset() {
    buffer_.clear();
}

} // namespace bambam
