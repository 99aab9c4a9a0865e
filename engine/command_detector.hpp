#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace bambam {

// Typed operator commands
enum class CommandWord {
    Quit,
    Mute,
    Unmute
};

const char* commandName(CommandWord cmd);

// ------------------------------------------------------------
// CommandDetector
// Watches alphabetic keystrokes for command words anywhere in
// the typed stream. Matching is a substring search, checked in
// the order quit, unmute, mute ("unmute" contains "mute").
// ------------------------------------------------------------
class CommandDetector {
public:
    /// Longest tail of typed input kept between matches.
    static constexpr std::size_t kMaxBuffer = 32;

    /// Feed one alphabetic character. Returns the command completed
    /// by it, clearing the buffer, or nothing.
    std::optional<CommandWord> observe(char32_t character);

    void reset();
    const std::u32string& buffer() const { return buffer_; }

private:
    std::u32string buffer_;
};

} // namespace bambam
