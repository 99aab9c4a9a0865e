#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <SFML/System/Vector2.hpp>

namespace bambam {

// ------------------------------------------------------------
// Kinds of user action the engine understands
// ------------------------------------------------------------
enum class EventKind {
    KeyDown,
    PointerMove,
    PointerDown,
    PointerUp,
    DeviceButtonDown,   // joystick / gamepad button
    Quit
};

// ------------------------------------------------------------
// InputEvent: one normalized user action.
// Built by the event source, read once by the engine.
// ------------------------------------------------------------
struct InputEvent {
    EventKind kind = EventKind::KeyDown;
    std::optional<char32_t> character;       // printable text (KeyDown only)
    std::optional<int> keyCode;              // key code or joystick button
    std::optional<sf::Vector2i> position;    // pointer events only
    std::int64_t timestampMs = 0;            // ms since program start

    bool isAlpha() const;
    bool isDigit() const;
    bool isPointer() const;

    static InputEvent keyDown(int keyCode, std::optional<char32_t> character = std::nullopt);
    static InputEvent deviceButton(int button);
    static InputEvent pointer(EventKind kind, sf::Vector2i position);
    static InputEvent quit();
};

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
const char* eventKindName(EventKind kind);

// Case-insensitive ("KeyDown", "keydown", "KEYDOWN" all match)
std::optional<EventKind> eventKindFromName(const std::string& name);

bool isAlphaChar(char32_t c);
bool isDigitChar(char32_t c);
bool isPrintableChar(char32_t c);
char32_t toLowerChar(char32_t c);
char32_t toUpperChar(char32_t c);

// Encode a single code point for logs and comparisons
std::string toUtf8(char32_t c);

} // namespace bambam
