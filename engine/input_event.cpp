#include "input_event.hpp"

#include <algorithm>
#include <cctype>
#include <cwchar>
#include <locale>
#include <stdexcept>

#include "logger.hpp"

namespace bambam {

bool InputEvent::isAlpha() const {
    return character && isAlphaChar(*character);
}

bool InputEvent::isDigit() const {
    return character && isDigitChar(*character);
}

bool InputEvent::isPointer() const {
    return kind == EventKind::PointerMove ||
           kind == EventKind::PointerDown ||
           kind == EventKind::PointerUp;
}

InputEvent InputEvent::keyDown(int keyCode, std::optional<char32_t> character) {
    InputEvent ev;
    ev.kind = EventKind::KeyDown;
    ev.keyCode = keyCode;
    if (character && isPrintableChar(*character)) {
        ev.character = character;
    }
    return ev;
}

InputEvent InputEvent::deviceButton(int button) {
    InputEvent ev;
    ev.kind = EventKind::DeviceButtonDown;
    ev.keyCode = button;
    return ev;
}

InputEvent InputEvent::pointer(EventKind kind, sf::Vector2i position) {
    InputEvent ev;
    ev.kind = kind;
    ev.position = position;
    return ev;
}

InputEvent InputEvent::quit() {
    InputEvent ev;
    ev.kind = EventKind::Quit;
    return ev;
}

// ------------------------------------------------------------
// Event kind names
// ------------------------------------------------------------
const char* eventKindName(EventKind kind) {
    switch (kind) {
        case EventKind::KeyDown:          return "KeyDown";
        case EventKind::PointerMove:      return "PointerMove";
        case EventKind::PointerDown:      return "PointerDown";
        case EventKind::PointerUp:        return "PointerUp";
        case EventKind::DeviceButtonDown: return "DeviceButtonDown";
        case EventKind::Quit:             return "Quit";
    }
    return "Unknown";
}

std::optional<EventKind> eventKindFromName(const std::string& name) {
    static const EventKind kAll[] = {
        EventKind::KeyDown, EventKind::PointerMove, EventKind::PointerDown,
        EventKind::PointerUp, EventKind::DeviceButtonDown, EventKind::Quit
    };

    auto lower = [](std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    };

    const std::string wanted = lower(name);
    for (EventKind kind : kAll) {
        if (lower(eventKindName(kind)) == wanted) {
            return kind;
        }
    }
    return std::nullopt;
}

// ------------------------------------------------------------
// Character classes
// ASCII goes through <cctype>. Anything wider is classified by a
// UTF-8 ctype facet, since the process itself stays in the "C"
// locale where no non-ASCII letter is alphabetic.
// ------------------------------------------------------------
namespace {

std::locale makeUtf8Locale() {
    for (const char* name : {"C.UTF-8", "C.utf8", "en_US.UTF-8", "en_US.utf8"}) {
        try {
            return std::locale(name);
        } catch (const std::runtime_error&) {
            // not installed, try the next one
        }
    }
    LOG_WARN("Input", "No UTF-8 locale installed; non-ASCII letters count as symbols");
    return std::locale::classic();
}

const std::ctype<wchar_t>& wideCtype() {
    static const std::locale loc = makeUtf8Locale();
    return std::use_facet<std::ctype<wchar_t>>(loc);
}

bool fitsWchar(char32_t c) {
    return c <= static_cast<char32_t>(WCHAR_MAX);
}

} // namespace

bool isAlphaChar(char32_t c) {
    if (c < 128) return std::isalpha(static_cast<unsigned char>(c)) != 0;
    if (!fitsWchar(c)) return false;
    return wideCtype().is(std::ctype_base::alpha, static_cast<wchar_t>(c));
}

bool isDigitChar(char32_t c) {
    if (c < 128) return std::isdigit(static_cast<unsigned char>(c)) != 0;
    if (!fitsWchar(c)) return false;
    return wideCtype().is(std::ctype_base::digit, static_cast<wchar_t>(c));
}

bool isPrintableChar(char32_t c) {
    if (c < 0x20 || c == 0x7F) return false;
    if (c >= 0x80 && c < 0xA0) return false;
    return c <= 0x10FFFF;
}

char32_t toLowerChar(char32_t c) {
    if (c < 128) return static_cast<char32_t>(std::tolower(static_cast<unsigned char>(c)));
    if (!fitsWchar(c)) return c;
    return static_cast<char32_t>(wideCtype().tolower(static_cast<wchar_t>(c)));
}

char32_t toUpperChar(char32_t c) {
    if (c < 128) return static_cast<char32_t>(std::toupper(static_cast<unsigned char>(c)));
    if (!fitsWchar(c)) return c;
    return static_cast<char32_t>(wideCtype().toupper(static_cast<wchar_t>(c)));
}

std::string toUtf8(char32_t c) {
    std::string out;
    if (c < 0x80) {
        out.push_back(static_cast<char>(c));
    } else if (c < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (c >> 6)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else if (c < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (c >> 12)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (c >> 18)));
        out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    }
    return out;
}

} // namespace bambam
