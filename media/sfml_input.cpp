#include "sfml_input.hpp"
#include "logger.hpp"

using bambam::EventKind;
using bambam::InputEvent;

void EventTranslator::emit(InputEvent ev, std::vector<InputEvent>& out) {
    ev.timestampMs = clock_.getElapsedTime().asMilliseconds();
    out.push_back(ev);
}

void EventTranslator::flush(std::vector<InputEvent>& out) {
    if (pendingKey_) {
        emit(*pendingKey_, out);
        pendingKey_.reset();
    }
}

// -------------------------------------------------------------
// SFML 3 style: is<T>() + getIf<T>()
// -------------------------------------------------------------
void EventTranslator::feed(const sf::Event& ev, std::vector<InputEvent>& out) {
    // Text completes the key that is waiting for it
    if (const auto* text = ev.getIf<sf::Event::TextEntered>()) {
        if (pendingKey_) {
            InputEvent key = InputEvent::keyDown(*pendingKey_->keyCode, text->unicode);
            pendingKey_.reset();
            emit(key, out);
        } else {
            // Text without a key press (input methods): code point as key code
            emit(InputEvent::keyDown(static_cast<int>(text->unicode), text->unicode), out);
        }
        return;
    }

    flush(out);

    if (ev.is<sf::Event::Closed>()) {
        LOG_DEBUG("Input", "Window close requested");
        emit(InputEvent::quit(), out);
    }
    else if (const auto* key = ev.getIf<sf::Event::KeyPressed>()) {
        pendingKey_ = InputEvent::keyDown(static_cast<int>(key->code));
    }
    else if (const auto* moved = ev.getIf<sf::Event::MouseMoved>()) {
        emit(InputEvent::pointer(EventKind::PointerMove, moved->position), out);
    }
    else if (const auto* pressed = ev.getIf<sf::Event::MouseButtonPressed>()) {
        emit(InputEvent::pointer(EventKind::PointerDown, pressed->position), out);
    }
    else if (const auto* released = ev.getIf<sf::Event::MouseButtonReleased>()) {
        emit(InputEvent::pointer(EventKind::PointerUp, released->position), out);
    }
    else if (const auto* touch = ev.getIf<sf::Event::TouchBegan>()) {
        emit(InputEvent::pointer(EventKind::PointerDown, touch->position), out);
    }
    else if (const auto* touch = ev.getIf<sf::Event::TouchMoved>()) {
        emit(InputEvent::pointer(EventKind::PointerMove, touch->position), out);
    }
    else if (const auto* touch = ev.getIf<sf::Event::TouchEnded>()) {
        emit(InputEvent::pointer(EventKind::PointerUp, touch->position), out);
    }
    else if (const auto* button = ev.getIf<sf::Event::JoystickButtonPressed>()) {
        LOG_TRACE("Input", "Joystick " + std::to_string(button->joystickId) +
                           " button " + std::to_string(button->button));
        emit(InputEvent::deviceButton(static_cast<int>(button->button)), out);
    }
}
