#pragma once
#include <optional>
#include <vector>
#include <SFML/Window/Event.hpp>
#include <SFML/System/Clock.hpp>

#include "engine/input_event.hpp"

// -------------------------------------------------------------
// EventTranslator: SFML 3 window events → bambam::InputEvent
//
// SFML reports a key press as KeyPressed followed by TextEntered.
// The translator holds the KeyPressed back until the next event so
// both halves become one KeyDown carrying key code and character.
// Call flush() after the poll loop to release a key that produced
// no text (arrows, shift, F-keys).
// -------------------------------------------------------------
class EventTranslator {
public:
    void feed(const sf::Event& ev, std::vector<bambam::InputEvent>& out);
    void flush(std::vector<bambam::InputEvent>& out);

private:
    void emit(bambam::InputEvent ev, std::vector<bambam::InputEvent>& out);

    std::optional<bambam::InputEvent> pendingKey_;
    sf::Clock clock_;
};
