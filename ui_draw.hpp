#pragma once
#include <SFML/Graphics.hpp>
#include <random>

#include "engine/policies.hpp"
#include "error_manager.hpp"
#include "ui_config.hpp"

// -------------------------------------------------------------
// Canvas: off-screen surface that keeps every response drawn on
// it until the next clear. Presented to the window each frame.
// -------------------------------------------------------------
struct Canvas {
    sf::RenderTexture target;
    sf::Color background = kLightBackground;
    bool welcomeShown = false;
};

bool initCanvas(Canvas& canvas, sf::Vector2u size, bool dark, ErrorReport* err = nullptr);

// Fill with the background colour and redraw the caption
void clearCanvas(Canvas& canvas, const sf::Font& font);

void drawWelcome(Canvas& canvas, const sf::Font& font);

// Glyphs and images land at a random spot drawn from 'rng'; marks at their centre
void drawResponse(Canvas& canvas,
                  const sf::Font& font,
                  const bambam::Response& response,
                  std::mt19937& rng);

void presentFrame(sf::RenderWindow& window, Canvas& canvas);

// Scale that fits an image of 'size' into kImageMaxWidth (1 when it already fits)
float imageScaleFor(sf::Vector2u size);
