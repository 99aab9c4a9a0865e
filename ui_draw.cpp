#include "ui_draw.hpp"
#include "logger.hpp"

#include <algorithm>

// -------------------------------------------------------------
// Helpers
// -------------------------------------------------------------
static float randomCoord(std::mt19937& rng, float lo, float hi) {
    if (hi <= lo) return lo;
    std::uniform_int_distribution<int> dist(static_cast<int>(lo), static_cast<int>(hi));
    return static_cast<float>(dist(rng));
}

float imageScaleFor(sf::Vector2u size) {
    if (size.x == 0 || size.y == 0) return 1.f;
    if (size.x > kImageMaxWidth || size.y > kImageMaxWidth) {
        return static_cast<float>(kImageMaxWidth) / static_cast<float>(size.x);
    }
    return 1.f;
}

// -------------------------------------------------------------
// Canvas lifecycle
// -------------------------------------------------------------
bool initCanvas(Canvas& canvas, sf::Vector2u size, bool dark, ErrorReport* err) {
    if (!canvas.target.resize(size)) {
        ErrorReport report = ErrorManager::report("ERR_CANVAS_INIT",
            std::to_string(size.x) + "x" + std::to_string(size.y));
        if (err) *err = report;
        LOG_PHASE("Canvas init", false);
        return false;
    }

    canvas.background = dark ? kDarkBackground : kLightBackground;
    canvas.welcomeShown = false;
    LOG_DEBUG("UI", "Canvas " + std::to_string(size.x) + "x" + std::to_string(size.y) +
                    (dark ? " (dark)" : " (light)"));
    LOG_PHASE("Canvas init", true);
    return true;
}

void clearCanvas(Canvas& canvas, const sf::Font& font) {
    canvas.target.clear(canvas.background);

    sf::Text caption(font, kCaptionText, kCaptionFontSize);
    caption.setFillColor(kCaptionColor);
    caption.setPosition({kCaptionX, kCaptionY});
    canvas.target.draw(caption);

    canvas.target.display();
    canvas.welcomeShown = false;
}

void drawWelcome(Canvas& canvas, const sf::Font& font) {
    const sf::Vector2f size(canvas.target.getSize());
    canvas.target.clear(kWelcomeBackground);

    sf::Text title(font, "Bam Bam", kWelcomeTitleSize);
    title.setFillColor(kWelcomeText);
    sf::FloatRect tb = title.getLocalBounds();
    title.setOrigin({tb.position.x + tb.size.x / 2.f, tb.position.y + tb.size.y / 2.f});
    title.setPosition({size.x / 2.f, size.y / 2.f - kWelcomeTitleSize * 0.5f});
    canvas.target.draw(title);

    sf::Text hint(font, "Press any key to start. Type quit to exit.", kWelcomeHintSize);
    hint.setFillColor(kWelcomeText);
    sf::FloatRect hb = hint.getLocalBounds();
    hint.setOrigin({hb.position.x + hb.size.x / 2.f, hb.position.y + hb.size.y / 2.f});
    hint.setPosition({size.x / 2.f, size.y / 2.f + kWelcomeHintSize * 2.f});
    canvas.target.draw(hint);

    canvas.target.display();
    canvas.welcomeShown = true;
}

// -------------------------------------------------------------
// Responses
// -------------------------------------------------------------
static void drawGlyph(Canvas& canvas, const sf::Font& font,
                      const bambam::Response& r, std::mt19937& rng) {
    const sf::Vector2f size(canvas.target.getSize());

    sf::Text text(font, sf::String(r.glyph), kGlyphFontSize);
    text.setFillColor(r.color);

    // Centre lands so the glyph box stays on screen
    sf::FloatRect bounds = text.getLocalBounds();
    const float halfW = bounds.size.x / 2.f;
    const float halfH = bounds.size.y / 2.f;
    text.setOrigin({bounds.position.x + halfW, bounds.position.y + halfH});
    text.setPosition({randomCoord(rng, halfW, size.x - halfW),
                      randomCoord(rng, halfH, size.y - halfH)});
    canvas.target.draw(text);
}

static void drawImage(Canvas& canvas, const bambam::Response& r, std::mt19937& rng) {
    if (!r.resource || !r.resource->texture) {
        LOG_WARN("UI", "Image response without a texture");
        return;
    }

    const sf::Vector2f size(canvas.target.getSize());
    sf::Sprite sprite(*r.resource->texture);

    const float scale = imageScaleFor(r.resource->texture->getSize());
    sprite.setScale({scale, scale});

    sf::FloatRect bounds = sprite.getGlobalBounds();
    sprite.setPosition({randomCoord(rng, 0.f, size.x - bounds.size.x),
                        randomCoord(rng, 0.f, size.y - bounds.size.y)});
    canvas.target.draw(sprite);
}

static void drawMark(Canvas& canvas, const bambam::Response& r) {
    const float radius = static_cast<float>(r.radius);
    sf::CircleShape dot(radius);
    dot.setFillColor(r.color);
    dot.setOrigin({radius, radius});
    dot.setPosition(sf::Vector2f(r.center));
    canvas.target.draw(dot);
}

void drawResponse(Canvas& canvas,
                  const sf::Font& font,
                  const bambam::Response& response,
                  std::mt19937& rng) {
    switch (response.kind) {
        case bambam::Response::Kind::Glyph:    drawGlyph(canvas, font, response, rng); break;
        case bambam::Response::Kind::Resource: drawImage(canvas, response, rng); break;
        case bambam::Response::Kind::Mark:     drawMark(canvas, response); break;
    }
    canvas.target.display();
}

void presentFrame(sf::RenderWindow& window, Canvas& canvas) {
    window.clear(canvas.background);
    sf::Sprite frame(canvas.target.getTexture());
    window.draw(frame);
    window.display();
}
