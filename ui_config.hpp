#pragma once
#include <SFML/Graphics/Color.hpp>

// ---------------- UI Tunables ----------------
// Layout and appearance of the BamBam canvas, in one place.

/// Window title.
inline constexpr const char* kWindowTitle = "Bam Bam";

/// Frame rate cap.
inline constexpr unsigned kFrameRate = 60;

/// Normal and --dark backgrounds.
inline const sf::Color kLightBackground(250, 250, 250);
inline const sf::Color kDarkBackground(0, 0, 0);

/// Caption text and placement (pixels).
inline constexpr const char* kCaptionText = "Commands: quit, mute, unmute";
inline constexpr unsigned kCaptionFontSize = 20;
inline constexpr float kCaptionX = 15.f;
inline constexpr float kCaptionY = 10.f;
inline const sf::Color kCaptionColor(210, 210, 210);

/// Welcome screen: blue text over light blue.
inline const sf::Color kWelcomeBackground(173, 216, 230);
inline const sf::Color kWelcomeText(0, 0, 255);
inline constexpr unsigned kWelcomeTitleSize = 96;
inline constexpr unsigned kWelcomeHintSize = 32;

/// Character size for glyph responses (points).
inline constexpr unsigned kGlyphFontSize = 256;

/// Images larger than this in either direction are scaled to this width.
inline constexpr unsigned kImageMaxWidth = 700;

/// Seconds for playing sounds to fade out on mute.
inline constexpr float kMuteFadeSeconds = 1.f;
