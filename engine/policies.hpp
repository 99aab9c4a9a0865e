#pragma once
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include <SFML/Graphics/Color.hpp>
#include <SFML/System/Vector2.hpp>

#include "error_manager.hpp"
#include "input_event.hpp"
#include "resource_set.hpp"

namespace bambam {

// ------------------------------------------------------------
// Policy kinds. Extension files name them by string; inside the
// engine only the enum travels.
// ------------------------------------------------------------
enum class PolicyKind {
    Random,         // "random"
    Deterministic,  // "deterministic"
    NamedFile,      // "named_file"
    Font,           // "font"
    Mark            // "mark"
};

enum class Channel {
    Sound,
    Image
};

const char* policyName(PolicyKind kind);
std::optional<PolicyKind> policyKindFromName(const std::string& name);
const char* channelName(Channel channel);

// Whether 'kind' is offered on 'channel' (font and mark are image-only,
// deterministic is sound-only).
bool channelSupports(Channel channel, PolicyKind kind);

using PolicyArgs = std::vector<std::string>;

/// Radius of the pointer mark (pixels).
inline constexpr int kMarkRadius = 30;

/// Glyph tint palette.
inline const sf::Color kGlyphPalette[] = {
    sf::Color(0, 0, 255),   sf::Color(255, 0, 0),   sf::Color(255, 255, 0),
    sf::Color(255, 0, 128), sf::Color(0, 0, 128),   sf::Color(0, 255, 0),
    sf::Color(255, 128, 0), sf::Color(255, 0, 255), sf::Color(0, 255, 255)
};

// ------------------------------------------------------------
// Response: what to play or draw. Placement is the caller's job,
// except for marks which are centred on the pointer.
// ------------------------------------------------------------
struct Response {
    enum class Kind {
        Resource,   // a loaded sound or image
        Glyph,      // render 'glyph' tinted 'color'
        Mark        // filled circle at 'center'
    };

    Kind kind = Kind::Resource;
    const Resource* resource = nullptr;
    char32_t glyph = 0;
    sf::Color color = sf::Color(255, 255, 255);
    sf::Vector2i center{0, 0};
    int radius = 0;
};

// ------------------------------------------------------------
// Selection: unified return type for all policies
// ------------------------------------------------------------
struct Selection {
    Response response;
    bool success = true;
    std::string errorCode = "ERR_NONE";
    std::string message;

    static Selection failed(const std::string& code, const std::string& detail);
};

// ------------------------------------------------------------
// ResponsePolicy interface
// ------------------------------------------------------------
class ResponsePolicy {
public:
    virtual ~ResponsePolicy() = default;

    virtual PolicyKind kind() const = 0;

    // Pick or synthesize a response for one event.
    virtual Selection select(const InputEvent& event, const PolicyArgs& args) = 0;

    // Startup check that this policy can serve 'args' for every event
    // it may be asked about. Default: always fine.
    virtual bool validate(const PolicyArgs& args, ErrorReport* err) const;
};

// Uniformly random item from the set.
class RandomPolicy : public ResponsePolicy {
public:
    RandomPolicy(std::shared_ptr<const ResourceSet> items, std::mt19937& rng);

    PolicyKind kind() const override { return PolicyKind::Random; }
    Selection select(const InputEvent& event, const PolicyArgs& args) override;
    bool validate(const PolicyArgs& args, ErrorReport* err) const override;

private:
    std::shared_ptr<const ResourceSet> items_;
    std::mt19937& rng_;
};

// Item at keyCode mod size: same key, same sound.
class DeterministicPolicy : public ResponsePolicy {
public:
    explicit DeterministicPolicy(std::shared_ptr<const ResourceSet> items);

    PolicyKind kind() const override { return PolicyKind::Deterministic; }
    Selection select(const InputEvent& event, const PolicyArgs& args) override;
    bool validate(const PolicyArgs& args, ErrorReport* err) const override;

    static std::size_t indexFor(int keyCode, std::size_t size);

private:
    std::shared_ptr<const ResourceSet> items_;
};

// The item named by args[0].
class NamedFilePolicy : public ResponsePolicy {
public:
    explicit NamedFilePolicy(std::shared_ptr<const ResourceSet> items);

    PolicyKind kind() const override { return PolicyKind::NamedFile; }
    Selection select(const InputEvent& event, const PolicyArgs& args) override;
    bool validate(const PolicyArgs& args, ErrorReport* err) const override;

private:
    std::shared_ptr<const ResourceSet> items_;
};

// The event's character, tinted from kGlyphPalette.
class GlyphRenderPolicy : public ResponsePolicy {
public:
    GlyphRenderPolicy(bool uppercase, std::mt19937& rng);

    PolicyKind kind() const override { return PolicyKind::Font; }
    Selection select(const InputEvent& event, const PolicyArgs& args) override;

private:
    bool uppercase_;
    std::mt19937& rng_;
};

// Filled circle at the pointer, hue cycling with time.
class MarkPolicy : public ResponsePolicy {
public:
    PolicyKind kind() const override { return PolicyKind::Mark; }
    Selection select(const InputEvent& event, const PolicyArgs& args) override;

    static sf::Color colorAt(std::int64_t timestampMs);
};

// HSV (h in degrees, s and v in [0,1]) to an opaque color
sf::Color hsvToColor(float hue, float saturation, float value);

// ------------------------------------------------------------
// PolicyRegistry: one per channel, immutable after startup
// ------------------------------------------------------------
class PolicyRegistry {
public:
    void add(std::unique_ptr<ResponsePolicy> policy);

    ResponsePolicy* find(PolicyKind kind) const;
    bool contains(PolicyKind kind) const { return policies_.count(kind) != 0; }

private:
    std::map<PolicyKind, std::unique_ptr<ResponsePolicy>> policies_;
};

// Sound channel: random, deterministic, named_file
PolicyRegistry makeSoundRegistry(std::shared_ptr<const ResourceSet> sounds, std::mt19937& rng);

// Image channel: font, random, named_file, mark
PolicyRegistry makeImageRegistry(std::shared_ptr<const ResourceSet> images,
                                 std::mt19937& rng,
                                 bool uppercase);

} // namespace bambam
