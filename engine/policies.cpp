#include "policies.hpp"
#include "logger.hpp"

#include <cmath>

namespace bambam {

// ------------------------------------------------------------
// Names
// ------------------------------------------------------------
const char* policyName(PolicyKind kind) {
    switch (kind) {
        case PolicyKind::Random:        return "random";
        case PolicyKind::Deterministic: return "deterministic";
        case PolicyKind::NamedFile:     return "named_file";
        case PolicyKind::Font:          return "font";
        case PolicyKind::Mark:          return "mark";
    }
    return "unknown";
}

std::optional<PolicyKind> policyKindFromName(const std::string& name) {
    static const std::map<std::string, PolicyKind> kByName = {
        {"random",        PolicyKind::Random},
        {"deterministic", PolicyKind::Deterministic},
        {"named_file",    PolicyKind::NamedFile},
        {"font",          PolicyKind::Font},
        {"mark",          PolicyKind::Mark}
    };
    auto it = kByName.find(name);
    if (it == kByName.end()) {
        return std::nullopt;
    }
    return it->second;
}

const char* channelName(Channel channel) {
    return channel == Channel::Sound ? "sound" : "image";
}

bool channelSupports(Channel channel, PolicyKind kind) {
    switch (kind) {
        case PolicyKind::Random:
        case PolicyKind::NamedFile:
            return true;
        case PolicyKind::Deterministic:
            return channel == Channel::Sound;
        case PolicyKind::Font:
        case PolicyKind::Mark:
            return channel == Channel::Image;
    }
    return false;
}

Selection Selection::failed(const std::string& code, const std::string& detail) {
    ErrorReport report = ErrorManager::report(code, detail);

    Selection result;
    result.success   = false;
    result.errorCode = report.code;
    result.message   = report.message;
    return result;
}

static Selection resourceSelection(const Resource& item) {
    Selection result;
    result.response.kind = Response::Kind::Resource;
    result.response.resource = &item;
    return result;
}

bool ResponsePolicy::validate(const PolicyArgs&, ErrorReport*) const {
    return true;
}

// ------------------------------------------------------------
// RandomPolicy
// ------------------------------------------------------------
RandomPolicy::RandomPolicy(std::shared_ptr<const ResourceSet> items, std::mt19937& rng)
    : items_(std::move(items)), rng_(rng) {}

Selection RandomPolicy::select(const InputEvent&, const PolicyArgs&) {
    if (!items_ || items_->empty()) {
        return Selection::failed("ERR_POLICY_EMPTY_SET", "random");
    }
    std::uniform_int_distribution<std::size_t> dist(0, items_->size() - 1);
    return resourceSelection(items_->at(dist(rng_)));
}

bool RandomPolicy::validate(const PolicyArgs&, ErrorReport* err) const {
    if (!items_ || items_->empty()) {
        if (err) *err = ErrorManager::report("ERR_POLICY_EMPTY_SET", "random");
        return false;
    }
    return true;
}

// ------------------------------------------------------------
// DeterministicPolicy
// ------------------------------------------------------------
DeterministicPolicy::DeterministicPolicy(std::shared_ptr<const ResourceSet> items)
    : items_(std::move(items)) {}

std::size_t DeterministicPolicy::indexFor(int keyCode, std::size_t size) {
    const long long n = static_cast<long long>(size);
    long long idx = static_cast<long long>(keyCode) % n;
    if (idx < 0) idx += n;
    return static_cast<std::size_t>(idx);
}

Selection DeterministicPolicy::select(const InputEvent& event, const PolicyArgs&) {
    if (!items_ || items_->empty()) {
        return Selection::failed("ERR_POLICY_EMPTY_SET", "deterministic");
    }
    if (!event.keyCode) {
        return Selection::failed("ERR_POLICY_NO_KEYCODE",
                                 std::string("deterministic on ") + eventKindName(event.kind));
    }
    return resourceSelection(items_->at(indexFor(*event.keyCode, items_->size())));
}

bool DeterministicPolicy::validate(const PolicyArgs&, ErrorReport* err) const {
    if (!items_ || items_->empty()) {
        if (err) *err = ErrorManager::report("ERR_POLICY_EMPTY_SET", "deterministic");
        return false;
    }
    return true;
}

// ------------------------------------------------------------
// NamedFilePolicy
// ------------------------------------------------------------
NamedFilePolicy::NamedFilePolicy(std::shared_ptr<const ResourceSet> items)
    : items_(std::move(items)) {}

Selection NamedFilePolicy::select(const InputEvent&, const PolicyArgs& args) {
    if (args.size() != 1) {
        return Selection::failed("ERR_POLICY_NO_ARGUMENT",
                                 "named_file got " + std::to_string(args.size()) + " arguments");
    }
    const Resource* item = items_ ? items_->find(args[0]) : nullptr;
    if (!item) {
        return Selection::failed("ERR_POLICY_UNKNOWN_FILE", args[0]);
    }
    return resourceSelection(*item);
}

bool NamedFilePolicy::validate(const PolicyArgs& args, ErrorReport* err) const {
    if (args.size() != 1) {
        if (err) *err = ErrorManager::report("ERR_POLICY_NO_ARGUMENT",
                                             "named_file got " + std::to_string(args.size()) + " arguments");
        return false;
    }
    if (!items_ || !items_->find(args[0])) {
        if (err) *err = ErrorManager::report("ERR_POLICY_UNKNOWN_FILE", args[0]);
        return false;
    }
    return true;
}

// ------------------------------------------------------------
// GlyphRenderPolicy
// ------------------------------------------------------------
GlyphRenderPolicy::GlyphRenderPolicy(bool uppercase, std::mt19937& rng)
    : uppercase_(uppercase), rng_(rng) {}

Selection GlyphRenderPolicy::select(const InputEvent& event, const PolicyArgs&) {
    if (!event.character || !isPrintableChar(*event.character)) {
        return Selection::failed("ERR_POLICY_NOT_PRINTABLE",
                                 std::string("font on ") + eventKindName(event.kind));
    }

    constexpr std::size_t kPaletteSize = sizeof(kGlyphPalette) / sizeof(kGlyphPalette[0]);
    std::uniform_int_distribution<std::size_t> dist(0, kPaletteSize - 1);

    Selection result;
    result.response.kind  = Response::Kind::Glyph;
    result.response.glyph = uppercase_ ? toUpperChar(*event.character) : *event.character;
    result.response.color = kGlyphPalette[dist(rng_)];
    return result;
}

// ------------------------------------------------------------
// MarkPolicy
// ------------------------------------------------------------
sf::Color hsvToColor(float hue, float saturation, float value) {
    hue = std::fmod(hue, 360.f);
    if (hue < 0.f) hue += 360.f;

    const float c = value * saturation;
    const float x = c * (1.f - std::fabs(std::fmod(hue / 60.f, 2.f) - 1.f));
    const float m = value - c;

    float r = 0.f, g = 0.f, b = 0.f;
    if (hue < 60.f)       { r = c; g = x; }
    else if (hue < 120.f) { r = x; g = c; }
    else if (hue < 180.f) { g = c; b = x; }
    else if (hue < 240.f) { g = x; b = c; }
    else if (hue < 300.f) { r = x; b = c; }
    else                  { r = c; b = x; }

    auto channel = [m](float v) {
        return static_cast<std::uint8_t>(std::lround((v + m) * 255.f));
    };
    return sf::Color(channel(r), channel(g), channel(b));
}

sf::Color MarkPolicy::colorAt(std::int64_t timestampMs) {
    const float hue = static_cast<float>((timestampMs / 50) % 360);
    return hsvToColor(hue, 1.f, 1.f);
}

Selection MarkPolicy::select(const InputEvent& event, const PolicyArgs&) {
    if (!event.position) {
        return Selection::failed("ERR_POLICY_NO_POSITION",
                                 std::string("mark on ") + eventKindName(event.kind));
    }

    Selection result;
    result.response.kind   = Response::Kind::Mark;
    result.response.center = *event.position;
    result.response.radius = kMarkRadius;
    result.response.color  = colorAt(event.timestampMs);
    return result;
}

// ------------------------------------------------------------
// PolicyRegistry
// ------------------------------------------------------------
void PolicyRegistry::add(std::unique_ptr<ResponsePolicy> policy) {
    const PolicyKind kind = policy->kind();
    policies_[kind] = std::move(policy);
}

ResponsePolicy* PolicyRegistry::find(PolicyKind kind) const {
    auto it = policies_.find(kind);
    return it == policies_.end() ? nullptr : it->second.get();
}

PolicyRegistry makeSoundRegistry(std::shared_ptr<const ResourceSet> sounds, std::mt19937& rng) {
    PolicyRegistry registry;
    registry.add(std::make_unique<RandomPolicy>(sounds, rng));
    registry.add(std::make_unique<DeterministicPolicy>(sounds));
    registry.add(std::make_unique<NamedFilePolicy>(sounds));
    return registry;
}

PolicyRegistry makeImageRegistry(std::shared_ptr<const ResourceSet> images,
                                 std::mt19937& rng,
                                 bool uppercase) {
    PolicyRegistry registry;
    registry.add(std::make_unique<GlyphRenderPolicy>(uppercase, rng));
    registry.add(std::make_unique<RandomPolicy>(images, rng));
    registry.add(std::make_unique<NamedFilePolicy>(images));
    registry.add(std::make_unique<MarkPolicy>());
    return registry;
}

} // namespace bambam
