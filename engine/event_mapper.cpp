#include "event_mapper.hpp"

namespace bambam {

static PolicyChoice builtin(PolicyKind kind) {
    PolicyChoice choice;
    choice.kind = kind;
    choice.origin = std::string("builtin:") + policyName(kind);
    return choice;
}

LegacyMapper::LegacyMapper(Channel channel, bool deterministicSounds)
    : channel_(channel), deterministicSounds_(deterministicSounds) {}

PolicyChoice LegacyMapper::map(const InputEvent& event) const {
    if (channel_ == Channel::Sound) {
        if (deterministicSounds_ && event.kind == EventKind::KeyDown) {
            return builtin(PolicyKind::Deterministic);
        }
        return builtin(PolicyKind::Random);
    }

    if (event.kind == EventKind::KeyDown && (event.isAlpha() || event.isDigit())) {
        return builtin(PolicyKind::Font);
    }
    if (event.isPointer()) {
        return builtin(PolicyKind::Mark);
    }
    return builtin(PolicyKind::Random);
}

std::vector<PolicyChoice> LegacyMapper::reachableChoices() const {
    if (channel_ == Channel::Sound) {
        std::vector<PolicyChoice> out{ builtin(PolicyKind::Random) };
        if (deterministicSounds_) {
            out.push_back(builtin(PolicyKind::Deterministic));
        }
        return out;
    }
    return { builtin(PolicyKind::Font), builtin(PolicyKind::Mark), builtin(PolicyKind::Random) };
}

} // namespace bambam
