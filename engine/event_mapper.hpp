#pragma once
#include <string>
#include <vector>

#include "input_event.hpp"
#include "policies.hpp"

namespace bambam {

// ------------------------------------------------------------
// PolicyChoice: a mapper's answer for one event
// ------------------------------------------------------------
struct PolicyChoice {
    PolicyKind kind = PolicyKind::Random;
    PolicyArgs args;
    bool matched = true;    // false: no rule applied
    std::string origin;     // which rule decided, for logs
};

// ------------------------------------------------------------
// EventMapper interface (one instance per channel)
// ------------------------------------------------------------
class EventMapper {
public:
    virtual ~EventMapper() = default;

    virtual Channel channel() const = 0;
    virtual PolicyChoice map(const InputEvent& event) const = 0;

    // Every choice map() can return, for startup validation
    // against the channel's PolicyRegistry.
    virtual std::vector<PolicyChoice> reachableChoices() const = 0;
};

// ------------------------------------------------------------
// LegacyMapper: the built-in rules
//   sound: random (deterministic for KeyDown when enabled)
//   image: font for letters/digits, mark for pointer, else random
// ------------------------------------------------------------
class LegacyMapper : public EventMapper {
public:
    explicit LegacyMapper(Channel channel, bool deterministicSounds = false);

    Channel channel() const override { return channel_; }
    PolicyChoice map(const InputEvent& event) const override;
    std::vector<PolicyChoice> reachableChoices() const override;

private:
    Channel channel_;
    bool deterministicSounds_;
};

} // namespace bambam
