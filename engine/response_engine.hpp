#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>

#include "command_detector.hpp"
#include "declarative_mapper.hpp"
#include "error_manager.hpp"
#include "event_mapper.hpp"
#include "input_event.hpp"
#include "policies.hpp"
#include "resource_set.hpp"

namespace bambam {

// ------------------------------------------------------------
// Construction parameters (from bambam.json + command line)
// ------------------------------------------------------------
struct EngineOptions {
    bool uppercaseLetters = false;
    bool deterministicSounds = false;
    bool startMuted = false;
    bool soundEnabled = true;
    std::optional<std::uint32_t> randomSeed;
    std::optional<std::string> activeExtensionName;
};

enum class EngineState {
    Armed,      // sounds play
    Muted,      // sounds suppressed, images unaffected
    Terminated  // absorbing
};

const char* engineStateName(EngineState state);

// ------------------------------------------------------------
// EngineAction: everything the caller should do for one event
// ------------------------------------------------------------
struct EngineAction {
    bool terminate = false;
    bool clearCanvas = false;
    std::optional<CommandWord> command;   // command completed by this event
    std::optional<Response> sound;        // play this
    std::optional<Response> image;        // show this

    bool success = true;                  // false: fatal, see errorCode
    std::string errorCode = "ERR_NONE";
    std::string message;

    bool isNone() const {
        return !terminate && !clearCanvas && !command && !sound && !image;
    }
};

// ------------------------------------------------------------
// ResponseEngine
// Routes each event to the command detector or to the sound and
// image mapper/policy pipelines. Single-threaded; owns all state.
// ------------------------------------------------------------
class ResponseEngine {
public:
    /// Chance that a key or button press clears the canvas first.
    static constexpr double kClearRate = 0.1;

    /// soundMapper may be null when sound is disabled.
    ResponseEngine(const EngineOptions& options,
                   std::mt19937& rng,
                   std::unique_ptr<EventMapper> soundMapper,
                   std::unique_ptr<EventMapper> imageMapper,
                   PolicyRegistry soundPolicies,
                   PolicyRegistry imagePolicies);

    /// Check every choice the mappers can make against the registries
    /// (unknown policy, empty set, missing named file).
    bool validate(ErrorReport* err = nullptr) const;

    EngineAction handle(const InputEvent& event);

    EngineState state() const { return state_; }
    bool soundEnabled() const { return soundEnabled_; }
    bool pointerHeld() const { return pointerHeld_; }

private:
    bool resolve(const EventMapper& mapper,
                 const PolicyRegistry& registry,
                 const InputEvent& event,
                 std::optional<Response>& out,
                 EngineAction& action);
    void applyCommand(CommandWord cmd, EngineAction& action);

    std::mt19937& rng_;
    bool soundEnabled_;
    EngineState state_;
    bool pointerHeld_ = false;

    CommandDetector detector_;
    std::unique_ptr<EventMapper> soundMapper_;
    std::unique_ptr<EventMapper> imageMapper_;
    PolicyRegistry soundPolicies_;
    PolicyRegistry imagePolicies_;
};

// Seeded when 'seed' is set, otherwise from std::random_device
std::mt19937 makeGenerator(std::optional<std::uint32_t> seed);

// ------------------------------------------------------------
// Assemble an engine from options, loaded resources and an
// optional extension (its rules replace the built-in mapping).
// Fails on any startup misconfiguration.
// ------------------------------------------------------------
bool buildEngine(const EngineOptions& options,
                 std::mt19937& rng,
                 std::shared_ptr<const ResourceSet> sounds,
                 std::shared_ptr<const ResourceSet> images,
                 const Extension* extension,
                 std::unique_ptr<ResponseEngine>& out,
                 ErrorReport* err = nullptr);

} // namespace bambam
