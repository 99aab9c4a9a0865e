#include "response_engine.hpp"
#include "logger.hpp"

namespace bambam {

const char* engineStateName(EngineState state) {
    switch (state) {
        case EngineState::Armed:      return "armed";
        case EngineState::Muted:      return "muted";
        case EngineState::Terminated: return "terminated";
    }
    return "unknown";
}

ResponseEngine::ResponseEngine(const EngineOptions& options,
                               std::mt19937& rng,
                               std::unique_ptr<EventMapper> soundMapper,
                               std::unique_ptr<EventMapper> imageMapper,
                               PolicyRegistry soundPolicies,
                               PolicyRegistry imagePolicies)
    : rng_(rng),
      soundEnabled_(options.soundEnabled && soundMapper != nullptr),
      state_(options.startMuted ? EngineState::Muted : EngineState::Armed),
      soundMapper_(std::move(soundMapper)),
      imageMapper_(std::move(imageMapper)),
      soundPolicies_(std::move(soundPolicies)),
      imagePolicies_(std::move(imagePolicies)) {}

// ------------------------------------------------------------
// Startup validation
// ------------------------------------------------------------
static bool validateChannel(const EventMapper& mapper,
                            const PolicyRegistry& registry,
                            ErrorReport* err) {
    for (const auto& choice : mapper.reachableChoices()) {
        const ResponsePolicy* policy = registry.find(choice.kind);
        if (!policy) {
            ErrorReport report = ErrorManager::report("ERR_POLICY_UNREGISTERED",
                                                      std::string(policyName(choice.kind)) +
                                                      " (" + choice.origin + ")");
            if (err) *err = report;
            return false;
        }

        ErrorReport report;
        if (!policy->validate(choice.args, &report)) {
            report.message += " (" + choice.origin + ")";
            if (err) *err = report;
            return false;
        }
    }
    return true;
}

bool ResponseEngine::validate(ErrorReport* err) const {
    if (!imageMapper_) {
        ErrorReport report = ErrorManager::report("ERR_EXT_MISSING_SECTION", "image mapper");
        if (err) *err = report;
        return false;
    }
    if (!validateChannel(*imageMapper_, imagePolicies_, err)) {
        return false;
    }
    if (soundEnabled_ && !validateChannel(*soundMapper_, soundPolicies_, err)) {
        return false;
    }
    return true;
}

// ------------------------------------------------------------
// Dispatch
// ------------------------------------------------------------
bool ResponseEngine::resolve(const EventMapper& mapper,
                             const PolicyRegistry& registry,
                             const InputEvent& event,
                             std::optional<Response>& out,
                             EngineAction& action)
{
    auto fail = [&](const std::string& code, const std::string& message) {
        action.success = false;
        action.terminate = true;
        action.errorCode = code;
        action.message = message;
        state_ = EngineState::Terminated;
        return false;
    };

    PolicyChoice choice = mapper.map(event);
    if (!choice.matched) {
        ErrorReport report = ErrorManager::report("ERR_MAP_NO_MATCH",
                                                  choice.origin + " for " + eventKindName(event.kind));
        return fail(report.code, report.message);
    }

    ResponsePolicy* policy = registry.find(choice.kind);
    if (!policy) {
        ErrorReport report = ErrorManager::report("ERR_POLICY_UNREGISTERED",
                                                  std::string(policyName(choice.kind)) +
                                                  " (" + choice.origin + ")");
        return fail(report.code, report.message);
    }

    Selection selection = policy->select(event, choice.args);
    if (!selection.success) {
        return fail(selection.errorCode, selection.message + " (" + choice.origin + ")");
    }

    std::string what = eventKindName(event.kind);
    if (event.character) {
        what += " '" + toUtf8(*event.character) + "'";
    }
    LOG_TRACE("Engine", std::string(channelName(mapper.channel())) + " " + what + " -> " + choice.origin);
    out = selection.response;
    return true;
}

void ResponseEngine::applyCommand(CommandWord cmd, EngineAction& action) {
    action.command = cmd;

    switch (cmd) {
        case CommandWord::Quit:
            state_ = EngineState::Terminated;
            action.terminate = true;
            break;
        case CommandWord::Mute:
            if (soundEnabled_) state_ = EngineState::Muted;
            break;
        case CommandWord::Unmute:
            if (soundEnabled_) state_ = EngineState::Armed;
            break;
    }

    LOG_DEBUG("Engine", std::string("Command '") + commandName(cmd) + "' -> " + engineStateName(state_));
}

EngineAction ResponseEngine::handle(const InputEvent& event) {
    EngineAction action;

    if (state_ == EngineState::Terminated) {
        action.terminate = true;
        return action;
    }

    if (event.kind == EventKind::Quit) {
        state_ = EngineState::Terminated;
        action.terminate = true;
        return action;
    }

    // Pointer interaction: image only, no commands, no sound
    if (event.isPointer()) {
        if (event.kind == EventKind::PointerUp) {
            pointerHeld_ = false;
            return action;
        }
        if (event.kind == EventKind::PointerDown) {
            pointerHeld_ = true;
        } else if (!pointerHeld_) {
            return action;
        }
        resolve(*imageMapper_, imagePolicies_, event, action.image, action);
        return action;
    }

    if (event.kind == EventKind::KeyDown && event.isAlpha()) {
        if (auto cmd = detector_.observe(*event.character)) {
            applyCommand(*cmd, action);
            if (action.terminate) {
                return action;
            }
        }
    }

    std::bernoulli_distribution clearDraw(kClearRate);
    action.clearCanvas = clearDraw(rng_);

    if (soundEnabled_ && state_ == EngineState::Armed) {
        if (!resolve(*soundMapper_, soundPolicies_, event, action.sound, action)) {
            return action;
        }
    }

    resolve(*imageMapper_, imagePolicies_, event, action.image, action);
    return action;
}

// ------------------------------------------------------------
// Assembly
// ------------------------------------------------------------
std::mt19937 makeGenerator(std::optional<std::uint32_t> seed) {
    if (seed) {
        return std::mt19937(*seed);
    }
    std::random_device rd;
    return std::mt19937(rd());
}

bool buildEngine(const EngineOptions& options,
                 std::mt19937& rng,
                 std::shared_ptr<const ResourceSet> sounds,
                 std::shared_ptr<const ResourceSet> images,
                 const Extension* extension,
                 std::unique_ptr<ResponseEngine>& out,
                 ErrorReport* err)
{
    std::unique_ptr<EventMapper> soundMapper;
    std::unique_ptr<EventMapper> imageMapper;

    if (extension) {
        imageMapper = std::make_unique<DeclarativeMapper>(Channel::Image, extension->imageRules,
                                                          extension->source);
        if (options.soundEnabled) {
            if (!extension->soundRules) {
                ErrorReport report = ErrorManager::report("ERR_EXT_MISSING_SECTION",
                                                          extension->source + ": sound");
                if (err) *err = report;
                return false;
            }
            soundMapper = std::make_unique<DeclarativeMapper>(Channel::Sound, *extension->soundRules,
                                                              extension->source);
        }
        LOG_DEBUG("Engine", "Using extension '" + extension->name + "'");
    } else {
        imageMapper = std::make_unique<LegacyMapper>(Channel::Image);
        if (options.soundEnabled) {
            soundMapper = std::make_unique<LegacyMapper>(Channel::Sound, options.deterministicSounds);
        }
    }

    auto engine = std::make_unique<ResponseEngine>(
        options, rng,
        std::move(soundMapper), std::move(imageMapper),
        makeSoundRegistry(std::move(sounds), rng),
        makeImageRegistry(std::move(images), rng, options.uppercaseLetters));

    if (!engine->validate(err)) {
        LOG_PHASE("Engine validation", false);
        return false;
    }

    LOG_PHASE("Engine ready", true);
    out = std::move(engine);
    return true;
}

} // namespace bambam
