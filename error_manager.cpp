#include "error_manager.hpp"
#include "logger.hpp"

#include <fstream>
#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>

// ------------------------------------------------------------
// Internal storage
// ------------------------------------------------------------
static nlohmann::json g_errors;   // active table (defaults + overlay)
static std::once_flag g_errorsInit;

static nlohmann::json& table() {
    std::call_once(g_errorsInit, [] { g_errors = ErrorManager::defaults(); });
    return g_errors;
}

nlohmann::json ErrorManager::defaults() {
    return {
        // --- Extension files ---
        {"ERR_EXT_NOT_FOUND", {
            {"user", "[Extension] Extension file not found"},
            {"debug", "event_map.json missing from the extension directory."}
        }},
        {"ERR_EXT_PARSE", {
            {"user", "[Extension] Extension file is not valid JSON"},
            {"debug", "nlohmann::json::parse failed on the extension file."}
        }},
        {"ERR_EXT_UNKNOWN_KEY", {
            {"user", "[Extension] Unrecognized key"},
            {"debug", "Extension file used a key outside the allowed set."}
        }},
        {"ERR_EXT_API_VERSION", {
            {"user", "[Extension] Unsupported apiVersion"},
            {"debug", "apiVersion missing or not equal to 0."}
        }},
        {"ERR_EXT_BAD_CHECK", {
            {"user", "[Extension] Invalid check"},
            {"debug", "A check must carry exactly one recognized predicate."}
        }},
        {"ERR_EXT_BAD_RULE", {
            {"user", "[Extension] Invalid rule"},
            {"debug", "Rule is not an object, or policy/args have the wrong type."}
        }},
        {"ERR_EXT_UNKNOWN_POLICY", {
            {"user", "[Extension] Unknown policy"},
            {"debug", "Rule names a policy that is not registered for its channel."}
        }},
        {"ERR_EXT_MISSING_SECTION", {
            {"user", "[Extension] Required rule list missing"},
            {"debug", "image rules are always required; sound rules when audio is enabled."}
        }},

        // --- Dispatch ---
        {"ERR_MAP_NO_MATCH", {
            {"user", "[Mapper] No rule matched the event"},
            {"debug", "Rule list lacks an unconditional catch-all rule."}
        }},
        {"ERR_POLICY_UNREGISTERED", {
            {"user", "[Policy] Policy not available"},
            {"debug", "Mapper chose a policy kind missing from the channel registry."}
        }},
        {"ERR_POLICY_EMPTY_SET", {
            {"user", "[Policy] No resources to choose from"},
            {"debug", "Random/deterministic policy constructed over an empty ResourceSet."}
        }},
        {"ERR_POLICY_NO_KEYCODE", {
            {"user", "[Policy] Event has no key code"},
            {"debug", "Deterministic policy applied to an event without keyCode."}
        }},
        {"ERR_POLICY_NO_ARGUMENT", {
            {"user", "[Policy] Missing policy argument"},
            {"debug", "named_file requires exactly one file name argument."}
        }},
        {"ERR_POLICY_UNKNOWN_FILE", {
            {"user", "[Policy] Named file not loaded"},
            {"debug", "named_file argument does not match any loaded resource."}
        }},
        {"ERR_POLICY_NOT_PRINTABLE", {
            {"user", "[Policy] Event has no printable character"},
            {"debug", "font policy applied to an event without a character."}
        }},
        {"ERR_POLICY_NO_POSITION", {
            {"user", "[Policy] Event has no pointer position"},
            {"debug", "mark policy applied to a non-pointer event."}
        }},

        // --- Resources ---
        {"ERR_SOUNDS_ALL_FAILED", {
            {"user", "All sounds failed to load."},
            {"debug", "Every sound load attempt failed."}
        }},
        {"ERR_IMAGES_ALL_FAILED", {
            {"user", "All images failed to load."},
            {"debug", "Every image load attempt failed."}
        }},
        {"ERR_FONT_MISSING", {
            {"user", "[Resources] No usable font found"},
            {"debug", "No .ttf/.otf in resources/ or system font directories."}
        }},
        {"ERR_CANVAS_INIT", {
            {"user", "[Display] Could not create the drawing canvas"},
            {"debug", "sf::RenderTexture::resize failed."}
        }},

        // --- Config ---
        {"ERR_CONFIG_INVALID", {
            {"user", "[Config] Settings file invalid, reset to defaults"},
            {"debug", "bambam.json failed parsing."}
        }},
        {"ERR_CLI_ARGS", {
            {"user", "[Config] Invalid command line"},
            {"debug", "Unknown flag or flag missing its value."}
        }}
    };
}

bool ErrorManager::load(const std::string& path, std::string* err) {
    namespace fs = std::filesystem;

    std::ifstream in(path);
    if (!in) {
        if (err) *err = "Could not open " + path;
        return false;
    }

    try {
        nlohmann::json j;
        in >> j;

        // Accept either { "errors": {...} } or a bare table
        const nlohmann::json& src = (j.contains("errors") && j["errors"].is_object()) ? j["errors"] : j;
        if (!src.is_object()) {
            if (err) *err = "Expected an object in " + path;
            return false;
        }

        nlohmann::json& dst = table();
        for (auto& [code, val] : src.items()) {
            if (val.is_object()) {
                dst[code] = val;
            }
        }

        LOG_DEBUG("ErrorManager", "Loaded error table from: " + fs::absolute(path).string());
        return true;
    } catch (const std::exception& e) {
        if (err) *err = std::string("Failed to parse ") + path + " -> " + e.what();
        return false;
    }
}

std::string ErrorManager::getUserMessage(const std::string& code) {
    const nlohmann::json& root = table();
    if (root.contains(code) && root[code].contains("user")) {
        return root[code]["user"].get<std::string>();
    }
    return "[Error] Unknown error code: " + code;
}

std::string ErrorManager::getDebugMessage(const std::string& code) {
    const nlohmann::json& root = table();
    if (root.contains(code) && root[code].contains("debug")) {
        return root[code]["debug"].get<std::string>();
    }
    return "[Debug] No debug message for code: " + code;
}

ErrorReport ErrorManager::report(const std::string& code, const std::string& detail) {
    ErrorReport result;
    result.code    = code;
    result.message = getUserMessage(code);
    if (!detail.empty()) {
        result.message += ": " + detail;
    }

    LOG_ERROR("ErrorManager", code + " -> " + getDebugMessage(code) +
                              (detail.empty() ? "" : " [" + detail + "]"));
    return result;
}
