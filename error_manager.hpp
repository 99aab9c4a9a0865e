#pragma once

#include <string>
#include <nlohmann/json_fwd.hpp>

// Undefine Windows ERROR macro if it leaks in
#ifdef ERROR
#undef ERROR
#endif

// ------------------------------------------------------------
// ErrorReport: what a failed operation hands back to its caller
// ------------------------------------------------------------
struct ErrorReport {
    std::string code;       // e.g. "ERR_EXT_UNKNOWN_KEY"
    std::string message;    // user message + context (file, key, resource)
};

// ------------------------------------------------------------
// ErrorManager
// ------------------------------------------------------------
namespace ErrorManager {
    // Built-in error table: { code: { "user": ..., "debug": ... } }
    nlohmann::json defaults();

    // Overlay codes from a JSON file (errors.json). Unknown file → defaults only.
    bool load(const std::string& path, std::string* err = nullptr);

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // Log an error and build the report. 'detail' names the offending
    // file, key or resource and is appended to the user message.
    ErrorReport report(const std::string& code, const std::string& detail = "");
}
