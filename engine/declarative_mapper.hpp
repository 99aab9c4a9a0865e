#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

#include "error_manager.hpp"
#include "event_mapper.hpp"

namespace bambam {

// ------------------------------------------------------------
// Check: exactly one predicate on an event
// ------------------------------------------------------------
struct Check {
    enum class Type {
        EventType,       // {"type": "KeyDown"}
        UnicodeValue,    // {"unicode": {"value": "a"}}
        UnicodeIsAlpha,  // {"unicode": {"isalpha": true}}
        UnicodeIsDigit   // {"unicode": {"isdigit": true}}
    };

    Type type = Type::EventType;
    EventKind eventKind = EventKind::KeyDown;
    char32_t value = 0;
    bool flag = true;

    // Unicode checks never match events without a character.
    bool matches(const InputEvent& event) const;
};

// ------------------------------------------------------------
// Rule: AND of checks → policy (+ args)
// ------------------------------------------------------------
struct Rule {
    std::vector<Check> predicates;  // empty = always matches
    PolicyKind policy = PolicyKind::Random;
    PolicyArgs args;
    std::string origin;             // "image[2]" etc.

    bool matches(const InputEvent& event) const;
};

// ------------------------------------------------------------
// DeclarativeMapper: first matching rule wins
// ------------------------------------------------------------
class DeclarativeMapper : public EventMapper {
public:
    DeclarativeMapper(Channel channel, std::vector<Rule> rules, std::string source);

    Channel channel() const override { return channel_; }
    PolicyChoice map(const InputEvent& event) const override;
    std::vector<PolicyChoice> reachableChoices() const override;

private:
    Channel channel_;
    std::vector<Rule> rules_;
    std::string source_;
};

// ------------------------------------------------------------
// Extension: a parsed event_map.json plus where it lives
// ------------------------------------------------------------
struct Extension {
    std::string name;
    std::filesystem::path directory;
    std::string source;                          // file name used in messages
    std::vector<Rule> imageRules;
    std::optional<std::vector<Rule>> soundRules;
};

inline constexpr const char* EXTENSION_FILE = "event_map.json";

// Validate and convert a parsed document. Unknown keys, a wrong
// apiVersion, ambiguous checks and unknown policies are rejected
// with an ErrorReport naming 'source' and the offending key.
bool parseExtension(const nlohmann::json& doc,
                    const std::string& source,
                    bool soundRequired,
                    Extension& out,
                    ErrorReport* err = nullptr);

// Read and parse <directory>/event_map.json
bool loadExtension(const std::filesystem::path& directory,
                   bool soundRequired,
                   Extension& out,
                   ErrorReport* err = nullptr);

} // namespace bambam
