#include "declarative_mapper.hpp"
#include "logger.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

namespace bambam {

// ------------------------------------------------------------
// Matching
// ------------------------------------------------------------
bool Check::matches(const InputEvent& event) const {
    switch (type) {
        case Type::EventType:
            return event.kind == eventKind;
        case Type::UnicodeValue:
            return event.character && *event.character == value;
        case Type::UnicodeIsAlpha:
            return event.character && event.isAlpha() == flag;
        case Type::UnicodeIsDigit:
            return event.character && event.isDigit() == flag;
    }
    return false;
}

bool Rule::matches(const InputEvent& event) const {
    for (const auto& check : predicates) {
        if (!check.matches(event)) {
            return false;
        }
    }
    return true;
}

DeclarativeMapper::DeclarativeMapper(Channel channel, std::vector<Rule> rules, std::string source)
    : channel_(channel), rules_(std::move(rules)), source_(std::move(source)) {}

PolicyChoice DeclarativeMapper::map(const InputEvent& event) const {
    for (const auto& rule : rules_) {
        if (rule.matches(event)) {
            PolicyChoice choice;
            choice.kind = rule.policy;
            choice.args = rule.args;
            choice.origin = source_ + ":" + rule.origin;
            return choice;
        }
    }

    PolicyChoice none;
    none.matched = false;
    none.origin = source_ + ":" + channelName(channel_);
    return none;
}

std::vector<PolicyChoice> DeclarativeMapper::reachableChoices() const {
    std::vector<PolicyChoice> out;
    for (const auto& rule : rules_) {
        PolicyChoice choice;
        choice.kind = rule.policy;
        choice.args = rule.args;
        choice.origin = source_ + ":" + rule.origin;
        out.push_back(choice);
    }
    return out;
}

// ------------------------------------------------------------
// Parsing helpers
// ------------------------------------------------------------
namespace {

struct ParseContext {
    const std::string& source;
    ErrorReport* err;

    bool fail(const std::string& code, const std::string& where) const {
        ErrorReport report = ErrorManager::report(code, source + ": " + where);
        if (err) *err = report;
        return false;
    }
};

// Exactly one code point encoded as UTF-8
bool decodeSingleChar(const std::string& s, char32_t& out) {
    if (s.empty()) return false;

    const auto b0 = static_cast<unsigned char>(s[0]);
    size_t len = 0;
    char32_t cp = 0;
    if (b0 < 0x80)              { len = 1; cp = b0; }
    else if ((b0 & 0xE0) == 0xC0) { len = 2; cp = b0 & 0x1F; }
    else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; }
    else if ((b0 & 0xF8) == 0xF0) { len = 4; cp = b0 & 0x07; }
    else return false;

    if (s.size() != len) return false;
    for (size_t i = 1; i < len; ++i) {
        const auto b = static_cast<unsigned char>(s[i]);
        if ((b & 0xC0) != 0x80) return false;
        cp = (cp << 6) | (b & 0x3F);
    }
    out = cp;
    return true;
}

bool parseUnicode(const nlohmann::json& body, const std::string& where,
                  const ParseContext& ctx, Check& out) {
    if (!body.is_object() || body.size() != 1) {
        return ctx.fail("ERR_EXT_BAD_CHECK",
                        where + ".unicode: expected exactly one of value, isalpha, isdigit");
    }

    auto it = body.begin();
    const std::string key = it.key();
    const nlohmann::json& val = it.value();
    if (key == "value") {
        if (!val.is_string() || !decodeSingleChar(val.get<std::string>(), out.value)) {
            return ctx.fail("ERR_EXT_BAD_CHECK", where + ".unicode.value: expected a single character");
        }
        out.type = Check::Type::UnicodeValue;
        return true;
    }
    if (key == "isalpha" || key == "isdigit") {
        if (!val.is_boolean()) {
            return ctx.fail("ERR_EXT_BAD_CHECK", where + ".unicode." + key + ": expected true or false");
        }
        out.type = (key == "isalpha") ? Check::Type::UnicodeIsAlpha : Check::Type::UnicodeIsDigit;
        out.flag = val.get<bool>();
        return true;
    }
    return ctx.fail("ERR_EXT_UNKNOWN_KEY", where + ".unicode: unknown key '" + key + "'");
}

bool parseCheck(const nlohmann::json& j, const std::string& where,
                const ParseContext& ctx, Check& out) {
    if (!j.is_object() || j.size() != 1) {
        return ctx.fail("ERR_EXT_BAD_CHECK", where + ": a check must have exactly one key");
    }

    auto it = j.begin();
    const std::string key = it.key();
    const nlohmann::json& val = it.value();
    if (key == "type") {
        if (!val.is_string()) {
            return ctx.fail("ERR_EXT_BAD_CHECK", where + ".type: expected an event kind name");
        }
        auto kind = eventKindFromName(val.get<std::string>());
        if (!kind) {
            return ctx.fail("ERR_EXT_BAD_CHECK",
                            where + ".type: unknown event kind '" + val.get<std::string>() + "'");
        }
        out.type = Check::Type::EventType;
        out.eventKind = *kind;
        return true;
    }
    if (key == "unicode") {
        return parseUnicode(val, where, ctx, out);
    }
    return ctx.fail("ERR_EXT_UNKNOWN_KEY", where + ": unknown key '" + key + "'");
}

bool parseRule(const nlohmann::json& j, Channel channel, const std::string& where,
               const ParseContext& ctx, Rule& out) {
    if (!j.is_object()) {
        return ctx.fail("ERR_EXT_BAD_RULE", where + ": expected an object");
    }

    for (auto& [key, _] : j.items()) {
        if (key != "check" && key != "policy" && key != "args") {
            return ctx.fail("ERR_EXT_UNKNOWN_KEY", where + ": unknown key '" + key + "'");
        }
    }

    out.origin = where;

    if (j.contains("check")) {
        const auto& checks = j["check"];
        if (!checks.is_array()) {
            return ctx.fail("ERR_EXT_BAD_RULE", where + ".check: expected a list");
        }
        for (size_t i = 0; i < checks.size(); ++i) {
            Check check;
            if (!parseCheck(checks[i], where + ".check[" + std::to_string(i) + "]", ctx, check)) {
                return false;
            }
            out.predicates.push_back(check);
        }
    }

    if (!j.contains("policy") || !j["policy"].is_string()) {
        return ctx.fail("ERR_EXT_BAD_RULE", where + ".policy: expected a policy name");
    }
    const std::string name = j["policy"].get<std::string>();
    auto kind = policyKindFromName(name);
    if (!kind || !channelSupports(channel, *kind)) {
        return ctx.fail("ERR_EXT_UNKNOWN_POLICY",
                        where + ".policy: '" + name + "' is not a " + channelName(channel) + " policy");
    }
    out.policy = *kind;

    if (j.contains("args")) {
        const auto& args = j["args"];
        if (!args.is_array()) {
            return ctx.fail("ERR_EXT_BAD_RULE", where + ".args: expected a list of strings");
        }
        for (const auto& a : args) {
            if (!a.is_string()) {
                return ctx.fail("ERR_EXT_BAD_RULE", where + ".args: expected a list of strings");
            }
            out.args.push_back(a.get<std::string>());
        }
    }
    return true;
}

bool parseRuleList(const nlohmann::json& j, Channel channel,
                   const ParseContext& ctx, std::vector<Rule>& out) {
    const std::string section = channelName(channel);
    if (!j.is_array()) {
        return ctx.fail("ERR_EXT_BAD_RULE", section + ": expected a list of rules");
    }

    for (size_t i = 0; i < j.size(); ++i) {
        Rule rule;
        if (!parseRule(j[i], channel, section + "[" + std::to_string(i) + "]", ctx, rule)) {
            return false;
        }
        out.push_back(std::move(rule));
    }

    bool hasCatchAll = false;
    for (const auto& rule : out) {
        if (rule.predicates.empty()) hasCatchAll = true;
    }
    if (!hasCatchAll) {
        LOG_WARN("Extension", ctx.source + ": " + section +
                              " rules have no unconditional rule; unmatched events are fatal");
    }
    return true;
}

} // namespace

// ------------------------------------------------------------
// Public API
// ------------------------------------------------------------
bool parseExtension(const nlohmann::json& doc,
                    const std::string& source,
                    bool soundRequired,
                    Extension& out,
                    ErrorReport* err)
{
    ParseContext ctx{source, err};

    if (!doc.is_object()) {
        return ctx.fail("ERR_EXT_BAD_RULE", "top level: expected an object");
    }

    for (auto& [key, _] : doc.items()) {
        if (key != "apiVersion" && key != "image" && key != "sound") {
            return ctx.fail("ERR_EXT_UNKNOWN_KEY", "unknown key '" + key + "'");
        }
    }

    if (!doc.contains("apiVersion") || !doc["apiVersion"].is_number_integer() ||
        doc["apiVersion"].get<long long>() != 0) {
        const std::string got = doc.contains("apiVersion") ? doc["apiVersion"].dump() : "missing";
        return ctx.fail("ERR_EXT_API_VERSION", "apiVersion must be 0 (got " + got + ")");
    }

    if (!doc.contains("image")) {
        return ctx.fail("ERR_EXT_MISSING_SECTION", "image");
    }
    out.imageRules.clear();
    if (!parseRuleList(doc["image"], Channel::Image, ctx, out.imageRules)) {
        return false;
    }

    out.soundRules.reset();
    if (doc.contains("sound")) {
        std::vector<Rule> soundRules;
        if (!parseRuleList(doc["sound"], Channel::Sound, ctx, soundRules)) {
            return false;
        }
        out.soundRules = std::move(soundRules);
    } else if (soundRequired) {
        return ctx.fail("ERR_EXT_MISSING_SECTION", "sound");
    }

    out.source = source;
    LOG_DEBUG("Extension", "Loaded " + std::to_string(out.imageRules.size()) + " image rules, " +
                           std::to_string(out.soundRules ? out.soundRules->size() : 0) +
                           " sound rules from " + source);
    return true;
}

bool loadExtension(const std::filesystem::path& directory,
                   bool soundRequired,
                   Extension& out,
                   ErrorReport* err)
{
    const std::filesystem::path file = directory / EXTENSION_FILE;
    const std::string source = file.string();

    std::ifstream in(file);
    if (!in) {
        ErrorReport report = ErrorManager::report("ERR_EXT_NOT_FOUND", source);
        if (err) *err = report;
        LOG_PHASE("Extension load", false);
        return false;
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::exception& e) {
        ErrorReport report = ErrorManager::report("ERR_EXT_PARSE", source + ": " + e.what());
        if (err) *err = report;
        LOG_PHASE("Extension load", false);
        return false;
    }

    if (!parseExtension(doc, source, soundRequired, out, err)) {
        LOG_PHASE("Extension load", false);
        return false;
    }

    out.name = directory.filename().string();
    out.directory = directory;
    LOG_PHASE("Extension load", true);
    return true;
}

} // namespace bambam
