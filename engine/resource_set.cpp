#include "resource_set.hpp"
#include "logger.hpp"

namespace bambam {

const char* categoryName(ResourceCategory category) {
    switch (category) {
        case ResourceCategory::Sounds: return "sounds";
        case ResourceCategory::Images: return "images";
    }
    return "resources";
}

// ------------------------------------------------------------
// ResourceSet
// ------------------------------------------------------------
ResourceSet::ResourceSet(std::vector<Resource> items) {
    items_.reserve(items.size());
    for (auto& item : items) {
        if (byName_.count(item.name)) {
            LOG_WARN("Resources", "Duplicate name ignored: " + item.path.string());
            continue;
        }
        byName_[item.name] = items_.size();
        items_.push_back(std::move(item));
    }
}

const Resource* ResourceSet::find(const std::string& name) const {
    auto it = byName_.find(name);
    if (it == byName_.end()) {
        return nullptr;
    }
    return &items_[it->second];
}

// ------------------------------------------------------------
// Glob matching
// ------------------------------------------------------------
static bool matchClass(const std::string& pattern, size_t& p, char c) {
    // pattern[p] == '['
    size_t i = p + 1;
    bool negate = false;
    if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
        negate = true;
        ++i;
    }

    bool matched = false;
    bool first = true;
    while (i < pattern.size() && (first || pattern[i] != ']')) {
        first = false;
        char lo = pattern[i];
        if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
            char hi = pattern[i + 2];
            if (lo <= c && c <= hi) matched = true;
            i += 3;
        } else {
            if (lo == c) matched = true;
            ++i;
        }
    }

    if (i >= pattern.size()) {
        // Unterminated class: treat '[' literally
        matched = (c == '[');
        p += 1;
        return matched;
    }

    p = i + 1; // past ']'
    return matched != negate;
}

bool globMatch(const std::string& text, const std::string& pattern) {
    size_t t = 0, p = 0;
    size_t starP = std::string::npos, starT = 0;

    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            starP = p++;
            starT = t;
            continue;
        }
        if (p < pattern.size() && pattern[p] == '?') {
            ++p;
            ++t;
            continue;
        }
        if (p < pattern.size() && pattern[p] == '[') {
            size_t next = p;
            if (matchClass(pattern, next, text[t])) {
                p = next;
                ++t;
                continue;
            }
        } else if (p < pattern.size() && pattern[p] == text[t]) {
            ++p;
            ++t;
            continue;
        }

        // Backtrack to the last '*'
        if (starP == std::string::npos) {
            return false;
        }
        p = starP + 1;
        t = ++starT;
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

bool isBlacklisted(const std::filesystem::path& path, const std::vector<std::string>& patterns) {
    const std::string full = path.generic_string();
    const std::string base = path.filename().string();
    for (const auto& pattern : patterns) {
        if (globMatch(full, pattern) || globMatch(base, pattern)) {
            return true;
        }
    }
    return false;
}

// ------------------------------------------------------------
// Batch loader
// ------------------------------------------------------------
bool loadItems(const std::vector<std::filesystem::path>& paths,
               const std::vector<std::string>& blacklist,
               const LoadFunc& loadFn,
               ResourceCategory category,
               ResourceSet& out,
               ErrorReport* err)
{
    std::vector<Resource> loaded;
    size_t failures = 0;

    for (const auto& path : paths) {
        if (isBlacklisted(path, blacklist)) {
            LOG_DEBUG("Resources", "Skipping blacklisted item: " + path.string());
            continue;
        }

        Resource item;
        item.name = path.filename().string();
        item.path = path;

        if (!loadFn(path, item)) {
            ++failures;
            LOG_WARN("Resources", std::string("Cannot load ") + categoryName(category) +
                                  " item: " + path.string());
            continue;
        }
        loaded.push_back(std::move(item));
    }

    const std::string summary = std::to_string(loaded.size()) + " loaded, " +
                                std::to_string(failures) + " failed";

    if (loaded.empty() && failures > 0) {
        const char* code = (category == ResourceCategory::Sounds)
                               ? "ERR_SOUNDS_ALL_FAILED"
                               : "ERR_IMAGES_ALL_FAILED";
        ErrorReport report = ErrorManager::report(code);
        if (err) *err = report;
        LOG_PHASE(std::string("Load ") + categoryName(category), false);
        out = ResourceSet();
        return false;
    }

    out = ResourceSet(std::move(loaded));
    LOG_PHASE(std::string("Load ") + categoryName(category), true);
    LOG_DEBUG("Resources", std::string(categoryName(category)) + ": " + summary);
    return true;
}

} // namespace bambam
