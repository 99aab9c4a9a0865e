#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "error_manager.hpp"

namespace sf {
class SoundBuffer;
class Texture;
}

namespace bambam {

// ------------------------------------------------------------
// Resource: one loaded sound or image, keyed by base file name
// ------------------------------------------------------------
struct Resource {
    std::string name;                              // e.g. "cow.wav"
    std::filesystem::path path;                    // where it came from
    std::shared_ptr<const sf::SoundBuffer> sound;  // sound sets only
    std::shared_ptr<const sf::Texture> texture;    // image sets only
};

enum class ResourceCategory {
    Sounds,
    Images
};

const char* categoryName(ResourceCategory category);

// ------------------------------------------------------------
// ResourceSet: immutable once built
// ------------------------------------------------------------
class ResourceSet {
public:
    ResourceSet() = default;

    // Duplicate names keep the first occurrence.
    explicit ResourceSet(std::vector<Resource> items);

    std::size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    const Resource& at(std::size_t index) const { return items_.at(index); }
    const Resource* find(const std::string& name) const;
    const std::vector<Resource>& items() const { return items_; }

private:
    std::vector<Resource> items_;
    std::unordered_map<std::string, std::size_t> byName_;
};

// Loads one file into 'out'. Returns false on failure.
using LoadFunc = std::function<bool(const std::filesystem::path& path, Resource& out)>;

// ------------------------------------------------------------
// Batch loader
// - Paths matching any blacklist glob are skipped.
// - A failed item is logged and skipped.
// - Fails only when nothing loaded and at least one item failed;
//   'err' then carries "All <category> failed to load."
// ------------------------------------------------------------
bool loadItems(const std::vector<std::filesystem::path>& paths,
               const std::vector<std::string>& blacklist,
               const LoadFunc& loadFn,
               ResourceCategory category,
               ResourceSet& out,
               ErrorReport* err = nullptr);

// fnmatch-style glob: '*', '?', '[abc]', '[!abc]'. '*' also crosses '/'.
bool globMatch(const std::string& text, const std::string& pattern);

// True if the full path or its file name matches any pattern
bool isBlacklisted(const std::filesystem::path& path, const std::vector<std::string>& patterns);

} // namespace bambam
