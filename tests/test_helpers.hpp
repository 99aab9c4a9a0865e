#pragma once
#include <memory>
#include <string>
#include <vector>

#include "engine/input_event.hpp"
#include "engine/resource_set.hpp"

namespace bambam::testing {

// A set of name-only items; the engine never touches the payloads
inline std::shared_ptr<const ResourceSet> namedSet(const std::vector<std::string>& names) {
    std::vector<Resource> items;
    for (const auto& name : names) {
        Resource r;
        r.name = name;
        r.path = name;
        items.push_back(r);
    }
    return std::make_shared<ResourceSet>(std::move(items));
}

inline InputEvent key(char32_t c) {
    return InputEvent::keyDown(static_cast<int>(c), c);
}

} // namespace bambam::testing
