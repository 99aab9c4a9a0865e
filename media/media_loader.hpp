#pragma once
#include <filesystem>
#include "engine/resource_set.hpp"

// -------------------------------------------------------------
// SFML loaders used with bambam::loadItems()
// Both fill Resource::name with the file's base name.
// -------------------------------------------------------------
namespace Media {
    bool loadSound(const std::filesystem::path& path, bambam::Resource& out);
    bool loadImage(const std::filesystem::path& path, bambam::Resource& out);
}
