#include "resources.hpp"
#include "logger.hpp"
#include "engine/resource_set.hpp"

#include <algorithm>
#include <cstdlib>
#include <system_error>

#if defined(_WIN32)
    #include <windows.h>
#elif defined(__APPLE__)
    #include <mach-o/dyld.h>
#endif

namespace fs = std::filesystem;

// -------------------------------------------------------------
// Locate resource root
// -------------------------------------------------------------
static fs::path executableDir() {
#if defined(_WIN32)
    char buffer[MAX_PATH];
    if (GetModuleFileNameA(nullptr, buffer, MAX_PATH)) {
        return fs::path(buffer).parent_path();
    }
    return fs::current_path();
#elif defined(__APPLE__)
    char buffer[1024];
    uint32_t size = sizeof(buffer);
    if (_NSGetExecutablePath(buffer, &size) == 0) {
        return fs::path(buffer).parent_path();
    }
    return fs::current_path();
#else
    std::error_code ec;
    fs::path exe = fs::canonical("/proc/self/exe", ec);
    return ec ? fs::current_path() : exe.parent_path();
#endif
}

std::string getResourcePath() {
#if defined(BAMBAM_PORTABLE_ONLY)
    fs::path root = executableDir();
    LOG_DEBUG("Resources", "Using portable resource path: " + root.string());
    return root.string();
#else
    fs::path installed = fs::path(BAMBAM_DATA_DIR);
    if (fs::exists(installed)) {
        return installed.string();
    }

    // Running from a build tree
    fs::path local = executableDir();
    LOG_DEBUG("Resources", "Install dir missing, falling back to: " + local.string());
    return local.string();
#endif
}

static fs::path xdgDataHome() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return fs::path(xdg);
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return {};
}

std::vector<fs::path> dataDirectories() {
    std::vector<fs::path> dirs{ fs::path(getResourcePath()) / "data" };

    fs::path xdg = xdgDataHome();
    if (!xdg.empty()) {
        fs::path extra = xdg / "bambam" / "data";
        std::error_code ec;
        if (fs::is_directory(extra, ec)) {
            LOG_DEBUG("Resources", "Extra data dir: " + extra.string());
            dirs.push_back(extra);
        }
    }
    return dirs;
}

// -------------------------------------------------------------
// File discovery
// -------------------------------------------------------------
std::vector<fs::path> globData(const std::vector<fs::path>& dirs,
                               const std::vector<std::string>& patterns) {
    std::vector<fs::path> files;

    for (const auto& dir : dirs) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            LOG_DEBUG("Resources", "No such data dir: " + dir.string());
            continue;
        }

        fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (!it->is_regular_file(ec)) continue;

            const std::string name = it->path().filename().string();
            for (const auto& pattern : patterns) {
                if (bambam::globMatch(name, pattern)) {
                    files.push_back(it->path());
                    break;
                }
            }
        }
        if (ec) {
            LOG_WARN("Resources", "Stopped scanning " + dir.string() + ": " + ec.message());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

fs::path settingsPath() {
#if defined(BAMBAM_PORTABLE_ONLY)
    return fs::path(getResourcePath()) / "bambam.json";
#else
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "bambam" / "bambam.json";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / ".config" / "bambam" / "bambam.json";
    }
    return fs::path(getResourcePath()) / "bambam.json";
#endif
}

fs::path findExtensionDirectory(const std::string& name) {
    std::vector<fs::path> candidates{ fs::path(getResourcePath()) / "extensions" / name };

    fs::path xdg = xdgDataHome();
    if (!xdg.empty()) {
        candidates.push_back(xdg / "bambam" / "extensions" / name);
    }

    for (const auto& dir : candidates) {
        std::error_code ec;
        if (fs::is_directory(dir, ec)) {
            LOG_DEBUG("Resources", "Extension '" + name + "' found at " + dir.string());
            return dir;
        }
    }

    LOG_ERROR("Resources", "Extension '" + name + "' not found");
    return {};
}

// -------------------------------------------------------------
// Find any usable font in the resource root (first .ttf or .otf)
// -------------------------------------------------------------
static std::string firstFontIn(const fs::path& dir, bool recursive) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return {};
    }

    auto isFont = [](const fs::path& p) {
        auto ext = p.extension().string();
        return ext == ".ttf" || ext == ".otf";
    };

    if (recursive) {
        fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (isFont(it->path())) return it->path().string();
        }
    } else {
        for (auto& p : fs::directory_iterator(dir, ec)) {
            if (p.is_regular_file() && isFont(p.path())) return p.path().string();
        }
    }
    return {};
}

std::string findAnyFontInResources() {
    std::string font = firstFontIn(fs::path(getResourcePath()), false);
    if (!font.empty()) {
        LOG_PHASE("Font search", true);
        LOG_DEBUG("Resources", "Found font: " + font);
        return font;
    }

    // Fallback: common system fonts
#if defined(_WIN32)
    font = firstFontIn("C:/Windows/Fonts", false);
#elif defined(__APPLE__)
    font = firstFontIn("/System/Library/Fonts/Supplemental", false);
#else
    font = firstFontIn("/usr/share/fonts", true);
#endif

    if (!font.empty()) {
        LOG_PHASE("Font search", true);
        LOG_DEBUG("Resources", "Using system font: " + font);
        return font;
    }

    LOG_ERROR("Resources", "No font found in resources/ or system fonts.");
    LOG_PHASE("Font search", false);
    return {};
}
