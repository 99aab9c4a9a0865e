#pragma once
#include <string>
#include <vector>
#include <filesystem>

// ------------------------------------------------------------
// Resource root
// - Portable mode (BAMBAM_PORTABLE_ONLY=1): directory of the executable
// - Install mode: ${CMAKE_INSTALL_DATADIR}/bambam
// ------------------------------------------------------------
std::string getResourcePath();

// <root>/data plus $XDG_DATA_HOME/bambam/data when it exists
std::vector<std::filesystem::path> dataDirectories();

// Recursive search of 'dirs' for file names matching any pattern.
// Sorted, so runs with the same seed pick the same files.
std::vector<std::filesystem::path> globData(const std::vector<std::filesystem::path>& dirs,
                                            const std::vector<std::string>& patterns);

// $XDG_CONFIG_HOME/bambam/bambam.json (~/.config when unset);
// portable builds keep it beside the executable
std::filesystem::path settingsPath();

// Directory of a named extension; empty path if not found
std::filesystem::path findExtensionDirectory(const std::string& name);

// Locate any usable .ttf/.otf font in the resource root or system fonts.
// Returns empty string if none found.
std::string findAnyFontInResources();

inline const std::vector<std::string> SOUND_PATTERNS = { "*.wav", "*.ogg" };
inline const std::vector<std::string> IMAGE_PATTERNS = { "*.gif", "*.jpg", "*.jpeg", "*.png" };
