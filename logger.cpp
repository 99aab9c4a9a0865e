#include "logger.hpp"

#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <mutex>
#include <vector>
#include <filesystem>
#include <chrono>

// =====================================================
// Globals
// =====================================================
#if defined(_DEBUG) || !defined(NDEBUG)
static constexpr bool kReleaseBuild = false;
#else
static constexpr bool kReleaseBuild = true;
#endif

static std::mutex g_logMutex;

// Buffer for grouped phase logging
static bool g_buffering = false;
static std::vector<std::string> g_phaseBuffer;

static std::ofstream g_logFile;

// =====================================================
// Helpers
// =====================================================
static std::string nowTimestamp() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

static std::string fileBaseName(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    return (pos == std::string::npos) ? path : path.substr(pos + 1);
}

static void writeLine(const std::string& line) {
    if (g_logFile.is_open()) {
        g_logFile << line << std::endl;
    }
    std::cerr << line << std::endl;
}

static void writeTagged(const char* level, const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    writeLine("[" + nowTimestamp() + "][" + level + "][" + tag + "] " + msg);
}

// =====================================================
// Buffering controls
// =====================================================
void beginPhaseGroup() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_buffering = true;
    g_phaseBuffer.clear();
}

void endPhaseGroup() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    for (auto& line : g_phaseBuffer) {
        writeLine(line);
    }
    g_phaseBuffer.clear();
    g_buffering = false;
}

// =====================================================
// Phase Logging
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success)
{
    // Release builds only keep failed phases
    if (kReleaseBuild && success) {
        return;
    }

    std::lock_guard<std::mutex> lock(g_logMutex);

    const std::string entry = "| " + nowTimestamp() +
                              " | " + fileBaseName(file) +
                              " | " + phase +
                              " | " + (success ? "ok" : "FAILED") + " |";

    if (g_buffering) {
        g_phaseBuffer.push_back(entry);
    } else {
        writeLine(entry);
    }
}

// =====================================================
// Debug / Trace / Warn / Error Logging
// =====================================================
void logDebug(const std::string& tag, const std::string& msg) {
    writeTagged("DEBUG", tag, msg);
}

void logTrace(const std::string& tag, const std::string& msg) {
    if (kReleaseBuild) return;
    writeTagged("TRACE", tag, msg);
}

void logWarn(const std::string& tag, const std::string& msg) {
    writeTagged("WARN", tag, msg);
}

void logError(const std::string& tag, const std::string& msg) {
    writeTagged("ERROR", tag, msg);
}

// =====================================================
// Lifecycle
// =====================================================
namespace fs = std::filesystem;

void initLogger(const std::string& filename) {
    std::lock_guard<std::mutex> lock(g_logMutex);

    if (filename.empty()) {
        return;
    }

    fs::path logPath = fs::absolute(filename);
    g_logFile.open(logPath, std::ios::out | std::ios::app);

    if (g_logFile.is_open()) {
        g_logFile << "==== BamBam Log Started ====" << std::endl;

        // Always print the log path so users know where to look
        std::string msg = "[" + nowTimestamp() + "][Logger] Writing logs to: " + logPath.string();
        std::cerr << msg << std::endl;
        g_logFile << msg << std::endl;
    } else {
        std::cerr << "[Logger] ERROR: Could not open log file: "
                  << logPath.string() << std::endl;
    }
}

void shutdownLogger() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_logFile.is_open()) {
        g_logFile << "==== BamBam Log Ended ====" << std::endl;
        g_logFile.close();
    }
}
