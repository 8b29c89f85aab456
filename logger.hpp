#pragma once
#include <string>
#include <chrono>

// =====================================================
// Log Level (threshold for DEBUG / TRACE / ERROR lines)
// =====================================================
enum class LogLevel {
    Debug = 0,
    Trace = 1,
    Error = 2
};

// Parse "debug" / "trace" / "error" (defaults to Debug on anything else)
LogLevel parseLogLevel(const std::string& name);
void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// Mirror log lines to stderr (on by default)
void setConsoleLogging(bool enabled);

// =====================================================
// Phase Info Struct
// =====================================================
struct PhaseInfo {
    std::chrono::system_clock::time_point timestamp; // when entered
    std::string fileName;    // file containing this phase
    std::string phaseName;   // descriptive phase string
    bool success;            // true = success, false = failure
};

// Most recent phase (copy, taken under the log lock)
PhaseInfo lastPhase();

// =====================================================
// Core Logging Functions
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success);

void logDebug(const std::string& tag, const std::string& msg);
void logTrace(const std::string& tag, const std::string& msg);
void logError(const std::string& tag, const std::string& msg);

// =====================================================
// Phase Group Controls (buffered block logging)
// =====================================================
void beginPhaseGroup();
void endPhaseGroup();

// =====================================================
// Lifecycle
// =====================================================
// Files over 2 MB are rotated to <name>.1 when opened
void initLogger(const std::string& filename);

// Switch to another file (logging.file); false if it cannot be opened
bool setLogFile(const std::string& filename);
void shutdownLogger();

// =====================================================
// Macros for convenience
// =====================================================
#define LOG_PHASE(phase, success) logPhaseInternal(__FILE__, phase, success)
#define LOG_DEBUG(tag, msg) logDebug(tag, msg)
#define LOG_TRACE(tag, msg) logTrace(tag, msg)
#define LOG_ERROR(tag, msg) logError(tag, msg)
