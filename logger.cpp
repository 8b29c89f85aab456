#include "logger.hpp"

#include <cstdint>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <mutex>
#include <vector>
#include <filesystem>
#include <atomic>
#include <thread>

namespace fs = std::filesystem;

// =====================================================
// Shared state (everything below g_log.mutex)
// =====================================================
namespace {

struct LogState {
    std::mutex mutex;
    std::ofstream file;
    fs::path filePath;
    bool console = true;

    PhaseInfo lastPhase{};
    bool grouping = false;
    std::vector<std::string> grouped;
};

LogState g_log;
std::atomic<int> g_minLevel{ static_cast<int>(LogLevel::Debug) };

// Rotate once the file passes this size (one backup kept)
constexpr std::uintmax_t kRotateBytes = 2 * 1024 * 1024;

const std::thread::id g_mainThread = std::this_thread::get_id();

std::string timestamp(const std::chrono::system_clock::time_point& tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  tp.time_since_epoch()).count() % 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

// "" on the main thread, "[t3]" on helper threads (playback, workers)
std::string threadTag() {
    if (std::this_thread::get_id() == g_mainThread) return "";
    static std::atomic<int> next{1};
    thread_local int id = next++;
    return "[t" + std::to_string(id) + "]";
}

std::string fileName(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    return (pos == std::string::npos) ? path : path.substr(pos + 1);
}

// Caller holds g_log.mutex
void emit(const std::string& line) {
    if (g_log.file.is_open()) {
        g_log.file << line << '\n';
        g_log.file.flush();
    }
    if (g_log.console) std::cerr << line << '\n';
}

// Caller holds g_log.mutex
bool openFile(const fs::path& path) {
    if (g_log.file.is_open()) g_log.file.close();

    std::error_code ec;
    if (fs::exists(path, ec) && fs::file_size(path, ec) > kRotateBytes) {
        fs::path backup = path;
        backup += ".1";
        fs::rename(path, backup, ec);
    }
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);

    g_log.file.open(path, std::ios::out | std::ios::app);
    g_log.filePath = path;
    return g_log.file.is_open();
}

void write(LogLevel level, const char* label, const std::string& tag, const std::string& msg) {
    if (static_cast<int>(level) < g_minLevel.load()) return;

    std::string line = "[" + timestamp(std::chrono::system_clock::now()) + "]" + threadTag() +
                       "[" + label + "][" + tag + "] " + msg;
    std::lock_guard<std::mutex> lock(g_log.mutex);
    emit(line);
}

} // namespace

// =====================================================
// Level controls
// =====================================================
LogLevel parseLogLevel(const std::string& name) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "error") return LogLevel::Error;
    return LogLevel::Debug;
}

void setLogLevel(LogLevel level) {
    g_minLevel.store(static_cast<int>(level));
}

LogLevel getLogLevel() {
    return static_cast<LogLevel>(g_minLevel.load());
}

void setConsoleLogging(bool enabled) {
    std::lock_guard<std::mutex> lock(g_log.mutex);
    g_log.console = enabled;
}

// =====================================================
// Phase groups
// =====================================================
void beginPhaseGroup() {
    std::lock_guard<std::mutex> lock(g_log.mutex);
    g_log.grouping = true;
    g_log.grouped.clear();
}

void endPhaseGroup() {
    std::lock_guard<std::mutex> lock(g_log.mutex);
    for (const auto& line : g_log.grouped) emit(line);
    g_log.grouped.clear();
    g_log.grouping = false;
}

// =====================================================
// Phases
// =====================================================
void logPhaseInternal(const std::string& file, const std::string& phase, bool success) {
    PhaseInfo info;
    info.timestamp = std::chrono::system_clock::now();
    info.fileName  = fileName(file);
    info.phaseName = phase;
    info.success   = success;

    std::string line = "| " + timestamp(info.timestamp) + " | " + info.fileName +
                       " | " + info.phaseName + " | " + (success ? "true" : "false") + " |";

    std::lock_guard<std::mutex> lock(g_log.mutex);
    g_log.lastPhase = std::move(info);
    if (g_log.grouping) g_log.grouped.push_back(line);
    else emit(line);
}

PhaseInfo lastPhase() {
    std::lock_guard<std::mutex> lock(g_log.mutex);
    return g_log.lastPhase;
}

// =====================================================
// Debug / Trace / Error
// =====================================================
void logDebug(const std::string& tag, const std::string& msg) { write(LogLevel::Debug, "DEBUG", tag, msg); }
void logTrace(const std::string& tag, const std::string& msg) { write(LogLevel::Trace, "TRACE", tag, msg); }
void logError(const std::string& tag, const std::string& msg) { write(LogLevel::Error, "ERROR", tag, msg); }

// =====================================================
// Lifecycle
// =====================================================
void initLogger(const std::string& filename) {
    std::lock_guard<std::mutex> lock(g_log.mutex);
    fs::path path = fs::absolute(filename);

    if (!openFile(path)) {
        std::cerr << "[Logger] Could not open log file: " << path.string() << '\n';
        return;
    }
    g_log.file << "==== ARIA session " << timestamp(std::chrono::system_clock::now()) << " ====\n";
    if (g_log.console) std::cerr << "[Logger] Writing logs to: " << path.string() << '\n';
}

bool setLogFile(const std::string& filename) {
    fs::path path = fs::absolute(filename);
    std::lock_guard<std::mutex> lock(g_log.mutex);
    if (g_log.file.is_open() && path == g_log.filePath) return true;

    if (!openFile(path)) {
        std::cerr << "[Logger] Could not switch log file to: " << path.string() << '\n';
        return false;
    }
    return true;
}

void shutdownLogger() {
    std::lock_guard<std::mutex> lock(g_log.mutex);
    if (g_log.file.is_open()) {
        g_log.file << "==== ARIA session end ====\n";
        g_log.file.close();
    }
    std::cerr.flush();
}
