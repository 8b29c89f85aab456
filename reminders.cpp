#include "reminders.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <fstream>

namespace fs = std::filesystem;

FileReminderStore::FileReminderStore(fs::path path)
    : path_(std::move(path)) {}

void FileReminderStore::append(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) throw IoError("Cannot create " + path_.parent_path().string() + ": " + ec.message());
    }

    std::ofstream out(path_, std::ios::app);
    if (!out) throw IoError("Cannot open reminders file: " + path_.string());

    // Keep one reminder per line
    std::string line = text;
    for (char& c : line) {
        if (c == '\n' || c == '\r') c = ' ';
    }
    out << line << "\n";
    if (!out) throw IoError("Short write on reminders file: " + path_.string());

    LOG_TRACE("Reminder", "Appended to " + path_.string());
}
