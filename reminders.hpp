#pragma once
#include <string>
#include <mutex>
#include <filesystem>

// Reminder storage capability; append throws IoError on failure
class ReminderStore {
public:
    virtual ~ReminderStore() = default;
    virtual void append(const std::string& text) = 0;
};

// One line per reminder (Data/reminders.txt)
class FileReminderStore : public ReminderStore {
public:
    explicit FileReminderStore(std::filesystem::path path);

    void append(const std::string& text) override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
};
