#include <unordered_map>
#include <vector>
#include <random>
#include <mutex>
#include "response_manager.hpp"

// Simple random picker
static std::string pickRandom(const std::vector<std::string>& options) {
    static std::mutex m;
    static std::random_device rd;
    static std::mt19937 gen(rd());
    std::lock_guard<std::mutex> lock(m);
    std::uniform_int_distribution<> dist(0, static_cast<int>(options.size()) - 1);
    return options[dist(gen)];
}

// Response database
static const std::unordered_map<std::string, std::vector<std::string>> responses = {
    // --- App / Web ---
    { "open_app_success", {
        "Opening ",
        "Launching ",
        "Here we go, opening "
    }},
    { "close_app", {
        "Closing ",
        "Shutting down ",
        "Okay, closing "
    }},
    { "play", {
        "Playing ",
        "Finding ",
        "Putting on "
    }},
    { "search_google", {
        "Searching Google for ",
        "Looking that up online: ",
        "On it, searching for "
    }},
    { "search_youtube", {
        "Searching YouTube for ",
        "Looking on YouTube for ",
        "Pulling up videos for "
    }},
    { "youtube_home", {
        "Opening YouTube."
    }},

    // --- System ---
    { "system_command", {
        "Executing system command: "
    }},

    // --- Reminders ---
    { "reminder_saved", {
        "Reminder saved."
    }},

    // --- Session ---
    { "startup", {
        "Aria is ready.",
        "All systems online.",
        "Ready when you are."
    }},
    { "farewell", {
        "Goodbye.",
        "See you later.",
        "Shutting down. Bye."
    }},
    { "mode_switch", {
        "Switched to ",
        "Input mode is now "
    }},

    // --- Voice ---
    { "voice_none", {
        "I didn't catch that.",
        "No speech detected.",
        "Hmm, I couldn't hear anything."
    }},
};

std::string ResponseManager::get(const std::string& keyOrMessage) {
    auto it = responses.find(keyOrMessage);
    if (it != responses.end() && !it->second.empty()) {
        return pickRandom(it->second);
    }
    return keyOrMessage;
}
