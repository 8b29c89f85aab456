#pragma once
#include <string>
#include <vector>

// 🔹 Intent tags produced by the classifier
enum class IntentTag {
    General,
    Realtime,
    Open,
    Close,
    Play,
    System,
    GoogleSearch,
    YouTubeSearch,
    Reminder,
    Exit,
    Unknown      // anything else routed in by name; dispatched as General
};

// One classified, independently dispatchable piece of an utterance
struct IntentSegment {
    IntentTag tag = IntentTag::General;
    std::string argument;

    bool operator==(const IntentSegment& other) const {
        return tag == other.tag && argument == other.argument;
    }
    bool operator!=(const IntentSegment& other) const { return !(*this == other); }
};

using IntentSegments = std::vector<IntentSegment>;

// "general", "google search", ... (lowercase, as shown in logs)
std::string intentTagName(IntentTag tag);

// Inverse of intentTagName(); unrecognized names map to IntentTag::Unknown
IntentTag intentTagFromName(const std::string& name);
