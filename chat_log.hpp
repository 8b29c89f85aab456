#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <filesystem>

// One role-tagged transcript entry ("system", "user", "assistant")
struct ChatMessage {
    std::string role;
    std::string content;

    bool operator==(const ChatMessage& other) const {
        return role == other.role && content == other.content;
    }
};

using ChatTranscript = std::vector<ChatMessage>;

// ------------------------------------------------------------
// Transcript store: opaque load/save of the chat log.
// Reply services hold a reference; there is no global log.
// ------------------------------------------------------------
class TranscriptStore {
public:
    virtual ~TranscriptStore() = default;

    virtual ChatTranscript load() = 0;
    virtual void save(const ChatTranscript& transcript) = 0;   // throws IoError
};

// JSON array of {role, content} on disk (Data/ChatLog.json)
class JsonTranscriptStore : public TranscriptStore {
public:
    explicit JsonTranscriptStore(std::filesystem::path path);

    // Missing or empty file → creates "[]" and returns empty.
    // Unparseable file → logged, returns empty (file left as is).
    ChatTranscript load() override;
    void save(const ChatTranscript& transcript) override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
};
