#pragma once
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include "chat_log.hpp"

// ------------------------------------------------------------
// Reply capability: query in, answer out.
// Implementations throw ServiceError on backend failure.
// ------------------------------------------------------------
class ChatService {
public:
    virtual ~ChatService() = default;
    virtual std::string reply(const std::string& query) = 0;
};

// ------------------------------------------------------------
// Backend settings (the "ai" section of aria_config.json)
// ------------------------------------------------------------
struct AiBackendConfig {
    std::string backend    = "groq";   // groq | openai | localai | ollama | auto
    std::string model      = "llama-3.1-8b-instant";
    std::string groqUrl    = "https://api.groq.com/openai/v1";
    std::string openaiUrl  = "https://api.openai.com/v1";
    std::string localaiUrl = "http://127.0.0.1:8080/v1";
    std::string ollamaUrl  = "http://127.0.0.1:11434";
    std::string apiKey;                // for the selected hosted backend
    double temperature = 0.7;
    int maxTokens      = 1024;
    int timeoutMs      = 30000;

    std::string assistantName = "Aria";
    std::string userName      = "User";

    static AiBackendConfig fromJson(const nlohmann::json& cfg);
};

// "auto" probes Ollama, then LocalAI, else falls back to groq
std::string resolveBackend(const AiBackendConfig& cfg);

// POST a chat-completions request; returns the assistant text.
// Throws ServiceError on transport or HTTP failure.
std::string callChatBackend(const AiBackendConfig& cfg, const nlohmann::json& messages);

// ------------------------------------------------------------
// Response helpers
// ------------------------------------------------------------
std::string cleanResponse(const std::string& answer);          // drop empty lines
std::string cleanRealtimeResponse(const std::string& answer);  // also drop debug-looking lines

// <h3> titles from a search result page (at most 'limit')
std::vector<std::string> parseSearchTitles(const std::string& html, size_t limit = 3);
std::string formatSearchDigest(const std::vector<std::string>& titles);

// "19 October 2026\n14:05:09" in local time
std::string currentDateTimeInfo();

// ------------------------------------------------------------
// ChatBot: conversational reply with a persisted transcript
// ------------------------------------------------------------
class ChatBot : public ChatService {
public:
    ChatBot(AiBackendConfig cfg, TranscriptStore& transcript);
    std::string reply(const std::string& query) override;

private:
    AiBackendConfig cfg_;
    TranscriptStore& transcript_;
};

// ------------------------------------------------------------
// RealtimeSearchEngine: reply grounded on a live search digest
// ------------------------------------------------------------
class RealtimeSearchEngine : public ChatService {
public:
    RealtimeSearchEngine(AiBackendConfig cfg, TranscriptStore& transcript);
    std::string reply(const std::string& prompt) override;

    // Fetch and summarize the top search results; never throws
    std::string searchDigest(const std::string& query) const;

private:
    AiBackendConfig cfg_;
    TranscriptStore& transcript_;
};
