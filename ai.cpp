#include "ai.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "commands/commands_helpers.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

// =========================================================
// Config
// =========================================================
AiBackendConfig AiBackendConfig::fromJson(const nlohmann::json& cfg) {
    AiBackendConfig c;
    if (!cfg.is_object()) return c;

    c.assistantName = cfg.value("assistant_name", c.assistantName);
    c.userName      = cfg.value("user_name", c.userName);

    if (!cfg.contains("ai") || !cfg["ai"].is_object()) return c;
    const auto& ai = cfg["ai"];

    c.backend     = ai.value("backend", c.backend);
    c.model       = ai.value("default_model", c.model);
    c.groqUrl     = ai.value("groq_url", c.groqUrl);
    c.openaiUrl   = ai.value("openai_url", c.openaiUrl);
    c.localaiUrl  = ai.value("localai_url", c.localaiUrl);
    c.ollamaUrl   = ai.value("ollama_url", c.ollamaUrl);
    c.temperature = ai.value("temperature", c.temperature);
    c.maxTokens   = ai.value("max_tokens", c.maxTokens);
    c.timeoutMs   = ai.value("timeout_ms", c.timeoutMs);

    // Key for the hosted backend; environment wins over an empty config entry
    std::string keyName = (c.backend == "openai") ? "openai" : "groq";
    if (ai.contains("api_keys") && ai["api_keys"].is_object()) {
        c.apiKey = ai["api_keys"].value(keyName, "");
    }
    if (c.apiKey.empty()) {
        const char* env = std::getenv(keyName == "openai" ? "OPENAI_API_KEY" : "GROQ_API_KEY");
        if (env) c.apiKey = env;
    }
    return c;
}

// =========================================================
// Backend resolver
// =========================================================
std::string resolveBackend(const AiBackendConfig& cfg) {
    if (cfg.backend != "auto") return cfg.backend;

    auto r = cpr::Get(cpr::Url{ cfg.ollamaUrl + "/api/tags" }, cpr::Timeout{1000});
    if (r.status_code == 200) return "ollama";

    r = cpr::Get(cpr::Url{ cfg.localaiUrl + "/models" }, cpr::Timeout{1000});
    if (r.status_code == 200) return "localai";

    return "groq";
}

// =========================================================
// Core chat call
// =========================================================
std::string callChatBackend(const AiBackendConfig& cfg, const nlohmann::json& messages) {
    std::string backend = resolveBackend(cfg);
    LOG_DEBUG("AI", "callChatBackend backend=" + backend + " model=" + cfg.model +
                    " messages=" + std::to_string(messages.size()));

    if (backend == "ollama") {
        auto resp = cpr::Post(
            cpr::Url{ cfg.ollamaUrl + "/api/chat" },
            cpr::Header{{"Content-Type", "application/json"}},
            cpr::Body{ nlohmann::json{
                {"model", cfg.model},
                {"messages", messages},
                {"stream", false}
            }.dump() },
            cpr::Timeout{ cfg.timeoutMs }
        );
        if (resp.status_code != 200) {
            throw ServiceError("ollama HTTP " + std::to_string(resp.status_code) +
                               (resp.error ? ": " + resp.error.message : ""));
        }
        auto j = nlohmann::json::parse(resp.text, nullptr, false);
        if (j.is_discarded() || !j.contains("message") || !j["message"].contains("content")) {
            throw ServiceError("ollama returned an unexpected body");
        }
        return j["message"]["content"].get<std::string>();
    }

    std::string base;
    if (backend == "groq")         base = cfg.groqUrl;
    else if (backend == "openai")  base = cfg.openaiUrl;
    else if (backend == "localai") base = cfg.localaiUrl;
    else throw ServiceError("Unknown AI backend: " + backend);

    cpr::Header headers = {{"Content-Type", "application/json"}};
    if (backend != "localai") {
        if (cfg.apiKey.empty()) throw ServiceError("Missing API key for " + backend);
        headers["Authorization"] = "Bearer " + cfg.apiKey;
    }

    auto resp = cpr::Post(
        cpr::Url{ base + "/chat/completions" },
        headers,
        cpr::Body{ nlohmann::json{
            {"model", cfg.model},
            {"messages", messages},
            {"temperature", cfg.temperature},
            {"max_tokens", cfg.maxTokens},
            {"top_p", 1},
            {"stream", false}
        }.dump() },
        cpr::Timeout{ cfg.timeoutMs }
    );

    if (resp.status_code != 200) {
        throw ServiceError(backend + " HTTP " + std::to_string(resp.status_code) +
                           (resp.error ? ": " + resp.error.message : ""));
    }

    auto j = nlohmann::json::parse(resp.text, nullptr, false);
    if (j.is_discarded() || !j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
        throw ServiceError(backend + " returned an unexpected body");
    }
    const auto& msg = j["choices"][0]["message"];
    if (!msg.contains("content") || !msg["content"].is_string()) return "";
    return msg["content"].get<std::string>();
}

// =========================================================
// Response helpers
// =========================================================
static std::string keepLines(const std::string& answer, bool (*keep)(const std::string&)) {
    std::istringstream ss(answer);
    std::string line, out;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!keep(line)) continue;
        if (!out.empty()) out += '\n';
        out += line;
    }
    return out;
}

std::string cleanResponse(const std::string& answer) {
    return keepLines(answer, [](const std::string& line) {
        return !trim(line).empty();
    });
}

std::string cleanRealtimeResponse(const std::string& answer) {
    return keepLines(answer, [](const std::string& line) {
        if (trim(line).empty()) return false;
        static const char* noise[] = {
            "err:", "[", "warning:", "api request failed", "image not found",
            "successfully generated", "no images", "failed to generate", "error:"
        };
        std::string lowered = toLower(line);
        for (const char* prefix : noise) {
            if (lowered.rfind(prefix, 0) == 0) return false;
        }
        return true;
    });
}

std::vector<std::string> parseSearchTitles(const std::string& html, size_t limit) {
    static const std::regex h3(R"(<h3[^>]*>([\s\S]*?)</h3>)", std::regex::icase);
    static const std::regex tag(R"(<[^>]+>)");

    std::vector<std::string> titles;
    for (std::sregex_iterator it(html.begin(), html.end(), h3), end; it != end; ++it) {
        if (titles.size() >= limit) break;
        std::string text = trim(std::regex_replace((*it)[1].str(), tag, ""));
        if (!text.empty()) titles.push_back(text);
    }
    return titles;
}

std::string formatSearchDigest(const std::vector<std::string>& titles) {
    if (titles.empty()) {
        return "No recent search results found. Using general knowledge.";
    }
    std::string out = "Latest Search Results:\n\n";
    for (size_t i = 0; i < titles.size(); ++i) {
        out += std::to_string(i + 1) + ". " + titles[i] + "\n";
    }
    return out;
}

std::string currentDateTimeInfo() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%d %B %Y") << "\n" << std::put_time(&tm, "%H:%M:%S");
    return oss.str();
}

static nlohmann::json toJson(const ChatTranscript& transcript) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& m : transcript) {
        arr.push_back({ {"role", m.role}, {"content", m.content} });
    }
    return arr;
}

// =========================================================
// ChatBot
// =========================================================
ChatBot::ChatBot(AiBackendConfig cfg, TranscriptStore& transcript)
    : cfg_(std::move(cfg)), transcript_(transcript) {}

std::string ChatBot::reply(const std::string& query) {
    ChatTranscript messages = transcript_.load();
    messages.push_back({ "user", query });

    nlohmann::json all = nlohmann::json::array();
    all.push_back({ {"role", "system"}, {"content",
        "Hello, I am " + cfg_.userName + ". You are " + cfg_.assistantName +
        ", an accurate AI assistant with real-time information.\n"
        "- Answer questions concisely\n"
        "- Reply only in English\n"
        "- No unnecessary notes or training data mentions" } });
    for (auto& m : toJson(messages)) all.push_back(m);

    std::string answer = callChatBackend(cfg_, all);

    size_t pos;
    while ((pos = answer.find("</s>")) != std::string::npos) answer.erase(pos, 4);
    answer = trim(answer);
    if (answer.empty()) {
        answer = "Sorry, I couldn't generate a response. Please try again.";
    }

    messages.push_back({ "assistant", answer });
    transcript_.save(messages);

    return cleanResponse(answer);
}

// =========================================================
// RealtimeSearchEngine
// =========================================================
RealtimeSearchEngine::RealtimeSearchEngine(AiBackendConfig cfg, TranscriptStore& transcript)
    : cfg_(std::move(cfg)), transcript_(transcript) {}

std::string RealtimeSearchEngine::searchDigest(const std::string& query) const {
    auto resp = cpr::Get(
        cpr::Url{ "https://www.google.com/search" },
        cpr::Parameters{{"q", query}},
        cpr::Header{{"User-Agent",
            "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 "
            "(KHTML, like Gecko) Chrome/120.0 Safari/537.36"}},
        cpr::Timeout{10000}
    );

    if (resp.status_code != 200) {
        LOG_DEBUG("Realtime", "Search fetch failed (HTTP " + std::to_string(resp.status_code) + ")");
        return "No search results are available at this time.";
    }
    return formatSearchDigest(parseSearchTitles(resp.text));
}

std::string RealtimeSearchEngine::reply(const std::string& prompt) {
    ChatTranscript messages = transcript_.load();
    messages.push_back({ "user", prompt });

    nlohmann::json all = nlohmann::json::array();
    all.push_back({ {"role", "system"}, {"content",
        "You are " + cfg_.assistantName + ", an AI assistant with real-time information access.\n"
        "- Provide professional, well-formatted answers.\n"
        "- Use proper grammar and punctuation.\n"
        "- Prefer the latest information available." } });
    all.push_back({ {"role", "system"}, {"content", currentDateTimeInfo()} });
    all.push_back({ {"role", "system"}, {"content", searchDigest(prompt)} });
    for (auto& m : toJson(messages)) all.push_back(m);

    std::string answer = trim(callChatBackend(cfg_, all));
    if (answer.empty()) {
        answer = "I apologize, but I couldn't generate a response. Please try again.";
    }

    messages.push_back({ "assistant", answer });
    transcript_.save(messages);

    return cleanRealtimeResponse(answer);
}
