#include "nlp_rules.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <fstream>

// ------------------------------------------------------------
// Copy one string array out of the vocabulary JSON (if present)
// ------------------------------------------------------------
static bool readWordList(const nlohmann::json& j, const char* key,
                         std::vector<std::string>& out, std::string* err) {
    if (!j.contains(key)) return true;

    const auto& arr = j.at(key);
    if (!arr.is_array()) {
        if (err) *err = std::string("\"") + key + "\" must be an array";
        return false;
    }

    std::vector<std::string> words;
    for (const auto& w : arr) {
        if (!w.is_string()) {
            if (err) *err = std::string("\"") + key + "\" contains a non-string entry";
            return false;
        }
        std::string word = w.get<std::string>();
        if (!word.empty()) words.push_back(word);
    }
    out = std::move(words);
    return true;
}

// ------------------------------------------------------------
// Load vocabulary from a JSON string
// ------------------------------------------------------------
bool loadNlpVocabularyFromString(const std::string& text, NlpVocabulary& out, std::string* err) {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        if (err) *err = "Vocabulary JSON must be an object";
        return false;
    }

    NlpVocabulary vocab = out;
    if (!readWordList(j, "exit", vocab.exitWords, err) ||
        !readWordList(j, "realtime", vocab.realtimeWords, err) ||
        !readWordList(j, "datetime", vocab.dateTimeWords, err)) {
        return false;
    }

    out = std::move(vocab);
    return true;
}

// ------------------------------------------------------------
// Load vocabulary from a JSON file
// ------------------------------------------------------------
bool loadNlpVocabulary(const std::string& path, NlpVocabulary& out, std::string* err) {
    std::ifstream in(path);
    if (!in.is_open()) {
        if (err) *err = "Could not open file: " + path;
        return false;
    }

    std::string text{ std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
    if (!loadNlpVocabularyFromString(text, out, err)) {
        LOG_ERROR("Classifier", "Rejected vocabulary file " + path);
        return false;
    }

    LOG_DEBUG("Classifier", "Loaded vocabulary from " + path + " (" +
              std::to_string(out.exitWords.size()) + " exit, " +
              std::to_string(out.realtimeWords.size()) + " realtime, " +
              std::to_string(out.dateTimeWords.size()) + " datetime)");
    return true;
}
