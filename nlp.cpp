#include "nlp.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

// ------------------------------------------------------------
// Tag names
// ------------------------------------------------------------
std::string intentTagName(IntentTag tag) {
    switch (tag) {
        case IntentTag::General:       return "general";
        case IntentTag::Realtime:      return "realtime";
        case IntentTag::Open:          return "open";
        case IntentTag::Close:         return "close";
        case IntentTag::Play:          return "play";
        case IntentTag::System:        return "system";
        case IntentTag::GoogleSearch:  return "google search";
        case IntentTag::YouTubeSearch: return "youtube search";
        case IntentTag::Reminder:      return "reminder";
        case IntentTag::Exit:          return "exit";
        case IntentTag::Unknown:       return "unknown";
    }
    return "unknown";
}

IntentTag intentTagFromName(const std::string& name) {
    static const IntentTag all[] = {
        IntentTag::General, IntentTag::Realtime, IntentTag::Open, IntentTag::Close,
        IntentTag::Play, IntentTag::System, IntentTag::GoogleSearch,
        IntentTag::YouTubeSearch, IntentTag::Reminder, IntentTag::Exit
    };
    for (IntentTag t : all) {
        if (intentTagName(t) == name) return t;
    }
    return IntentTag::Unknown;
}

// ------------------------------------------------------------
// Default vocabulary
// ------------------------------------------------------------
NlpVocabulary NlpVocabulary::defaults() {
    NlpVocabulary v;
    v.exitWords = { "bye", "exit", "quit", "goodbye", "end" };
    v.realtimeWords = {
        "news", "weather", "update", "current", "latest", "recent",
        "headline", "now", "live", "score", "trending", "breaking",
        "forecast", "stock", "price", "exchange rate", "covid", "coronavirus",
        "todays news", "todays headline", "todays weather",
        "result", "results", "match", "game", "event", "happening", "going on"
    };
    v.dateTimeWords = { "date", "time", "day", "month", "year" };
    return v;
}

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
namespace {

std::string trimCopy(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    auto end   = s.find_last_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    return s.substr(start, end - start + 1);
}

// ASCII punctuation only; '_' counts as a word character and
// bytes >= 0x80 (UTF-8 letters) are kept.
bool isStrippable(unsigned char c) {
    return c < 0x80 && std::ispunct(c) && c != '_';
}

std::string stripPunct(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (!isStrippable(c)) out.push_back(static_cast<char>(c));
    }
    return out;
}

std::string lowerCopy(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> splitWords(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream iss(s);
    std::string w;
    while (iss >> w) words.push_back(w);
    return words;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Remainder of 'original' after its first 'count' non-punctuation
// characters, i.e. the original-text counterpart of bare.substr(count).
std::string sliceAfterBare(const std::string& original, size_t count) {
    size_t seen = 0;
    size_t i = 0;
    while (i < original.size() && seen < count) {
        if (!isStrippable(static_cast<unsigned char>(original[i]))) ++seen;
        ++i;
    }
    return original.substr(i);
}

// Whole-word phrase lookup ("exchange rate" must appear as consecutive tokens)
bool containsPhrase(const std::vector<std::string>& tokens, const std::string& phrase) {
    auto words = splitWords(phrase);
    if (words.empty() || words.size() > tokens.size()) return false;
    auto it = std::search(tokens.begin(), tokens.end(), words.begin(), words.end());
    return it != tokens.end();
}

bool containsAny(const std::vector<std::string>& tokens, const std::vector<std::string>& phrases) {
    for (const auto& p : phrases) {
        if (containsPhrase(tokens, p)) return true;
    }
    return false;
}

IntentSegments single(IntentTag tag, const std::string& arg) {
    return { IntentSegment{ tag, arg } };
}

} // namespace

// ------------------------------------------------------------
// Construction
// ------------------------------------------------------------
NLP::NLP() : NLP(NlpVocabulary::defaults()) {}

NLP::NLP(NlpVocabulary vocab) : vocab_(std::move(vocab)) {
    buildRules();
}

NLP::Input NLP::normalize(const std::string& utterance) {
    Input in;
    in.original  = trimCopy(utterance);
    in.lowered   = lowerCopy(in.original);
    in.bare      = stripPunct(in.lowered);
    in.bareCased = trimCopy(stripPunct(in.original));
    in.tokens    = splitWords(in.bare);
    return in;
}

// ------------------------------------------------------------
// Rule table (evaluated top to bottom, first match wins)
// ------------------------------------------------------------
void NLP::buildRules() {
    rules_.clear();

    // 1. Exit vocabulary, whole tokens. Discards everything else.
    rules_.push_back({ "exit", [this](const Input& in) -> std::optional<IntentSegments> {
        for (const auto& tok : in.tokens) {
            if (std::find(vocab_.exitWords.begin(), vocab_.exitWords.end(), tok) != vocab_.exitWords.end()) {
                return single(IntentTag::Exit, "");
            }
        }
        return std::nullopt;
    }});

    // 2. Search-engine triggers at the start of the utterance
    rules_.push_back({ "search", [](const Input& in) -> std::optional<IntentSegments> {
        static const std::pair<const char*, IntentTag> triggers[] = {
            { "google ",             IntentTag::GoogleSearch  },
            { "search google for ",  IntentTag::GoogleSearch  },
            { "youtube ",            IntentTag::YouTubeSearch },
            { "search youtube for ", IntentTag::YouTubeSearch },
        };
        for (const auto& [phrase, tag] : triggers) {
            std::string trigger = phrase;
            if (startsWith(in.bare, trigger)) {
                return single(tag, trimCopy(sliceAfterBare(in.original, trigger.size())));
            }
        }
        return std::nullopt;
    }});

    // 3. Batchable verbs: "open a, b and c" → one segment per item
    rules_.push_back({ "batch_action", [](const Input& in) -> std::optional<IntentSegments> {
        static const std::pair<const char*, IntentTag> verbs[] = {
            { "open",   IntentTag::Open   },
            { "close",  IntentTag::Close  },
            { "play",   IntentTag::Play   },
            { "system", IntentTag::System },
        };
        static const std::regex separator(R"(\s*,\s*|\s+and\s+)", std::regex::icase);

        for (const auto& [verb, tag] : verbs) {
            std::string word = verb;
            if (!startsWith(in.bare, word + " ")) continue;

            std::string rest = trimCopy(sliceAfterBare(in.original, word.size()));
            IntentSegments out;
            std::sregex_token_iterator it(rest.begin(), rest.end(), separator, -1), end;
            for (; it != end; ++it) {
                std::string item = trimCopy(it->str());
                if (!item.empty()) out.push_back({ tag, item });
            }
            if (out.empty()) return std::nullopt;
            return out;
        }
        return std::nullopt;
    }});

    // 4. Reminders: one qualifier (me, then on/at) is stripped
    rules_.push_back({ "reminder", [](const Input& in) -> std::optional<IntentSegments> {
        if (in.bare.find("remind") == std::string::npos) return std::nullopt;

        static const std::regex pattern(R"(remind(?:er)?(?: me\b)?(?: (?:on|at)\b)?\s*(.*))",
                                        std::regex::icase);
        std::smatch m;
        std::string arg;
        if (std::regex_search(in.original, m, pattern)) {
            arg = trimCopy(m[1].str());
        }
        if (arg.empty()) arg = in.original;
        return single(IntentTag::Reminder, arg);
    }});

    // 5. Real-time relevance keywords
    rules_.push_back({ "realtime_keyword", [this](const Input& in) -> std::optional<IntentSegments> {
        if (containsAny(in.tokens, vocab_.realtimeWords)) {
            return single(IntentTag::Realtime, in.original);
        }
        return std::nullopt;
    }});

    // 6. Entity queries: multi-word or capitalized subjects need live data
    rules_.push_back({ "entity_query", [](const Input& in) -> std::optional<IntentSegments> {
        static const std::regex patterns[] = {
            std::regex(R"(^(who|what) is (.+)$)", std::regex::icase),
            std::regex(R"(^(tell me about|information about) (.+)$)", std::regex::icase),
        };
        for (const auto& pat : patterns) {
            std::smatch m;
            if (!std::regex_match(in.bareCased, m, pat)) continue;

            auto words = splitWords(m[2].str());
            bool capitalized = std::any_of(words.begin(), words.end(), [](const std::string& w) {
                return !w.empty() && std::isupper(static_cast<unsigned char>(w[0]));
            });
            if (words.size() > 1 || capitalized) {
                return single(IntentTag::Realtime, in.original);
            }
            return single(IntentTag::General, in.original);
        }
        return std::nullopt;
    }});

    // 7. Date/time questions are answered conversationally
    rules_.push_back({ "datetime", [this](const Input& in) -> std::optional<IntentSegments> {
        if (containsAny(in.tokens, vocab_.dateTimeWords)) {
            return single(IntentTag::General, in.original);
        }
        return std::nullopt;
    }});
}

// ------------------------------------------------------------
// Classification
// ------------------------------------------------------------
IntentSegments NLP::classify(const std::string& utterance) const {
    std::string unused;
    return classify(utterance, unused);
}

IntentSegments NLP::classify(const std::string& utterance, std::string& ruleName) const {
    Input in = normalize(utterance);

    for (const auto& rule : rules_) {
        auto result = rule.apply(in);
        if (result && !result->empty()) {
            ruleName = rule.name;
            return *result;
        }
    }

    ruleName = "fallback";
    return single(IntentTag::General, in.original);
}
