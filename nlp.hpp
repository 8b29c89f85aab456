#pragma once
#include <string>
#include <vector>
#include <regex>
#include <optional>
#include <functional>
#include "intent.hpp"

// ------------------------------------------------------------
// Keyword vocabularies used by the rule table
// ------------------------------------------------------------
struct NlpVocabulary {
    std::vector<std::string> exitWords;       // whole-token match
    std::vector<std::string> realtimeWords;   // whole-word phrase match
    std::vector<std::string> dateTimeWords;   // whole-word phrase match

    static NlpVocabulary defaults();
};

// ------------------------------------------------------------
// Rule-based intent classifier
//
// classify() is pure and total: no I/O, no hidden state, and it
// always returns at least one segment (General + whole utterance).
// ------------------------------------------------------------
class NLP {
public:
    // Normalized views of one utterance, computed once per classify()
    struct Input {
        std::string original;   // trimmed, original casing/punctuation
        std::string lowered;    // lowercased original
        std::string bare;       // lowercased, punctuation stripped
        std::string bareCased;  // punctuation stripped, casing kept
        std::vector<std::string> tokens; // whitespace split of bare
    };

    struct Rule {
        std::string name;   // e.g. "exit", "batch_action"
        std::function<std::optional<IntentSegments>(const Input&)> apply;
    };

    NLP();
    explicit NLP(NlpVocabulary vocab);

    // Rules capture 'this'; copies rebuild their own table
    NLP(const NLP& other) : NLP(other.vocab_) {}
    NLP& operator=(const NLP&) = delete;

    IntentSegments classify(const std::string& utterance) const;

    // Same as classify(), also reports which rule fired
    IntentSegments classify(const std::string& utterance, std::string& ruleName) const;

    const NlpVocabulary& vocabulary() const { return vocab_; }
    const std::vector<Rule>& rules() const { return rules_; }
    size_t rule_count() const { return rules_.size(); }

    static Input normalize(const std::string& utterance);

private:
    void buildRules();

    NlpVocabulary vocab_;
    std::vector<Rule> rules_;
};
