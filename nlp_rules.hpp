#pragma once
#include <string>
#include "nlp.hpp"

// Load a classifier vocabulary from a JSON file:
//   { "exit": [...], "realtime": [...], "datetime": [...] }
// - Never throws; missing arrays keep the built-in defaults.
// - Returns false (and leaves 'out' untouched) when the file is
//   missing or not a JSON object.
bool loadNlpVocabulary(const std::string& path, NlpVocabulary& out, std::string* err = nullptr);

// Same as above, from an in-memory JSON string
bool loadNlpVocabularyFromString(const std::string& text, NlpVocabulary& out, std::string* err = nullptr);
