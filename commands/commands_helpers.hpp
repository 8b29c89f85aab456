#pragma once
#include <string>

// Trim whitespace from both ends
std::string trim(const std::string& s);

// ASCII lower-case copy
std::string toLower(std::string s);

// Percent-encode for a URL query value (unreserved characters kept)
std::string urlEncode(const std::string& s);

// YouTube-style query: spaces become '+', everything else percent-encoded
std::string plusEncode(const std::string& s);

// Edit distance (insert / delete / substitute, each cost 1)
size_t levenshtein(const std::string& a, const std::string& b);

// Search result page URLs
std::string googleSearchUrl(const std::string& query);
std::string youtubeSearchUrl(const std::string& query);   // home page when query is empty
