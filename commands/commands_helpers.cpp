#include "commands_helpers.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

// ------------------------------------------------------------
// Trim whitespace from both ends
// ------------------------------------------------------------
std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    auto end   = s.find_last_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    return s.substr(start, end - start + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// ------------------------------------------------------------
// URL encoding
// ------------------------------------------------------------
static void appendEscaped(std::string& out, unsigned char c) {
    static const char hex[] = "0123456789ABCDEF";
    out += '%';
    out += hex[c >> 4];
    out += hex[c & 0x0F];
}

static bool isUnreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

std::string urlEncode(const std::string& s) {
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (isUnreserved(c)) out += static_cast<char>(c);
        else appendEscaped(out, c);
    }
    return out;
}

std::string plusEncode(const std::string& s) {
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (c == ' ') out += '+';
        else if (isUnreserved(c)) out += static_cast<char>(c);
        else appendEscaped(out, c);
    }
    return out;
}

// ------------------------------------------------------------
// Edit distance (two-row DP)
// ------------------------------------------------------------
size_t levenshtein(const std::string& a, const std::string& b) {
    std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;

    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            cur[j] = std::min({ prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost });
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

// ------------------------------------------------------------
// Search URLs
// ------------------------------------------------------------
std::string googleSearchUrl(const std::string& query) {
    return "https://www.google.com/search?q=" + urlEncode(query);
}

std::string youtubeSearchUrl(const std::string& query) {
    std::string q = trim(query);
    if (q.empty()) return "https://www.youtube.com/";
    return "https://www.youtube.com/results?search_query=" + plusEncode(q);
}
