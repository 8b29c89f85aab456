#pragma once
#include <string>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>

// ------------------------------------------------------------
// Aliases API (app_aliases.json)
// ------------------------------------------------------------
// Maps spoken names ("browser", "code") to launch targets
// ("firefox", "/usr/bin/code"). File layout:
//   { "user": { "<alias>": "<target>", ... } }
// A flat object of alias → target is accepted as well.
//
// Lookup order: exact (case-insensitive) → fuzzy (edit
// distance <= 2, closest wins, ties go to the first key in
// sorted order). Returns "" when nothing matches.
//
// 🔹 Thread-safety: all public APIs are thread-safe.
// ------------------------------------------------------------

namespace aliases {

    // Load from file. A missing file is created empty; an
    // unparseable one is logged and leaves the table empty.
    void load(const std::filesystem::path& file);

    // Replace the table from JSON (same layout as the file)
    void loadFromJson(const nlohmann::json& j);

    void clear();

    std::string resolve(const std::string& key);

    // Exact (case-insensitive) match only; used where a near miss
    // must not pick another app (close)
    std::string resolveExact(const std::string& key);

    // Max edit distance for the fuzzy pass
    inline constexpr size_t kFuzzyDistance = 2;

} // namespace aliases
