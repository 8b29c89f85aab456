#include "chat_log.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <fstream>

namespace fs = std::filesystem;

JsonTranscriptStore::JsonTranscriptStore(fs::path path)
    : path_(std::move(path)) {}

// =========================================================
// Load
// =========================================================
ChatTranscript JsonTranscriptStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;

    if (!fs::exists(path_, ec) || fs::file_size(path_, ec) == 0) {
        if (path_.has_parent_path()) fs::create_directories(path_.parent_path(), ec);
        std::ofstream(path_) << "[]\n";
        LOG_DEBUG("ChatLog", "Created empty transcript: " + path_.string());
        return {};
    }

    std::ifstream in(path_);
    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.is_array()) {
        LOG_ERROR("ChatLog", "Failed to parse " + path_.string() + ", starting empty");
        LOG_PHASE("Transcript load", false);
        return {};
    }

    ChatTranscript out;
    out.reserve(j.size());
    for (const auto& m : j) {
        if (!m.is_object()) continue;
        out.push_back({ m.value("role", ""), m.value("content", "") });
    }
    return out;
}

// =========================================================
// Save
// =========================================================
void JsonTranscriptStore::save(const ChatTranscript& transcript) {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json j = nlohmann::json::array();
    for (const auto& m : transcript) {
        j.push_back({ {"role", m.role}, {"content", m.content} });
    }

    std::error_code ec;
    if (path_.has_parent_path()) fs::create_directories(path_.parent_path(), ec);

    std::ofstream out(path_, std::ios::trunc);
    if (!out) {
        throw IoError("Cannot write transcript: " + path_.string());
    }
    out << j.dump(4);
    if (!out) {
        throw IoError("Short write on transcript: " + path_.string());
    }
}
