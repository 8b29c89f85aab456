#include "voice_synth.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <chrono>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace Voice {

    // =========================================================
    // Helpers
    // =========================================================
    static std::string replaceAll(std::string s, const std::string& from, const std::string& to) {
        size_t pos = 0;
        while ((pos = s.find(from, pos)) != std::string::npos) {
            s.replace(pos, from.size(), to);
            pos += to.size();
        }
        return s;
    }

    static void requireArtifact(const fs::path& out) {
        std::error_code ec;
        if (!fs::exists(out, ec) || fs::file_size(out, ec) == 0) {
            throw SynthesisError("No audio written to " + out.string());
        }
    }

    // =========================================================
    // CommandSynthesizer
    // =========================================================
    CommandSynthesizer::CommandSynthesizer(std::vector<std::string> argvTemplate)
        : argvTemplate_(std::move(argvTemplate)) {}

    std::vector<std::string> CommandSynthesizer::expand(const std::string& text,
                                                        const fs::path& out) const {
        std::vector<std::string> argv;
        argv.reserve(argvTemplate_.size());
        for (const auto& a : argvTemplate_) {
            argv.push_back(replaceAll(replaceAll(a, "{out}", out.string()), "{text}", text));
        }
        return argv;
    }

    void CommandSynthesizer::synthesize(const std::string& text, const fs::path& out) {
        if (argvTemplate_.empty()) throw SynthesisError("No synthesis command configured");

        auto argv = expand(text, out);
        LOG_TRACE("Voice/Synth", "Running " + argv[0] + " → " + out.filename().string());

        int rc = runProcess(argv);
        if (rc != 0) {
            throw SynthesisError(argv[0] + " exited with " + std::to_string(rc));
        }
        requireArtifact(out);
    }

    // =========================================================
    // BridgeSynthesizer
    // =========================================================
    BridgeSynthesizer::BridgeSynthesizer(std::vector<std::string> command,
                                         std::string speaker,
                                         double speed,
                                         int timeoutMs)
        : command_(std::move(command)),
          speaker_(std::move(speaker)),
          speed_(speed),
          timeoutMs_(timeoutMs) {}

    BridgeSynthesizer::~BridgeSynthesizer() {
        stop();
    }

    std::string BridgeSynthesizer::readJsonLine(int timeoutMs) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);

        while (true) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) return "";

            std::string line;
            if (!bridge_.readLine(line, static_cast<int>(left))) {
                LOG_ERROR("Voice/Bridge", "Read failed: " + bridge_.lastError());
                return "";
            }
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!line.empty() && line[0] == '{') return line;

            // Model loaders print progress on stdout
            if (!line.empty()) LOG_DEBUG("Voice/Bridge", "Skipped non-JSON: " + line);
        }
    }

    bool BridgeSynthesizer::start() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ready_) return true;

        if (!bridge_.start(command_)) {
            LOG_ERROR("Voice/Bridge", "Could not start bridge: " + bridge_.lastError());
            LOG_PHASE("Voice bridge start", false);
            return false;
        }

        std::string response = readJsonLine(timeoutMs_);
        auto resp = json::parse(response, nullptr, false);
        if (resp.is_discarded() || !resp.is_object() || resp.value("status", "") != "ready") {
            LOG_ERROR("Voice/Bridge", "Handshake failed, raw=" + response);
            LOG_PHASE("Voice bridge start", false);
            bridge_.stop();
            return false;
        }

        ready_ = true;
        LOG_PHASE("Voice bridge ready", true);
        return true;
    }

    void BridgeSynthesizer::stop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (bridge_.running()) {
            if (!bridge_.writeLine(R"({"command":"exit"})")) {
                LOG_DEBUG("Voice/Bridge", "Exit request not delivered: " + bridge_.lastError());
            }
            bridge_.stop();
            LOG_PHASE("Voice bridge stopped", true);
        }
        ready_ = false;
    }

    void BridgeSynthesizer::synthesize(const std::string& text, const fs::path& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ready_) throw SynthesisError("TTS bridge not running");

        json req = {
            {"command", "speak"},
            {"text", text},
            {"speaker", speaker_},
            {"speed", speed_},
            {"out", out.string()}
        };
        if (!bridge_.writeLine(req.dump())) {
            ready_ = false;
            throw SynthesisError("Bridge write failed: " + bridge_.lastError());
        }

        std::string response = readJsonLine(timeoutMs_);
        auto resp = json::parse(response, nullptr, false);
        if (resp.is_discarded() || !resp.is_object()) {
            throw SynthesisError("Bad bridge response: " + response);
        }
        if (resp.contains("error")) {
            throw SynthesisError("Bridge error: " + resp["error"].dump());
        }
        if (!resp.contains("file") || !resp["file"].is_string()) {
            throw SynthesisError("Bridge response without file: " + response);
        }

        fs::path produced = resp["file"].get<std::string>();
        if (produced != out) {
            // Bridge picked its own name; move it under ours
            std::error_code ec;
            fs::rename(produced, out, ec);
            if (ec) {
                fs::remove(produced, ec);
                throw SynthesisError("Could not move bridge output to " + out.string());
            }
        }
        LOG_DEBUG("Voice/Coqui", "Bridge wrote " + out.filename().string());
        requireArtifact(out);
    }

    // =========================================================
    // Factory
    // =========================================================
    static std::vector<std::string> stringArray(const json& j) {
        std::vector<std::string> out;
        if (!j.is_array()) return out;
        for (const auto& v : j) {
            if (v.is_string()) out.push_back(v.get<std::string>());
        }
        return out;
    }

    std::unique_ptr<Synthesizer> createSynthesizer(const json& voiceCfg) {
        std::string engine = voiceCfg.value("engine", "command");

        if (engine == "command") {
            auto argv = stringArray(voiceCfg.value("command", json::array()));
            if (argv.empty()) argv = { "espeak-ng", "-w", "{out}", "{text}" };

            if (findExecutable(argv[0]).empty()) {
                LOG_ERROR("Voice", "Synthesis command not found: " + argv[0]);
                LOG_PHASE("Voice synthesizer", false);
                return nullptr;
            }
            LOG_PHASE("Voice synthesizer (command)", true);
            return std::make_unique<CommandSynthesizer>(std::move(argv));
        }

        if (engine == "coqui") {
            json coqui = voiceCfg.value("coqui", json::object());
            auto argv = stringArray(coqui.value("bridge", json::array()));
            if (argv.empty()) argv = { "python3", "-u", "coqui_bridge.py", "--persistent" };

            auto bridge = std::make_unique<BridgeSynthesizer>(
                std::move(argv),
                coqui.value("speaker", "p225"),
                voiceCfg.value("speed", 1.0),
                coqui.value("timeout_ms", 30000));
            if (!bridge->start()) return nullptr;
            return bridge;
        }

        LOG_ERROR("Voice", "Unknown voice engine: " + engine);
        LOG_PHASE("Voice synthesizer", false);
        return nullptr;
    }

} // namespace Voice
