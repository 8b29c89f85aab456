#pragma once
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>
#include "process.hpp"

namespace Voice {

    // =========================================================
    // Synthesizer: text → audio file at 'out'.
    // Throws SynthesisError on failure.
    // =========================================================
    class Synthesizer {
    public:
        virtual ~Synthesizer() = default;
        virtual void synthesize(const std::string& text, const std::filesystem::path& out) = 0;
    };

    // =========================================================
    // CommandSynthesizer: one process per request, no shell.
    // argv elements may contain {out} and {text} placeholders,
    // e.g. ["espeak-ng", "-w", "{out}", "{text}"].
    // =========================================================
    class CommandSynthesizer : public Synthesizer {
    public:
        explicit CommandSynthesizer(std::vector<std::string> argvTemplate);

        void synthesize(const std::string& text, const std::filesystem::path& out) override;

        // Placeholder expansion (exposed for tests)
        std::vector<std::string> expand(const std::string& text,
                                        const std::filesystem::path& out) const;

    private:
        std::vector<std::string> argvTemplate_;
    };

    // =========================================================
    // BridgeSynthesizer: persistent TTS process speaking
    // newline-delimited JSON on stdin/stdout.
    //   → {"command":"speak","text":..,"speaker":..,"speed":..,"out":..}
    //   ← {"file": "<path>"}  or  {"error": "<reason>"}
    // The process announces itself with {"status":"ready"}.
    // =========================================================
    class BridgeSynthesizer : public Synthesizer {
    public:
        BridgeSynthesizer(std::vector<std::string> command,
                          std::string speaker,
                          double speed,
                          int timeoutMs = 30000);
        ~BridgeSynthesizer() override;

        bool start();      // spawn + handshake
        void stop();       // {"command":"exit"} then terminate

        void synthesize(const std::string& text, const std::filesystem::path& out) override;

    private:
        std::string readJsonLine(int timeoutMs);

        std::vector<std::string> command_;
        std::string speaker_;
        double speed_;
        int timeoutMs_;

        ChildProcess bridge_;
        bool ready_ = false;
        std::mutex mutex_;
    };

    // Build from the "voice" config section ("engine": "command" | "coqui").
    // Returns nullptr when the engine is unknown or cannot start.
    std::unique_ptr<Synthesizer> createSynthesizer(const nlohmann::json& voiceCfg);

} // namespace Voice
