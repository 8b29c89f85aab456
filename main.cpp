#include "pch.hpp"
#include "commands/commands_core.hpp"
#include "device_setups/audio_devices.hpp"
#include "response_manager.hpp"
#include "bootstrap.hpp"
#include "session.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

struct CliOptions {
    fs::path configPath;
    std::optional<InputMode> mode;
    bool listDevices = false;
    bool noSpeech = false;
};

static void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  --config <file>          config file (default ./aria_config.json)\n"
              << "  --mode text|voice|both   input mode for this run\n"
              << "  --no-speech              disable spoken replies\n"
              << "  --list-devices           list audio input devices and exit\n"
              << "  --help                   show this text\n";
}

// Returns false on bad arguments
static bool parseArgs(int argc, char* argv[], CliOptions& opts, bool& wantHelp) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            wantHelp = true;
        } else if (arg == "--config" && i + 1 < argc) {
            opts.configPath = argv[++i];
        } else if (arg == "--mode" && i + 1 < argc) {
            opts.mode = parseInputMode(argv[++i]);
            if (!opts.mode) {
                std::cerr << "Unknown mode: " << argv[i] << "\n";
                return false;
            }
        } else if (arg == "--no-speech") {
            opts.noSpeech = true;
        } else if (arg == "--list-devices") {
            opts.listDevices = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

// ============================================================
// Main entry point
// ============================================================
int main(int argc, char* argv[]) {
    CliOptions cli;
    bool wantHelp = false;
    if (!parseArgs(argc, argv, cli, wantHelp)) {
        printUsage(argv[0]);
        return 2;
    }
    if (wantHelp) {
        printUsage(argv[0]);
        return 0;
    }
    if (cli.listDevices) {
        return printInputDevices(std::cout) ? 0 : 1;
    }

    // Initialize logger (writes to aria.log + console)
    initLogger("aria.log");
    LOG_PHASE("Startup begin", true);

    // ============================================================
    // Bootstrap configuration and services
    // ============================================================
    BootstrapOptions boot;
    boot.configPath = cli.configPath;
    boot.speech = !cli.noSpeech;

    // Voice input is only loaded when the chosen mode needs it
    if (cli.mode) boot.voiceInput = (*cli.mode != InputMode::Text);

    Services services = runBootstrapChecks(boot);

    SessionConfig sessionCfg = SessionConfig::fromJson(services.config);
    if (cli.mode) sessionCfg.mode = *cli.mode;

    // ============================================================
    // Classifier + dispatcher
    // ============================================================
    NLP nlp(services.vocab);
    LOG_DEBUG("NLP", "Rules loaded: " + std::to_string(nlp.rule_count()));

    ActionDispatcher dispatcher(services.capabilities());
    registerDefaultCommands(dispatcher);
    LOG_PHASE("Dispatcher ready", true);

    // 🔹 Startup greeting
    std::string greeting = ResponseManager::get("startup");
    std::cout << sessionCfg.assistantName << ": " << greeting << "\n";
    if (services.speech) services.speech->speakAsync(greeting);

    LOG_PHASE("Startup complete, entering main loop", true);

    // ============================================================
    // Session loop
    // ============================================================
    LOG_PHASE("SIGINT handler", Session::installSignalHandlers());
    Session session(nlp, dispatcher, sessionCfg, std::cin, std::cout, services.voiceInput.get());
    size_t handled = session.run();
    LOG_DEBUG("Session", "Utterances handled: " + std::to_string(handled));

    // ============================================================
    // Shutdown
    // ============================================================
    if (services.speech) services.speech->shutdown();
    LOG_PHASE("Shutdown complete", true);
    shutdownLogger();
    return 0;
}
