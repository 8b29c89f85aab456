#pragma once

#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>

// Undefine Windows ERROR macro if it leaks in
#ifdef ERROR
#undef ERROR
#endif

#include "commands/commands_core.hpp"

// ------------------------------------------------------------
// Capability failures (thrown by external collaborators,
// caught at the dispatcher / speech controller boundary)
// ------------------------------------------------------------
class ServiceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class IoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SynthesisError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class PlaybackError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ------------------------------------------------------------
// ErrorManager: error-code catalog (errors.json)
// ------------------------------------------------------------
namespace ErrorManager {
    // Replace the catalog (object of code → {user, debug}).
    // A top-level "errors" object is unwrapped.
    void load(const nlohmann::json& catalog);

    // Load the catalog from a file; keeps the current one on failure
    bool loadFile(const std::string& path);

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // Log the debug message and build a failed CommandResult
    CommandResult report(const std::string& code, const std::string& detail = "");

    // Built-in catalog used until a file is loaded
    nlohmann::json defaults();
}
