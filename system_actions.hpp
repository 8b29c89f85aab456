#pragma once
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json_fwd.hpp>

// ------------------------------------------------------------
// OS-action capability. Success means "issued", not "achieved":
// implementations return false only when the action could not
// be started at all.
// ------------------------------------------------------------
class SystemActions {
public:
    virtual ~SystemActions() = default;

    virtual bool openTarget(const std::string& target) = 0;     // app name, alias or URL
    virtual bool closeTarget(const std::string& target) = 0;
    virtual bool openUrl(const std::string& url) = 0;

    // Known commands run; unknown ones are acknowledged (true)
    virtual bool runSystemCommand(const std::string& command) = 0;
};

// "https://x", "www.x", "x.com" → true
bool looksLikeUrl(const std::string& target);

// Prepend https:// when no scheme is present
std::string normalizeUrl(const std::string& target);

// pkill -f pattern for "close": an exact alias target, else the name itself
std::string closePattern(const std::string& target);

// ------------------------------------------------------------
// PosixSystemActions: xdg-open / open, pkill, argv tables
// ------------------------------------------------------------
class PosixSystemActions : public SystemActions {
public:
    // systemCommands: { "<name>": ["argv0", "arg", ...], ... }
    explicit PosixSystemActions(const nlohmann::json& systemCommands);

    bool openTarget(const std::string& target) override;
    bool closeTarget(const std::string& target) override;
    bool openUrl(const std::string& url) override;
    bool runSystemCommand(const std::string& command) override;

    bool hasSystemCommand(const std::string& command) const;

private:
    std::string opener() const;   // xdg-open on Linux, open on macOS

    std::map<std::string, std::vector<std::string>> systemCommands_;
};
