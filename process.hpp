#pragma once
#include <string>
#include <vector>
#include <sys/types.h>

// ------------------------------------------------------------
// Child processes (fork/exec, no shell)
// ------------------------------------------------------------

// Full path of an executable on PATH, or "" when not found.
// Names containing '/' are checked as given.
std::string findExecutable(const std::string& name);

// Run argv and wait. Returns the exit status, or -1 when the
// process could not be started or did not exit normally.
int runProcess(const std::vector<std::string>& argv);

// Start argv fully detached (double fork, reaped immediately).
// Returns false only when the fork itself failed.
bool launchDetached(const std::vector<std::string>& argv);

// ------------------------------------------------------------
// ChildProcess: long-lived child with line-oriented stdin/stdout
// ------------------------------------------------------------
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    bool start(const std::vector<std::string>& argv);
    void stop();
    bool running() const { return pid_ > 0; }

    bool writeLine(const std::string& line);

    // Blocks up to timeoutMs for one complete line (without '\n').
    // Returns false on timeout, EOF or read error.
    bool readLine(std::string& line, int timeoutMs);

    const std::string& lastError() const { return lastError_; }

private:
    pid_t pid_ = -1;
    int stdinFd_ = -1;
    int stdoutFd_ = -1;
    std::string buffer_;
    std::string lastError_;
};
