#include "process.hpp"
#include "logger.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
static std::vector<char*> toArgv(const std::vector<std::string>& argv) {
    std::vector<char*> out;
    out.reserve(argv.size() + 1);
    for (const auto& a : argv) out.push_back(const_cast<char*>(a.c_str()));
    out.push_back(nullptr);
    return out;
}

std::string findExecutable(const std::string& name) {
    if (name.empty()) return "";
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0 ? name : "";
    }

    const char* path = std::getenv("PATH");
    if (!path) return "";

    std::istringstream dirs(path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (::access(candidate.c_str(), X_OK) == 0) return candidate;
    }
    return "";
}

// ------------------------------------------------------------
// Run and wait
// ------------------------------------------------------------
int runProcess(const std::vector<std::string>& argv) {
    if (argv.empty()) return -1;
    auto args = toArgv(argv);

    pid_t pid = ::fork();
    if (pid < 0) {
        LOG_ERROR("Process", std::string("fork() failed: ") + std::strerror(errno));
        return -1;
    }
    if (pid == 0) {
        ::execvp(args[0], args.data());
        _exit(127);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    if (!WIFEXITED(status)) return -1;

    int code = WEXITSTATUS(status);
    if (code == 127) {
        LOG_DEBUG("Process", "exec failed for " + argv[0]);
        return -1;
    }
    return code;
}

// ------------------------------------------------------------
// Fire and forget
// ------------------------------------------------------------
bool launchDetached(const std::vector<std::string>& argv) {
    if (argv.empty()) return false;
    auto args = toArgv(argv);

    pid_t pid = ::fork();
    if (pid < 0) {
        LOG_ERROR("Process", std::string("fork() failed: ") + std::strerror(errno));
        return false;
    }
    if (pid == 0) {
        // Intermediate child: detach the grandchild and exit at once
        ::setsid();
        pid_t grandchild = ::fork();
        if (grandchild == 0) {
            int devnull = ::open("/dev/null", O_RDWR);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
                ::dup2(devnull, STDOUT_FILENO);
                ::dup2(devnull, STDERR_FILENO);
                if (devnull > STDERR_FILENO) ::close(devnull);
            }
            ::execvp(args[0], args.data());
            _exit(127);
        }
        _exit(grandchild < 0 ? 1 : 0);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) break;
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

// ------------------------------------------------------------
// ChildProcess
// ------------------------------------------------------------
ChildProcess::~ChildProcess() {
    stop();
}

bool ChildProcess::start(const std::vector<std::string>& argv) {
    if (running()) return true;
    if (argv.empty()) {
        lastError_ = "empty command";
        return false;
    }

    int stdinPipe[2];
    int stdoutPipe[2];
    if (::pipe(stdinPipe) < 0) {
        lastError_ = std::string("pipe() failed: ") + std::strerror(errno);
        return false;
    }
    if (::pipe(stdoutPipe) < 0) {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        lastError_ = std::string("pipe() failed: ") + std::strerror(errno);
        return false;
    }

    auto args = toArgv(argv);
    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(stdinPipe[0]);  ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]); ::close(stdoutPipe[1]);
        lastError_ = std::string("fork() failed: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        ::dup2(stdinPipe[0], STDIN_FILENO);
        ::dup2(stdoutPipe[1], STDOUT_FILENO);
        ::close(stdinPipe[0]);  ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]); ::close(stdoutPipe[1]);
        ::execvp(args[0], args.data());
        _exit(127);
    }

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);
    pid_ = pid;
    stdinFd_ = stdinPipe[1];
    stdoutFd_ = stdoutPipe[0];
    buffer_.clear();

    // Writes to a dead child must fail with EPIPE, not kill us
    std::signal(SIGPIPE, SIG_IGN);

    LOG_DEBUG("Process", "Started " + argv[0] + " (pid " + std::to_string(pid) + ")");
    return true;
}

void ChildProcess::stop() {
    if (stdinFd_ >= 0)  { ::close(stdinFd_);  stdinFd_ = -1; }
    if (stdoutFd_ >= 0) { ::close(stdoutFd_); stdoutFd_ = -1; }

    if (pid_ > 0) {
        ::kill(pid_, SIGTERM);

        int status = 0;
        int attempts = 10;
        while (attempts-- > 0) {
            if (::waitpid(pid_, &status, WNOHANG) != 0) { pid_ = -1; break; }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (pid_ > 0) {
            ::kill(pid_, SIGKILL);
            ::waitpid(pid_, &status, 0);
            pid_ = -1;
        }
    }
    buffer_.clear();
}

bool ChildProcess::writeLine(const std::string& line) {
    if (stdinFd_ < 0) {
        lastError_ = "not running";
        return false;
    }
    std::string data = line + "\n";
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(stdinFd_, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            lastError_ = std::string("write() failed: ") + std::strerror(errno);
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

bool ChildProcess::readLine(std::string& line, int timeoutMs) {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::milliseconds(timeoutMs);

    while (true) {
        auto nl = buffer_.find('\n');
        if (nl != std::string::npos) {
            line = buffer_.substr(0, nl);
            buffer_.erase(0, nl + 1);
            return true;
        }
        if (stdoutFd_ < 0) {
            lastError_ = "not running";
            return false;
        }

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
        if (left <= 0) {
            lastError_ = "timed out";
            return false;
        }

        pollfd pfd{ stdoutFd_, POLLIN, 0 };
        int rc = ::poll(&pfd, 1, static_cast<int>(left));
        if (rc < 0) {
            if (errno == EINTR) continue;
            lastError_ = std::string("poll() failed: ") + std::strerror(errno);
            return false;
        }
        if (rc == 0) continue;

        char chunk[4096];
        ssize_t n = ::read(stdoutFd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            lastError_ = std::string("read() failed: ") + std::strerror(errno);
            return false;
        }
        if (n == 0) {
            lastError_ = "child closed stdout";
            return false;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}
