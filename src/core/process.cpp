#include "intentional/process.hpp"
#include "intentional/logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <poll.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace intentional {

bool Process::isAlive(int pid) {
    if (pid <= 0) return false;

    if (::kill(pid, 0) != 0 && errno != EPERM) {
        return false;
    }

    // A reaped-later child still answers signal 0
    auto state = procState(pid);
    if (state && (*state == 'Z' || *state == 'X')) {
        return false;
    }
    return true;
}

bool Process::kill(int pid, bool force) {
    return signal(pid, force ? SIGKILL : SIGTERM);
}

bool Process::signal(int pid, int sig) {
    if (pid <= 0) return false;
    return ::kill(pid, sig) == 0;
}

bool Process::spawnDetached(const std::string& exe, const std::vector<std::string>& args,
                            std::chrono::milliseconds timeout,
                            const std::vector<std::pair<std::string, std::string>>& env) {
    std::vector<std::string> finalArgs;
    finalArgs.push_back(exe);
    finalArgs.insert(finalArgs.end(), args.begin(), args.end());

    std::vector<char*> argv;
    for (const auto& s : finalArgs)
        argv.push_back(const_cast<char*>(s.c_str()));
    argv.push_back(nullptr);

    // The write end is close-on-exec: EOF without data means exec succeeded
    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) == -1) {
        LOG_ERROR("spawnDetached: pipe failed: " + std::string(strerror(errno)));
        return false;
    }

    pid_t pid = ::fork();
    if (pid == -1) {
        LOG_ERROR("spawnDetached: fork failed: " + std::string(strerror(errno)));
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return false;
    }

    if (pid == 0) {
        ::close(pipefd[0]);
        ::setsid();

        pid_t grandchild = ::fork();
        if (grandchild != 0) {
            _exit(grandchild == -1 ? 1 : 0);
        }

        int devNull = ::open("/dev/null", O_RDWR);
        if (devNull != -1) {
            ::dup2(devNull, STDIN_FILENO);
            ::dup2(devNull, STDOUT_FILENO);
            ::dup2(devNull, STDERR_FILENO);
            if (devNull > STDERR_FILENO) ::close(devNull);
        }

        ::signal(SIGPIPE, SIG_DFL);
        for (const auto& [key, val] : env) {
            ::setenv(key.c_str(), val.c_str(), 1);
        }

        ::execv(exe.c_str(), argv.data());

        int err = errno;
        ssize_t ignored = ::write(pipefd[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    ::close(pipefd[1]);

    int status = 0;
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        LOG_ERROR("spawnDetached: intermediate fork failed for " + exe);
        ::close(pipefd[0]);
        return false;
    }

    pollfd pfd{};
    pfd.fd = pipefd[0];
    pfd.events = POLLIN;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool launched = false;
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            LOG_ERROR("spawnDetached: " + exe + " did not report within " +
                      std::to_string(timeout.count()) + "ms");
            break;
        }

        int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("spawnDetached: poll failed: " + std::string(strerror(errno)));
            break;
        }
        if (rc == 0) continue;

        int err = 0;
        ssize_t n = ::read(pipefd[0], &err, sizeof(err));
        if (n == 0) {
            launched = true;
        } else if (n > 0) {
            LOG_ERROR("spawnDetached: exec " + exe + " failed: " + std::string(strerror(err)));
        } else if (errno == EINTR) {
            continue;
        }
        break;
    }

    ::close(pipefd[0]);
    return launched;
}

std::optional<char> Process::procState(int pid) {
    std::ifstream ifs(std::filesystem::path("/proc") / std::to_string(pid) / "stat");
    if (!ifs) return std::nullopt;

    std::string line;
    std::getline(ifs, line);
    // comm may contain spaces and parentheses: the state follows the last ')'
    auto pos = line.rfind(')');
    if (pos == std::string::npos || pos + 2 >= line.size()) return std::nullopt;
    return line[pos + 2];
}

std::optional<int> Process::parentPid(int pid) {
    std::ifstream ifs(std::filesystem::path("/proc") / std::to_string(pid) / "stat");
    if (!ifs) return std::nullopt;

    std::string line;
    std::getline(ifs, line);
    auto pos = line.rfind(')');
    if (pos == std::string::npos) return std::nullopt;

    std::istringstream rest(line.substr(pos + 1));
    char state;
    int ppid;
    if (!(rest >> state >> ppid)) return std::nullopt;
    return ppid;
}

std::optional<std::string> Process::commandName(int pid) {
    std::ifstream ifs(std::filesystem::path("/proc") / std::to_string(pid) / "comm");
    if (!ifs) return std::nullopt;

    std::string name;
    std::getline(ifs, name);
    if (name.empty()) return std::nullopt;
    return name;
}

int Process::tracerPid() {
    std::ifstream ifs("/proc/self/status");
    std::string line;
    while (std::getline(ifs, line)) {
        if (line.rfind("TracerPid:", 0) == 0) {
            try {
                return std::stoi(line.substr(10));
            } catch (const std::exception&) {
                return 0;
            }
        }
    }
    return 0;
}

} // namespace intentional
