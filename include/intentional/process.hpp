#ifndef INTENTIONAL_PROCESS_HPP
#define INTENTIONAL_PROCESS_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace intentional {

class Process {
public:
    // Non-destructive liveness probe (signal 0). Zombies count as dead.
    static bool isAlive(int pid);

    // Delivers SIGTERM (or SIGKILL when force is set)
    static bool kill(int pid, bool force = false);

    // Delivers an arbitrary signal
    static bool signal(int pid, int sig);

    // Launches exe as an independent process: double fork + setsid, stdio on
    // /dev/null. The launcher is never its parent, so killing the launcher
    // cannot take the new process down with it. Returns true once exec has
    // succeeded, false on exec failure or when `timeout` elapses first.
    static bool spawnDetached(const std::string& exe, const std::vector<std::string>& args,
                              std::chrono::milliseconds timeout,
                              const std::vector<std::pair<std::string, std::string>>& env = {});

    // /proc helpers
    static std::optional<int> parentPid(int pid);
    static std::optional<std::string> commandName(int pid);

    // Pid of an attached tracer (debugger), 0 when not traced
    static int tracerPid();

private:
    static std::optional<char> procState(int pid);
};

} // namespace intentional

#endif // INTENTIONAL_PROCESS_HPP
