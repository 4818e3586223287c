#include "intentional/path_manager.hpp"
#include "intentional/logger.hpp"
#include <cstdlib>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <cstring>
#include <unistd.h>

namespace intentional {

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

void PathManager::init(const std::string& rootOverride, const std::string& runtimeOverride) {
    rootDir_ = resolveRoot(rootOverride);
    runtimeDir_ = resolveRuntime(runtimeOverride);
    logsDir_ = rootDir_ / "logs";

    // One primary per OS user: lock and socket are keyed by uid
    const std::string uid = std::to_string(::getuid());
    lockFilePath_ = runtimeDir_ / ("intentional-" + uid + ".lock");
    socketPath_ = runtimeDir_ / ("intentional-native-messaging-" + uid + ".sock");

    markerPath_ = rootDir_ / "no-relaunch";
    strictPath_ = rootDir_ / "strict-mode";

    std::error_code ec;
    std::filesystem::create_directories(rootDir_, ec);
    std::filesystem::create_directories(logsDir_, ec);
    std::filesystem::create_directories(runtimeDir_, ec);
}

std::filesystem::path PathManager::sessionLog(const std::string& role) const {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << role << "_" << std::put_time(std::localtime(&in_time_t), "%Y%m%d_%H%M%S")
       << "_" << ::getpid() << ".log";
    return logsDir_ / ss.str();
}

std::filesystem::path PathManager::resolveRoot(const std::string& override) {
    if (!override.empty()) return std::filesystem::absolute(override);

    const char* envPath = std::getenv("INTENTIONAL_PATH");
    if (envPath && strlen(envPath) > 0) return std::filesystem::absolute(envPath);

    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && strlen(xdgDataHome) > 0) {
        return std::filesystem::absolute(xdgDataHome) / "intentional";
    }

    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";
    return std::filesystem::path(home) / ".local" / "share" / "intentional";
}

std::filesystem::path PathManager::resolveRuntime(const std::string& override) {
    if (!override.empty()) return std::filesystem::absolute(override);

    const char* xdgRuntime = std::getenv("XDG_RUNTIME_DIR");
    if (xdgRuntime && strlen(xdgRuntime) > 0) {
        return std::filesystem::path(xdgRuntime);
    }
    return std::filesystem::path("/tmp");
}

std::filesystem::path PathManager::selfExe() const {
    std::error_code ec;
    auto exe = std::filesystem::canonical("/proc/self/exe", ec);
    if (ec) return "";
    return exe;
}

bool PathManager::isLocalBuild() const {
    std::string exe = selfExe().string();
    // Common indicators of a local development build
    return (exe.find("/Projects/") != std::string::npos ||
            exe.find("/build/") != std::string::npos ||
            exe.find("/cmake-build-") != std::string::npos);
}

} // namespace intentional
