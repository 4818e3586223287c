#ifndef INTENTIONAL_PATH_MANAGER_HPP
#define INTENTIONAL_PATH_MANAGER_HPP

#include <string>
#include <filesystem>

namespace intentional {

class PathManager {
public:
    static PathManager& instance();

    // Initializes paths based on optional overrides.
    // Root: INTENTIONAL_PATH env, then XDG_DATA_HOME, then ~/.local/share.
    // Runtime: XDG_RUNTIME_DIR, then /tmp.
    void init(const std::string& rootOverride = "", const std::string& runtimeOverride = "");

    std::filesystem::path root() const { return rootDir_; }
    std::filesystem::path logs() const { return logsDir_; }
    std::filesystem::path runtime() const { return runtimeDir_; }
    std::filesystem::path configFile() const { return rootDir_ / "config.json"; }

    // Cross-process coordination files
    std::filesystem::path lockFile() const { return lockFilePath_; }
    std::filesystem::path socketFile() const { return socketPath_; }
    std::filesystem::path noRelaunchMarker() const { return markerPath_; }
    std::filesystem::path strictModeFlag() const { return strictPath_; }

    // Returns the path to a fresh session log for the given role
    std::filesystem::path sessionLog(const std::string& role) const;

    // Returns the absolute path to the running executable
    std::filesystem::path selfExe() const;

    // Returns true if running from a local development path
    bool isLocalBuild() const;

private:
    PathManager() = default;

    std::filesystem::path rootDir_;
    std::filesystem::path logsDir_;
    std::filesystem::path runtimeDir_;
    std::filesystem::path lockFilePath_;
    std::filesystem::path socketPath_;
    std::filesystem::path markerPath_;
    std::filesystem::path strictPath_;

    std::filesystem::path resolveRoot(const std::string& override);
    std::filesystem::path resolveRuntime(const std::string& override);
};

} // namespace intentional

#endif // INTENTIONAL_PATH_MANAGER_HPP
