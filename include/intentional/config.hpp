#ifndef INTENTIONAL_CONFIG_HPP
#define INTENTIONAL_CONFIG_HPP

#include <filesystem>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace intentional {

struct GeneralConfig {
  // Cleared by a clean user quit so a reconnecting extension cannot undo it
  bool autoLaunch = true;
};

// Bounded retry policy for the relay. Values are clamped on load.
struct RelayConfig {
  int connectAttempts = 15;
  int connectDelayMs = 500;
  int launchWaitMs = 5000;
};

struct ExtensionConfig {
  std::vector<std::string> chromeIds;
  std::vector<std::string> firefoxIds;
};

namespace Defaults {
inline const std::map<std::string, int> Budgets = {
    {"youtube", 30}, {"instagram", 30}, {"facebook", 30}};
} // namespace Defaults

class Config {
public:
  static Config &instance();

  void load(const std::filesystem::path &configPath);
  void save();

  // Re-reads only the general section. Relays and the primary run in
  // different processes, so flags are re-read right before they matter.
  void reloadGeneral();

  // Getters
  GeneralConfig &getGeneral() { return general_; }
  RelayConfig &getRelay() { return relay_; }
  ExtensionConfig &getExtensions() { return extensions_; }
  std::map<std::string, int> &getBudgets() { return budgets_; }

  void setAutoLaunch(bool enabled);

  // Registers an extension id and saves. False if it was already known.
  bool addExtensionId(const std::string &id, bool firefox);
  std::recursive_mutex &getMutex() { return mutex_; }

  // Restores defaults without touching the file (used by tests)
  void reset();

  // Forbidden
  Config(const Config &) = delete;
  Config &operator=(const Config &) = delete;

private:
  Config() = default;
  ~Config() = default;

  std::filesystem::path configPath_;
  GeneralConfig general_;
  RelayConfig relay_;
  ExtensionConfig extensions_;
  std::map<std::string, int> budgets_ = Defaults::Budgets;

  std::recursive_mutex mutex_;

  void parse(const nlohmann::json &j);
};

} // namespace intentional

#endif // INTENTIONAL_CONFIG_HPP
