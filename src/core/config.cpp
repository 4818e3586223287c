#include "intentional/config.hpp"
#include "intentional/logger.hpp"
#include <algorithm>
#include <fstream>

namespace intentional {

using json = nlohmann::json;

Config &Config::instance() {
  static Config instance;
  return instance;
}

void Config::reset() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  configPath_.clear();
  general_ = GeneralConfig{};
  relay_ = RelayConfig{};
  extensions_ = ExtensionConfig{};
  budgets_ = Defaults::Budgets;
}

void Config::load(const std::filesystem::path &path) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  configPath_ = path;

  if (!std::filesystem::exists(path)) {
    LOG_WARN("Config file not found at " + path.string() + ". Using defaults.");
    save();
    return;
  }

  try {
    std::ifstream file(path);
    json j;
    file >> j;
    parse(j);
    LOG_INFO("Configuration loaded from " + path.string());
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to parse config file: " + std::string(e.what()));
  }
}

void Config::parse(const json &j) {
  if (j.contains("general")) {
    auto &g = j["general"];
    general_.autoLaunch = g.value("auto_launch", true);
  }

  if (j.contains("relay")) {
    auto &r = j["relay"];
    relay_.connectAttempts =
        std::clamp(r.value("connect_attempts", 15), 1, 100);
    relay_.connectDelayMs =
        std::clamp(r.value("connect_delay_ms", 500), 50, 5000);
    relay_.launchWaitMs =
        std::clamp(r.value("launch_wait_ms", 5000), 500, 30000);
  }

  if (j.contains("budgets") && j["budgets"].is_object()) {
    budgets_.clear();
    for (auto &[key, val] : j["budgets"].items()) {
      if (val.is_number_integer()) {
        budgets_[key] = val.get<int>();
      }
    }
  }

  if (j.contains("extensions")) {
    auto &e = j["extensions"];
    extensions_.chromeIds =
        e.value("ids", std::vector<std::string>{});
    extensions_.firefoxIds =
        e.value("firefox_ids", std::vector<std::string>{});
  }
}

void Config::reloadGeneral() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (configPath_.empty() || !std::filesystem::exists(configPath_))
    return;

  try {
    std::ifstream file(configPath_);
    json j;
    file >> j;
    if (j.contains("general")) {
      general_.autoLaunch = j["general"].value("auto_launch", true);
    }
  } catch (const std::exception &e) {
    LOG_WARN("Failed to re-read config: " + std::string(e.what()));
  }
}

void Config::save() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (configPath_.empty())
    return;

  std::error_code ec;
  if (configPath_.has_parent_path()) {
    std::filesystem::create_directories(configPath_.parent_path(), ec);
  }

  json j;
  j["general"] = {{"auto_launch", general_.autoLaunch}};
  j["relay"] = {{"connect_attempts", relay_.connectAttempts},
                {"connect_delay_ms", relay_.connectDelayMs},
                {"launch_wait_ms", relay_.launchWaitMs}};

  j["budgets"] = json::object();
  for (const auto &[key, val] : budgets_) {
    j["budgets"][key] = val;
  }

  j["extensions"] = {{"ids", extensions_.chromeIds},
                     {"firefox_ids", extensions_.firefoxIds}};

  // Write-then-rename so a concurrently starting relay never reads a
  // truncated file
  std::filesystem::path tmp = configPath_;
  tmp += ".tmp";
  {
    std::ofstream file(tmp);
    if (!file) {
      LOG_ERROR("Failed to write config file: " + tmp.string());
      return;
    }
    file << j.dump(4);
  }
  std::filesystem::rename(tmp, configPath_, ec);
  if (ec) {
    LOG_ERROR("Failed to replace config file: " + ec.message());
    return;
  }
  LOG_DEBUG("Configuration saved to " + configPath_.string());
}

void Config::setAutoLaunch(bool enabled) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  general_.autoLaunch = enabled;
  save();
}

bool Config::addExtensionId(const std::string &id, bool firefox) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  auto &ids = firefox ? extensions_.firefoxIds : extensions_.chromeIds;
  if (std::find(ids.begin(), ids.end(), id) != ids.end())
    return false;
  ids.push_back(id);
  save();
  return true;
}

} // namespace intentional
