#include "intentional/manifest_installer.hpp"
#include "intentional/launch_classifier.hpp"
#include "intentional/logger.hpp"
#include "intentional/version.hpp"

#include <fstream>
#include <regex>

namespace intentional {

namespace {
const char *kDescription =
    "Intentional - Cross-browser time tracking and accountability";
}

ManifestInstaller::ManifestInstaller(std::filesystem::path home,
                                     std::filesystem::path exe)
    : home_(std::move(home)), exe_(std::move(exe)) {}

bool ManifestInstaller::validChromeId(const std::string &id) {
  static const std::regex chromeId("^[a-p]{32}$");
  return std::regex_match(id, chromeId);
}

bool ManifestInstaller::validFirefoxId(const std::string &id) {
  return LaunchClassifier::isFirefoxAddonId(id);
}

std::string ManifestInstaller::manifestFileName() {
  return NATIVE_HOST_NAME + ".json";
}

std::vector<BrowserHost> ManifestInstaller::knownBrowsers() const {
  const auto config = home_ / ".config";
  std::vector<BrowserHost> browsers = {
      {"Google Chrome", config / "google-chrome", {}, false},
      {"Chromium", config / "chromium", {}, false},
      {"Brave", config / "BraveSoftware" / "Brave-Browser", {}, false},
      {"Microsoft Edge", config / "microsoft-edge", {}, false},
      {"Vivaldi", config / "vivaldi", {}, false},
      {"Opera", config / "opera", {}, false},
  };
  for (auto &b : browsers)
    b.hostsDir = b.base / "NativeMessagingHosts";

  browsers.push_back({"Firefox", home_ / ".mozilla",
                      home_ / ".mozilla" / "native-messaging-hosts", true});
  return browsers;
}

std::vector<BrowserHost> ManifestInstaller::installedBrowsers() const {
  std::vector<BrowserHost> installed;
  std::error_code ec;
  for (const auto &b : knownBrowsers()) {
    if (std::filesystem::is_directory(b.base, ec))
      installed.push_back(b);
  }
  return installed;
}

nlohmann::json
ManifestInstaller::chromiumManifest(const std::vector<std::string> &ids) const {
  nlohmann::json origins = nlohmann::json::array();
  for (const auto &id : ids)
    origins.push_back("chrome-extension://" + id + "/");

  return {{"name", NATIVE_HOST_NAME},
          {"description", kDescription},
          {"path", exe_.string()},
          {"type", "stdio"},
          {"allowed_origins", origins}};
}

nlohmann::json
ManifestInstaller::firefoxManifest(const std::vector<std::string> &ids) const {
  return {{"name", NATIVE_HOST_NAME},
          {"description", kDescription},
          {"path", exe_.string()},
          {"type", "stdio"},
          {"allowed_extensions", ids}};
}

bool ManifestInstaller::writeManifest(const std::filesystem::path &dir,
                                      const nlohmann::json &manifest) const {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    LOG_ERROR("Failed to create " + dir.string() + ": " + ec.message());
    return false;
  }

  auto path = dir / manifestFileName();
  std::ofstream file(path);
  if (!file) {
    LOG_ERROR("Failed to write manifest " + path.string());
    return false;
  }
  file << manifest.dump(2) << "\n";
  LOG_INFO("Installed native messaging manifest at " + path.string());
  return true;
}

int ManifestInstaller::install(const ExtensionConfig &extensions) const {
  int written = 0;
  for (const auto &browser : installedBrowsers()) {
    const auto &ids = browser.firefox ? extensions.firefoxIds
                                      : extensions.chromeIds;
    if (ids.empty())
      continue;

    auto manifest =
        browser.firefox ? firefoxManifest(ids) : chromiumManifest(ids);
    if (writeManifest(browser.hostsDir, manifest))
      ++written;
  }

  if (written == 0) {
    LOG_WARN("No manifest written: no installed browser matches the "
             "registered extension ids");
  }
  return written;
}

int ManifestInstaller::remove() const {
  int removed = 0;
  for (const auto &browser : knownBrowsers()) {
    std::error_code ec;
    auto path = browser.hostsDir / manifestFileName();
    if (std::filesystem::remove(path, ec)) {
      LOG_INFO("Removed " + path.string());
      ++removed;
    } else if (ec) {
      LOG_WARN("Failed to remove " + path.string() + ": " + ec.message());
    }
  }
  return removed;
}

} // namespace intentional
