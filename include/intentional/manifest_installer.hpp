#ifndef INTENTIONAL_MANIFEST_INSTALLER_HPP
#define INTENTIONAL_MANIFEST_INSTALLER_HPP

#include "intentional/config.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace intentional {

struct BrowserHost {
  std::string name;
  std::filesystem::path base;     // exists when the browser is installed
  std::filesystem::path hostsDir; // NativeMessagingHosts directory
  bool firefox = false;
};

// Writes the per-user native messaging host manifest for every installed
// browser.
class ManifestInstaller {
public:
  ManifestInstaller(std::filesystem::path home, std::filesystem::path exe);

  static bool validChromeId(const std::string &id);
  static bool validFirefoxId(const std::string &id);
  static std::string manifestFileName();

  std::vector<BrowserHost> knownBrowsers() const;
  std::vector<BrowserHost> installedBrowsers() const;

  nlohmann::json chromiumManifest(const std::vector<std::string> &ids) const;
  nlohmann::json firefoxManifest(const std::vector<std::string> &ids) const;

  // Returns the number of manifests written
  int install(const ExtensionConfig &extensions) const;

  // Returns the number of manifests removed
  int remove() const;

private:
  std::filesystem::path home_;
  std::filesystem::path exe_;

  bool writeManifest(const std::filesystem::path &dir,
                     const nlohmann::json &manifest) const;
};

} // namespace intentional

#endif // INTENTIONAL_MANIFEST_INSTALLER_HPP
