#include "test_util.hpp"

#include "intentional/manifest_installer.hpp"

#include <nlohmann/json.hpp>

using namespace intentional;
using namespace intentional::test;
using json = nlohmann::json;

namespace {

const std::string kChromeId = "abcdefghijklmnopabcdefghijklmnop";
const std::string kFirefoxId = "extension@intentional.social";

class ManifestInstallerTest : public ::testing::Test {
protected:
  TempDir home;
  ManifestInstaller installer{home.path(), "/opt/intentional/bin/intentional"};

  void installBrowser(const std::filesystem::path &base) {
    std::filesystem::create_directories(base);
  }

  json readManifest(const std::filesystem::path &dir) {
    return json::parse(readFile(dir / "com.intentional.social.json"));
  }
};

} // namespace

TEST(ManifestIds, ChromeIdFormat) {
  EXPECT_TRUE(ManifestInstaller::validChromeId(kChromeId));
  EXPECT_FALSE(ManifestInstaller::validChromeId("abcdefghijklmnopabcdefghijklmno"));
  EXPECT_FALSE(ManifestInstaller::validChromeId("zbcdefghijklmnopabcdefghijklmnop"));
  EXPECT_FALSE(ManifestInstaller::validChromeId("ABCDEFGHIJKLMNOPABCDEFGHIJKLMNOP"));
  EXPECT_FALSE(ManifestInstaller::validChromeId(""));
}

TEST(ManifestIds, FirefoxIdFormat) {
  EXPECT_TRUE(ManifestInstaller::validFirefoxId(kFirefoxId));
  EXPECT_TRUE(ManifestInstaller::validFirefoxId(
      "{d3b07384-d9a0-4c9b-8f4e-1a2b3c4d5e6f}"));
  EXPECT_FALSE(ManifestInstaller::validFirefoxId(kChromeId));
}

TEST_F(ManifestInstallerTest, OnlyInstalledBrowsersAreListed) {
  EXPECT_TRUE(installer.installedBrowsers().empty());

  installBrowser(home / ".config/chromium");
  installBrowser(home / ".mozilla");
  auto installed = installer.installedBrowsers();
  ASSERT_EQ(installed.size(), 2u);
  EXPECT_EQ(installed[0].name, "Chromium");
  EXPECT_TRUE(installed[1].firefox);
}

TEST_F(ManifestInstallerTest, ChromiumManifestContent) {
  installBrowser(home / ".config/google-chrome");
  ExtensionConfig ext;
  ext.chromeIds = {kChromeId};

  EXPECT_EQ(installer.install(ext), 1);
  json manifest =
      readManifest(home / ".config/google-chrome/NativeMessagingHosts");
  EXPECT_EQ(manifest["name"], "com.intentional.social");
  EXPECT_EQ(manifest["path"], "/opt/intentional/bin/intentional");
  EXPECT_EQ(manifest["type"], "stdio");
  ASSERT_EQ(manifest["allowed_origins"].size(), 1u);
  EXPECT_EQ(manifest["allowed_origins"][0],
            "chrome-extension://" + kChromeId + "/");
  EXPECT_FALSE(manifest.contains("allowed_extensions"));
}

TEST_F(ManifestInstallerTest, FirefoxManifestContent) {
  installBrowser(home / ".mozilla");
  ExtensionConfig ext;
  ext.firefoxIds = {kFirefoxId};

  EXPECT_EQ(installer.install(ext), 1);
  json manifest = readManifest(home / ".mozilla/native-messaging-hosts");
  EXPECT_EQ(manifest["allowed_extensions"], json::array({kFirefoxId}));
  EXPECT_FALSE(manifest.contains("allowed_origins"));
}

TEST_F(ManifestInstallerTest, InstallSkipsBrowsersWithoutIds) {
  installBrowser(home / ".config/BraveSoftware/Brave-Browser");
  installBrowser(home / ".mozilla");
  ExtensionConfig ext;
  ext.chromeIds = {kChromeId};

  EXPECT_EQ(installer.install(ext), 1);
  EXPECT_TRUE(std::filesystem::exists(
      home / ".config/BraveSoftware/Brave-Browser/NativeMessagingHosts/"
             "com.intentional.social.json"));
  EXPECT_FALSE(std::filesystem::exists(home / ".mozilla/native-messaging-hosts"));
  // Browsers that are not installed get nothing
  EXPECT_FALSE(std::filesystem::exists(home / ".config/google-chrome"));
}

TEST_F(ManifestInstallerTest, RemoveDeletesEveryManifest) {
  installBrowser(home / ".config/vivaldi");
  installBrowser(home / ".config/opera");
  installBrowser(home / ".mozilla");
  ExtensionConfig ext;
  ext.chromeIds = {kChromeId};
  ext.firefoxIds = {kFirefoxId};

  ASSERT_EQ(installer.install(ext), 3);
  EXPECT_EQ(installer.remove(), 3);
  EXPECT_EQ(installer.remove(), 0);
  EXPECT_TRUE(std::filesystem::is_directory(home / ".config/vivaldi"));
}
