#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>

#include "../include/configmanager.hpp"
#include "../include/errors.hpp"

namespace fs = std::filesystem;

class ConfigManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    path_ = fs::temp_directory_path() /
            ("tornet_config_" + std::to_string(getpid()) + ".json");
    ConfigManager::instance().initialize();
  }
  void TearDown() override {
    fs::remove(path_);
    ConfigManager::instance().initialize();
  }

  void writeConfig(const std::string& text) { std::ofstream(path_) << text; }

  fs::path path_;
};

TEST_F(ConfigManagerTest, DefaultsProduceExpectedSettings) {
  const ToolSettings s = ConfigManager::instance().settings();
  EXPECT_EQ(s.serviceName, "tor");
  EXPECT_EQ(s.systemdMarker, "/run/systemd/system");
  EXPECT_EQ(s.relayProcessName, "tor");
  EXPECT_EQ(s.relayBinary, "tor");
  EXPECT_EQ(s.proxyUrl(), "socks5h://127.0.0.1:9050");
  EXPECT_EQ(s.probe.proxyUrl, "socks5h://127.0.0.1:9050");
  EXPECT_EQ(s.probe.ipEchoUrl, "https://api.ipify.org");
  EXPECT_EQ(s.probe.connectivityUrl, "http://www.google.com");
  EXPECT_EQ(s.probe.directTimeout, std::chrono::seconds(10));
  EXPECT_EQ(s.probe.proxyTimeout, std::chrono::seconds(15));
  EXPECT_EQ(s.probe.connectivityTimeout, std::chrono::seconds(5));
  EXPECT_EQ(s.bootstrapGrace, std::chrono::seconds(6));
  EXPECT_EQ(s.startupWait, std::chrono::seconds(5));
  EXPECT_EQ(s.rotationSettle, std::chrono::seconds(2));
  EXPECT_EQ(s.torrcCandidates.size(), 4u);
  EXPECT_EQ(s.torrcCandidates.front(), "/etc/tor/torrc");
  EXPECT_EQ(s.toolName, "tornet");
  ASSERT_EQ(s.logging.size(), 1u);
  EXPECT_EQ(s.logging[0].type, "console");
  EXPECT_EQ(s.logging[0].level, "info");
}

TEST_F(ConfigManagerTest, UserFileIsMergedOverDefaults) {
  writeConfig(R"({
    "proxy": {"port": 9150},
    "timing": {"bootstrap_grace_sec": 12},
    "logging": [{"type": "sync_file", "level": "debug", "file": "/tmp/t.log"}]
  })");
  ConfigManager::instance().initialize(path_.string());

  const ToolSettings s = ConfigManager::instance().settings();
  EXPECT_EQ(s.proxyHost, "127.0.0.1");
  EXPECT_EQ(s.proxyPort, 9150);
  EXPECT_EQ(s.bootstrapGrace, std::chrono::seconds(12));
  EXPECT_EQ(s.startupWait, std::chrono::seconds(5));
  ASSERT_EQ(s.logging.size(), 1u);
  EXPECT_EQ(s.logging[0].type, "sync_file");
  EXPECT_EQ(s.logging[0].file, "/tmp/t.log");
}

TEST_F(ConfigManagerTest, CliOverridesParseJsonValues) {
  ConfigManager::instance().applyCliOverrides(
      {{"proxy.port", "9150"},
       {"service.name", "tor@default"},
       {"torrc.candidates", R"(["/opt/torrc"])"}});

  const ToolSettings s = ConfigManager::instance().settings();
  EXPECT_EQ(s.proxyPort, 9150);
  EXPECT_EQ(s.serviceName, "tor@default");
  EXPECT_EQ(s.torrcCandidates, (std::vector<std::string>{"/opt/torrc"}));
}

TEST_F(ConfigManagerTest, InvalidOverrideKeepsPreviousConfig) {
  EXPECT_THROW(ConfigManager::instance().applyCliOverrides(
                   {{"proxy.port", "not-a-number"}}),
               UsageError);
  EXPECT_THROW(
      ConfigManager::instance().applyCliOverrides({{"proxy.port", "70000"}}),
      UsageError);
  EXPECT_THROW(
      ConfigManager::instance().applyCliOverrides({{"proxy..port", "1"}}),
      UsageError);
  EXPECT_EQ(ConfigManager::instance().settings().proxyPort, 9050);
}

TEST_F(ConfigManagerTest, BrokenFilesAreUsageErrors) {
  writeConfig("{ not json");
  EXPECT_THROW(ConfigManager::instance().initialize(path_.string()),
               UsageError);

  writeConfig(R"({"logging": [{"type": "async_file"}]})");
  EXPECT_THROW(ConfigManager::instance().initialize(path_.string()),
               UsageError);

  writeConfig(R"({"probe": {"proxy_timeout_sec": 0}})");
  EXPECT_THROW(ConfigManager::instance().initialize(path_.string()),
               UsageError);

  EXPECT_THROW(
      ConfigManager::instance().initialize(std::string("/nonexistent.json")),
      UsageError);
}

TEST(ConfigValidatorTest, AcceptsDefaults) {
  ConfigValidator validator;
  EXPECT_TRUE(validator.validateRoot(ConfigManager::defaultConfig()));
}

TEST(ConfigValidatorTest, RejectsRemovedSection) {
  auto config = ConfigManager::defaultConfig();
  config.erase("relay");
  ConfigValidator validator;
  EXPECT_THROW(validator.validateRoot(config), std::runtime_error);
}

TEST(ConfigLoaderTest, RejectsNonObjectRoot) {
  ConfigLoader loader;
  EXPECT_THROW(loader.loadFromString("[1, 2]"), std::runtime_error);
  EXPECT_EQ(loader.loadFromString(R"({"a": 1})").at("a"), 1);
}
