#include <filesystem>
#include <format>
#include <fstream>

#include <docarc/config.hpp>

#include <gtest/gtest.h>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    tempDir_ = fs::temp_directory_path() / "docarc_test_config";
    fs::create_directories(tempDir_);
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  fs::path writeConfig(const std::string &content) {
    fs::path path = tempDir_ / "docarc.ini";
    std::ofstream file(path);
    file << content;
    return path;
  }

  fs::path tempDir_;
};

TEST_F(ConfigTest, Defaults) {
  docarc::Config config;
  EXPECT_EQ(config.maxContentSize, 10u * 1024 * 1024);
  EXPECT_EQ(config.lockTimeout.count(), 5000);
  ASSERT_EQ(config.backupExtensions.size(), 2u);
  EXPECT_EQ(config.backupExtensions[0], ".json");
  EXPECT_EQ(config.backupExtensions[1], ".txt");
  EXPECT_EQ(config.backupMode, docarc::BackupMode::Copy);
}

TEST_F(ConfigTest, LoadAllSections) {
  auto path = writeConfig("# office settings\n"
                          "[archive]\n"
                          "max_content_size = 2048\n"
                          "\n"
                          "[lock]\n"
                          "timeout_ms = 250 ; quarter second\n"
                          "[backup]\n"
                          "extensions = .json, txt, .md\n"
                          "mode = archive\n"
                          "[log]\n"
                          "level = debug\n");

  docarc::Config config;
  std::string error;
  ASSERT_TRUE(docarc::loadConfig(path, config, &error)) << error;

  EXPECT_EQ(config.maxContentSize, 2048u);
  EXPECT_EQ(config.lockTimeout.count(), 250);
  ASSERT_EQ(config.backupExtensions.size(), 3u);
  EXPECT_EQ(config.backupExtensions[1], ".txt");
  EXPECT_EQ(config.backupExtensions[2], ".md");
  EXPECT_EQ(config.backupMode, docarc::BackupMode::Archive);
  EXPECT_EQ(config.logLevel, docarc::log::Level::Debug);
}

TEST_F(ConfigTest, UnknownKeysIgnored) {
  auto path = writeConfig("[clients]\nfile = clients.json\n[lock]\nretries = 3\n");

  docarc::Config config;
  std::string error;
  ASSERT_TRUE(docarc::loadConfig(path, config, &error)) << error;
  EXPECT_EQ(config.lockTimeout.count(), 5000);
}

TEST_F(ConfigTest, MissingFile) {
  docarc::Config config;
  std::string error;
  EXPECT_FALSE(docarc::loadConfig(tempDir_ / "missing.ini", config, &error));
  EXPECT_FALSE(error.empty());
}

TEST_F(ConfigTest, MalformedLineReportsLineNumber) {
  auto path = writeConfig("[archive]\nmax_content_size 100\n");

  docarc::Config config;
  std::string error;
  EXPECT_FALSE(docarc::loadConfig(path, config, &error));
  EXPECT_NE(error.find(":2:"), std::string::npos) << error;
}

TEST_F(ConfigTest, InvalidValueLeavesConfigUntouched) {
  auto path = writeConfig("[lock]\ntimeout_ms = 100\n[archive]\nmax_content_size = lots\n");

  docarc::Config config;
  std::string error;
  EXPECT_FALSE(docarc::loadConfig(path, config, &error));
  EXPECT_NE(error.find("max_content_size"), std::string::npos) << error;
  EXPECT_EQ(config.lockTimeout.count(), 5000);
}

TEST_F(ConfigTest, InvalidBackupMode) {
  auto path = writeConfig("[backup]\nmode = mirror\n");

  docarc::Config config;
  std::string error;
  EXPECT_FALSE(docarc::loadConfig(path, config, &error));
}

TEST_F(ConfigTest, RejectsOverflowingTimeout) {
  auto path = writeConfig("[lock]\ntimeout_ms = 10000000000000\n");

  docarc::Config config;
  std::string error;
  EXPECT_FALSE(docarc::loadConfig(path, config, &error));
  EXPECT_NE(error.find(":2:"), std::string::npos) << error;
  EXPECT_NE(error.find("timeout_ms"), std::string::npos) << error;
  EXPECT_EQ(config.lockTimeout.count(), 5000);
}

TEST_F(ConfigTest, AcceptsTimeoutAtLimit) {
  auto path = writeConfig(std::format("[lock]\ntimeout_ms = {}\n", docarc::maxLockTimeout.count()));

  docarc::Config config;
  std::string error;
  ASSERT_TRUE(docarc::loadConfig(path, config, &error)) << error;
  EXPECT_EQ(config.lockTimeout, docarc::maxLockTimeout);
}
