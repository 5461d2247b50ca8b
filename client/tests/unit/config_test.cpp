#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include "cord/config.hpp"

namespace {

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { ClearEnv(); }
  void TearDown() override {
    ClearEnv();
    if (!path_.empty()) {
      std::remove(path_.c_str());
    }
  }

  static void ClearEnv() {
    for (const char* key : {"CORD_TOKEN", "CORD_PREFIX", "CORD_LOG_LEVEL", "CORD_HEARTBEAT_MISS_LIMIT",
                            "CORD_RECONNECT_BASE_MS", "CORD_RECONNECT_MAX_MS"}) {
      unsetenv(key);
    }
  }

  std::string WriteFile(const std::string& contents) {
    path_ = ::testing::TempDir() + "cord_config_test.json";
    std::ofstream out(path_);
    out << contents;
    return path_;
  }

  std::string path_;
};

TEST_F(ConfigTest, EnvWithoutTokenIsRejected) { EXPECT_THROW(cord::LoadConfigFromEnv(), std::invalid_argument); }

TEST_F(ConfigTest, EnvProvidesValuesAndDefaults) {
  setenv("CORD_TOKEN", "env-token", 1);
  setenv("CORD_HEARTBEAT_MISS_LIMIT", "3", 1);
  auto cfg = cord::LoadConfigFromEnv();
  EXPECT_EQ(cfg.token, "env-token");
  EXPECT_EQ(cfg.heartbeat_miss_limit, 3u);
  EXPECT_EQ(cfg.prefix, "!");
  EXPECT_EQ(cfg.api_base, "/api/v9");
  EXPECT_EQ(cfg.member_fetch_timeout, std::chrono::seconds(15));
}

TEST_F(ConfigTest, InvalidValuesAreRejected) {
  setenv("CORD_TOKEN", "env-token", 1);
  setenv("CORD_HEARTBEAT_MISS_LIMIT", "0", 1);
  EXPECT_THROW(cord::LoadConfigFromEnv(), std::invalid_argument);

  setenv("CORD_HEARTBEAT_MISS_LIMIT", "2", 1);
  setenv("CORD_RECONNECT_BASE_MS", "5000", 1);
  setenv("CORD_RECONNECT_MAX_MS", "1000", 1);
  EXPECT_THROW(cord::LoadConfigFromEnv(), std::invalid_argument);
}

TEST_F(ConfigTest, FileValuesAreOverriddenByEnv) {
  auto path = WriteFile(R"({"token": "file-token", "prefix": "?", "log_level": "debug", "reconnect_base_ms": 250})");
  auto from_file = cord::LoadConfigFromFile(path);
  EXPECT_EQ(from_file.token, "file-token");
  EXPECT_EQ(from_file.prefix, "?");
  EXPECT_EQ(from_file.log_level, "debug");
  EXPECT_EQ(from_file.reconnect_base_delay, std::chrono::milliseconds(250));

  setenv("CORD_PREFIX", "$", 1);
  auto overridden = cord::LoadConfigFromFile(path);
  EXPECT_EQ(overridden.prefix, "$");
  EXPECT_EQ(overridden.token, "file-token");
}

TEST_F(ConfigTest, MissingFileThrows) {
  EXPECT_THROW(cord::LoadConfigFromFile(::testing::TempDir() + "does_not_exist.json"), std::runtime_error);
}

}  // namespace
