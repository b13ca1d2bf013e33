#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "config.hpp"

namespace {

namespace fs = std::filesystem;

constexpr const char *kSha1 = "0123456789abcdef0123456789ABCDEF01234567";

class ConfigTest : public ::testing::Test {
protected:
  std::string write_config(const std::string &yaml) {
    const fs::path path =
        fs::path(::testing::TempDir()) /
        ("mbf_link_" +
         std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) +
         ".yaml");
    std::ofstream out(path);
    out << yaml;
    written.push_back(path);
    return path.string();
  }

  void TearDown() override {
    for (const auto &p : written) {
      fs::remove(p);
    }
  }

  std::vector<fs::path> written;
};

void expect_config_error(const std::string &path, const std::string &needle) {
  try {
    mbf_link::load_config(path);
    FAIL() << "expected a config error containing " << needle;
  } catch (const std::runtime_error &e) {
    const std::string what = e.what();
    EXPECT_EQ(what.rfind("[CONFIG]", 0), 0u) << what;
    EXPECT_NE(what.find(needle), std::string::npos) << what;
  }
}

TEST_F(ConfigTest, FullConfig) {
  const auto path = write_config(std::string(R"(
device:
  serial: 2G0YC1ZF9J0123
  adb_path: /opt/platform-tools/adb
agent:
  remote_path: /data/local/tmp/agent-test
  url: https://example.invalid/mbf-agent
  sha1: )") + kSha1 + R"(
  cache_dir: cache
uploads_dir: /sdcard/uploads
core_mod_override_url: https://example.invalid/core_mods.json
)");

  const mbf_link::LinkConfig config = mbf_link::load_config(path);
  ASSERT_TRUE(config.device.serial.has_value());
  EXPECT_EQ(*config.device.serial, "2G0YC1ZF9J0123");
  EXPECT_EQ(config.device.adb_path, "/opt/platform-tools/adb");
  EXPECT_EQ(config.agent.remote_path, "/data/local/tmp/agent-test");
  EXPECT_EQ(config.agent.sha1, kSha1);
  EXPECT_EQ(config.uploads_dir, "/sdcard/uploads");
  ASSERT_TRUE(config.core_mod_override_url.has_value());

  ASSERT_TRUE(config.agent.cache_dir.has_value());
  const fs::path expected_cache =
      (fs::path(config.config_file_path).parent_path() / "cache").lexically_normal();
  EXPECT_EQ(*config.agent.cache_dir, expected_cache.string());
}

TEST_F(ConfigTest, DefaultsForOmittedKeys) {
  const auto path = write_config(std::string(R"(
agent:
  url: https://example.invalid/mbf-agent
  sha1: )") + kSha1 + "\n");

  const mbf_link::LinkConfig config = mbf_link::load_config(path);
  EXPECT_FALSE(config.device.serial.has_value());
  EXPECT_EQ(config.device.adb_path, "adb");
  EXPECT_EQ(config.agent.remote_path, "/data/local/tmp/mbf-agent");
  EXPECT_EQ(config.uploads_dir, "/data/local/tmp/mbf-uploads");
  EXPECT_FALSE(config.core_mod_override_url.has_value());
  EXPECT_FALSE(config.agent.cache_dir.has_value());
}

TEST_F(ConfigTest, RejectsShortSha1) {
  expect_config_error(write_config(R"(
agent:
  url: https://example.invalid/mbf-agent
  sha1: abc123
)"),
                      "agent.sha1");
}

TEST_F(ConfigTest, RejectsUnknownTopLevelKey) {
  expect_config_error(write_config(std::string(R"(
agent:
  url: https://example.invalid/mbf-agent
  sha1: )") + kSha1 + "\nsimulation: {}\n"),
                      "simulation");
}

TEST_F(ConfigTest, RejectsNonMapSection) {
  expect_config_error(write_config("device: usb\n"), "'device' section must be a map");
}

TEST_F(ConfigTest, RejectsRelativeRemotePath) {
  expect_config_error(write_config(std::string(R"(
agent:
  remote_path: mbf-agent
  url: https://example.invalid/mbf-agent
  sha1: )") + kSha1 + "\n"),
                      "agent.remote_path");
}

TEST_F(ConfigTest, MissingFileIsAnError) {
  EXPECT_THROW(mbf_link::load_config("/nonexistent/mbf-link.yaml"),
               std::runtime_error);
}

TEST(ValidateConfig, RequiresAgentUrl) {
  mbf_link::LinkConfig config;
  config.agent.sha1 = kSha1;
  EXPECT_THROW(mbf_link::validate_config(config), std::runtime_error);
  config.agent.url = "https://example.invalid/mbf-agent";
  EXPECT_NO_THROW(mbf_link::validate_config(config));
}

TEST(ValidateConfig, RejectsNonHexSha1) {
  mbf_link::LinkConfig config;
  config.agent.url = "https://example.invalid/mbf-agent";
  config.agent.sha1 = std::string(39, 'A') + "G";
  EXPECT_THROW(mbf_link::validate_config(config), std::runtime_error);
  config.agent.sha1 = std::string(40, 'a');
  EXPECT_NO_THROW(mbf_link::validate_config(config));
}

} // namespace
