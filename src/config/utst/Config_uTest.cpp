/**
 * @file Config_uTest.cpp
 * @brief Unit tests for pfrelay::config parsing and validation.
 */

#include "src/config/inc/Config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

using pfrelay::config::Config;
using pfrelay::config::DEFAULT_LOG_LEVEL;
using pfrelay::config::DEFAULT_POLLING_INTERVAL_MS;
using pfrelay::config::loadConfigFile;
using pfrelay::config::parseConfig;

namespace fs = std::filesystem;

/* ----------------------------- Valid Documents ----------------------------- */

/** @test Interfaces only; other fields take defaults. */
TEST(ConfigTest, Defaults) {
  Config cfg{};
  std::string error;

  ASSERT_TRUE(parseConfig("interfaces:\n  - ens1f0\n  - ens1f1\n", cfg, error)) << error;
  ASSERT_EQ(cfg.interfaces.size(), 2U);
  EXPECT_EQ(cfg.interfaces[0], "ens1f0");
  EXPECT_EQ(cfg.interfaces[1], "ens1f1");
  EXPECT_EQ(cfg.pollingIntervalMs, DEFAULT_POLLING_INTERVAL_MS);
  EXPECT_EQ(cfg.logLevel, DEFAULT_LOG_LEVEL);
}

/** @test All fields set. */
TEST(ConfigTest, AllFields) {
  Config cfg{};
  std::string error;

  ASSERT_TRUE(parseConfig("interfaces: [eth0]\npollingInterval: 250\nlogLevel: debug\n", cfg,
                          error))
      << error;
  EXPECT_EQ(cfg.interfaces.size(), 1U);
  EXPECT_EQ(cfg.pollingIntervalMs, 250);
  EXPECT_EQ(cfg.logLevel, "debug");
}

/** @test toString lists every field. */
TEST(ConfigTest, ToString) {
  Config cfg{};
  cfg.interfaces = {"eth0", "eth1"};
  cfg.pollingIntervalMs = 500;

  const std::string OUT = cfg.toString();
  EXPECT_NE(OUT.find("eth0,eth1"), std::string::npos);
  EXPECT_NE(OUT.find("500ms"), std::string::npos);
  EXPECT_NE(OUT.find("logLevel=info"), std::string::npos);
}

/* ----------------------------- Invalid Documents ----------------------------- */

/** @test Missing interfaces key. */
TEST(ConfigTest, MissingInterfaces) {
  Config cfg{};
  std::string error;

  EXPECT_FALSE(parseConfig("pollingInterval: 1000\n", cfg, error));
  EXPECT_EQ(error, "no interfaces found");
}

/** @test Empty interfaces list. */
TEST(ConfigTest, EmptyInterfaces) {
  Config cfg{};
  std::string error;

  EXPECT_FALSE(parseConfig("interfaces: []\n", cfg, error));
  EXPECT_EQ(error, "no interfaces found");
}

/** @test Interfaces must be a list of strings. */
TEST(ConfigTest, InterfacesNotList) {
  Config cfg{};
  std::string error;

  EXPECT_FALSE(parseConfig("interfaces: eth0\n", cfg, error));
  EXPECT_FALSE(parseConfig("interfaces:\n  - {name: eth0}\n", cfg, error));
}

/** @test Zero and negative intervals are rejected. */
TEST(ConfigTest, NonPositiveInterval) {
  Config cfg{};
  std::string error;

  EXPECT_FALSE(parseConfig("interfaces: [eth0]\npollingInterval: 0\n", cfg, error));
  EXPECT_EQ(error, "invalid polling interval");
  EXPECT_FALSE(parseConfig("interfaces: [eth0]\npollingInterval: -5\n", cfg, error));
}

/** @test A non-integer interval is a conversion error. */
TEST(ConfigTest, NonIntegerInterval) {
  Config cfg{};
  std::string error;

  EXPECT_FALSE(parseConfig("interfaces: [eth0]\npollingInterval: fast\n", cfg, error));
  EXPECT_EQ(error.rfind("failed to unmarshal config", 0), 0U) << error;
}

/** @test Unknown log level is rejected. */
TEST(ConfigTest, BadLogLevel) {
  Config cfg{};
  std::string error;

  EXPECT_FALSE(parseConfig("interfaces: [eth0]\nlogLevel: verbose\n", cfg, error));
  EXPECT_EQ(error, "invalid log level 'verbose'");
}

/** @test Malformed YAML is reported, not thrown. */
TEST(ConfigTest, MalformedYaml) {
  Config cfg{};
  std::string error;

  EXPECT_FALSE(parseConfig("interfaces: [eth0\n", cfg, error));
  EXPECT_EQ(error.rfind("failed to unmarshal config", 0), 0U) << error;
}

/** @test A scalar document is not a mapping. */
TEST(ConfigTest, NotAMapping) {
  Config cfg{};
  std::string error;

  EXPECT_FALSE(parseConfig("just text\n", cfg, error));
  EXPECT_EQ(error, "configuration must be a mapping");
}

/** @test Output is untouched on failure. */
TEST(ConfigTest, OutputUntouchedOnFailure) {
  Config cfg{};
  cfg.interfaces = {"keep"};
  std::string error;

  EXPECT_FALSE(parseConfig("interfaces: [eth0]\npollingInterval: 0\n", cfg, error));
  ASSERT_EQ(cfg.interfaces.size(), 1U);
  EXPECT_EQ(cfg.interfaces[0], "keep");
}

/* ----------------------------- File Loading ----------------------------- */

/** @test Missing file is an error naming the path. */
TEST(ConfigTest, LoadMissingFile) {
  Config cfg{};
  std::string error;

  EXPECT_FALSE(loadConfigFile("/nonexistent/pf-status-relay.yaml", cfg, error));
  EXPECT_NE(error.find("/nonexistent/pf-status-relay.yaml"), std::string::npos);
}

/** @test A valid file loads. */
TEST(ConfigTest, LoadFile) {
  const fs::path PATH = fs::temp_directory_path() / "pfrelay-config-uTest.yaml";
  {
    std::ofstream out(PATH);
    out << "interfaces:\n  - eth0\npollingInterval: 100\n";
  }

  Config cfg{};
  std::string error;
  EXPECT_TRUE(loadConfigFile(PATH.string(), cfg, error)) << error;
  EXPECT_EQ(cfg.pollingIntervalMs, 100);

  std::remove(PATH.c_str());
}
