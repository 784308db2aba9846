// =============================================================================
// engine_config_test.cpp
// =============================================================================
// Unit tests for matchcore::EngineConfig loading (configFromJson and
// loadConfig): defaults, partial overrides, and every rejection path.
// =============================================================================

#include "matchcore/config/engine_config.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <string>

using matchcore::ConfigError;
using matchcore::EngineConfig;
using matchcore::StoreKind;

// -----------------------------------------------------------------------------
// 1. An empty object yields the built-in defaults.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, EmptyObjectKeepsDefaults) {
  EngineConfig config = matchcore::configFromJson(nlohmann::json::object());

  ASSERT_EQ(config.symbols.size(), 2u);
  EXPECT_EQ(config.symbols[0], "BTC/USDT");
  EXPECT_EQ(config.symbols[1], "ETH/USDT");
  EXPECT_TRUE(config.cache.enabled);
  EXPECT_EQ(config.cache.ttl_ms, 1000);
  EXPECT_EQ(config.store.kind, StoreKind::Memory);
  EXPECT_EQ(config.ipc.command_endpoint, "tcp://127.0.0.1:5556");
  EXPECT_EQ(config.ipc.publish_endpoint, "tcp://127.0.0.1:5557");
}

// -----------------------------------------------------------------------------
// 2. Present keys override; absent keys in the same section stay default.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, PartialOverride) {
  auto j = nlohmann::json::parse(R"({
    "symbols": ["SOL/USDT"],
    "cache": {"ttl_ms": 250},
    "store": {"kind": "journal", "journal_path": "/tmp/orders.jsonl"},
    "ipc": {"command_endpoint": "", "publish_endpoint": ""}
  })");

  EngineConfig config = matchcore::configFromJson(j);

  ASSERT_EQ(config.symbols.size(), 1u);
  EXPECT_EQ(config.symbols[0], "SOL/USDT");
  EXPECT_TRUE(config.cache.enabled);
  EXPECT_EQ(config.cache.ttl_ms, 250);
  EXPECT_EQ(config.store.kind, StoreKind::Journal);
  EXPECT_EQ(config.store.journal_path, "/tmp/orders.jsonl");
  EXPECT_TRUE(config.ipc.command_endpoint.empty());
}

// -----------------------------------------------------------------------------
// 3. Wrong types and invalid values are ConfigError, never a raw json error.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, RejectsInvalidConfiguration) {
  EXPECT_THROW(matchcore::configFromJson(nlohmann::json::array()), ConfigError);
  EXPECT_THROW(matchcore::configFromJson(
                   nlohmann::json::parse(R"({"symbols": "BTC/USDT"})")),
               ConfigError);
  EXPECT_THROW(matchcore::configFromJson(
                   nlohmann::json::parse(R"({"cache": {"ttl_ms": "soon"}})")),
               ConfigError);
  EXPECT_THROW(matchcore::configFromJson(
                   nlohmann::json::parse(R"({"cache": {"ttl_ms": -1}})")),
               ConfigError);
  EXPECT_THROW(matchcore::configFromJson(
                   nlohmann::json::parse(R"({"store": {"kind": "redis"}})")),
               ConfigError);
  EXPECT_THROW(matchcore::configFromJson(nlohmann::json::parse(
                   R"({"store": {"kind": "journal", "journal_path": ""}})")),
               ConfigError);
  EXPECT_THROW(matchcore::configFromJson(
                   nlohmann::json::parse(R"({"symbols": ["BTC USDT"]})")),
               ConfigError);
}

// -----------------------------------------------------------------------------
// 4. loadConfig reads a file; missing or unparsable files are ConfigError.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, LoadFromFile) {
  const std::string path = ::testing::TempDir() + "matchcore_config.json";
  {
    std::ofstream out(path);
    out << R"({"symbols": ["BTC/USDT"], "cache": {"enabled": false}})";
  }

  EngineConfig config = matchcore::loadConfig(path);
  EXPECT_EQ(config.symbols.size(), 1u);
  EXPECT_FALSE(config.cache.enabled);

  {
    std::ofstream out(path);
    out << "{ not json";
  }
  EXPECT_THROW(matchcore::loadConfig(path), ConfigError);
  std::remove(path.c_str());

  EXPECT_THROW(matchcore::loadConfig(path), ConfigError);
}
