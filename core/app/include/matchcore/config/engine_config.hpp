#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace matchcore {

// -----------------------------------------------------------------------------
// ConfigError
// -----------------------------------------------------------------------------
// Raised when a configuration file cannot be read, is not valid JSON, has a
// field of the wrong type, or names an unknown value.
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class StoreKind {
  Memory,   // InMemoryOrderStore; state is lost on exit
  Journal,  // JournalOrderStore at journal_path
};

const char* toString(StoreKind kind);

struct CacheConfig {
  bool enabled{true};
  std::int64_t ttl_ms{1000};
};

struct StoreConfig {
  StoreKind kind{StoreKind::Memory};
  std::string journal_path{"matchcore_journal.jsonl"};
};

// Empty endpoints disable the IPC server.
struct IpcConfig {
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string publish_endpoint{"tcp://127.0.0.1:5557"};
};

// -----------------------------------------------------------------------------
// EngineConfig
// -----------------------------------------------------------------------------
//
// @brief  Everything ExchangeEngine needs to assemble itself.
//
// @details
// Plain struct with working defaults, so a default-constructed EngineConfig
// runs an in-memory exchange for BTC/USDT and ETH/USDT. A JSON file may
// override any subset:
//
//   {
//     "symbols": ["BTC/USDT", "ETH/USDT"],
//     "cache":   {"enabled": true, "ttl_ms": 1000},
//     "store":   {"kind": "journal", "journal_path": "orders.jsonl"},
//     "ipc":     {"command_endpoint": "tcp://127.0.0.1:5556",
//                 "publish_endpoint": "tcp://127.0.0.1:5557"}
//   }
//
// Missing keys keep their defaults. Validation rejects malformed symbols, a
// negative TTL, an unknown store kind and an empty journal path for the
// journal store.
// -----------------------------------------------------------------------------
struct EngineConfig {
  std::vector<std::string> symbols{"BTC/USDT", "ETH/USDT"};
  CacheConfig cache;
  StoreConfig store;
  IpcConfig ipc;
};

// @throws ConfigError
EngineConfig configFromJson(const nlohmann::json& j);

// Reads and parses the file at path. @throws ConfigError
EngineConfig loadConfig(const std::string& path);

}  // namespace matchcore
