#include "matchcore/config/engine_config.hpp"
#include "matchcore/domain/order.hpp"

#include <fstream>

namespace matchcore {

const char* toString(StoreKind kind) {
  switch (kind) {
    case StoreKind::Memory:  return "memory";
    case StoreKind::Journal: return "journal";
  }
  return "unknown";
}

namespace {

// Overwrites `out` only when `key` is present.
template <typename T>
void readIfPresent(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it != j.end()) {
    out = it->get<T>();
  }
}

void validate(const EngineConfig& config) {
  for (const auto& symbol : config.symbols) {
    if (!domain::isWellFormedSymbol(symbol)) {
      throw ConfigError("invalid symbol '" + symbol + "'");
    }
  }
  if (config.cache.ttl_ms < 0) {
    throw ConfigError("cache.ttl_ms must not be negative");
  }
  if (config.store.kind == StoreKind::Journal &&
      config.store.journal_path.empty()) {
    throw ConfigError("store.journal_path is required for the journal store");
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// configFromJson()
// -----------------------------------------------------------------------------
EngineConfig configFromJson(const nlohmann::json& j) {
  EngineConfig config;

  try {
    if (!j.is_object()) {
      throw ConfigError("configuration root must be a JSON object");
    }

    readIfPresent(j, "symbols", config.symbols);

    if (auto it = j.find("cache"); it != j.end()) {
      readIfPresent(*it, "enabled", config.cache.enabled);
      readIfPresent(*it, "ttl_ms", config.cache.ttl_ms);
    }

    if (auto it = j.find("store"); it != j.end()) {
      std::string kind = toString(config.store.kind);
      readIfPresent(*it, "kind", kind);
      if (kind == "memory") {
        config.store.kind = StoreKind::Memory;
      } else if (kind == "journal") {
        config.store.kind = StoreKind::Journal;
      } else {
        throw ConfigError("unknown store.kind '" + kind + "'");
      }
      readIfPresent(*it, "journal_path", config.store.journal_path);
    }

    if (auto it = j.find("ipc"); it != j.end()) {
      readIfPresent(*it, "command_endpoint", config.ipc.command_endpoint);
      readIfPresent(*it, "publish_endpoint", config.ipc.publish_endpoint);
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid configuration: ") + e.what());
  }

  validate(config);
  return config;
}

// -----------------------------------------------------------------------------
// loadConfig()
// -----------------------------------------------------------------------------
EngineConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw ConfigError("cannot open configuration file '" + path + "'");
  }

  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError("cannot parse '" + path + "': " + e.what());
  }
  return configFromJson(j);
}

}  // namespace matchcore
