#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace matchcore {

// -----------------------------------------------------------------------------
// IBookCache: read-through cache collaborator for book snapshots
// -----------------------------------------------------------------------------
//
// @brief  String key/value store with a per-entry time-to-live.
//
// @details
// The MatchingEngine caches the JSON form of each symbol's snapshot under
// bookCacheKey(symbol) and erases that key after every mutation of the
// symbol. Nothing depends on the cache being fresh or even present: a miss,
// an expired entry, a corrupt entry or a throwing cache all fall back to the
// engine's own published snapshot.
//
// Implementations: TtlBookCache (in-process, clock-driven expiry) and
// NullBookCache (caching disabled).
//
// Thread model:
//   Implementations must be safe for concurrent calls.
// -----------------------------------------------------------------------------
class IBookCache {
 public:
  virtual ~IBookCache() = default;

  // Value for key, or std::nullopt on miss or expiry.
  virtual std::optional<std::string> get(const std::string& key) = 0;

  // Stores value under key for ttl_ms milliseconds.
  virtual void set(const std::string& key, std::string value,
                   std::int64_t ttl_ms) = 0;

  virtual void erase(const std::string& key) = 0;
};

// "order_book:<SYMBOL>"
std::string bookCacheKey(const std::string& symbol);

}  // namespace matchcore
