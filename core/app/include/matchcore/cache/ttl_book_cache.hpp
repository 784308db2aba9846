#pragma once

#include "matchcore/cache/i_book_cache.hpp"
#include "matchcore/time/i_time_provider.hpp"

#include <cstddef>
#include <mutex>
#include <unordered_map>

namespace matchcore {

// -----------------------------------------------------------------------------
// TtlBookCache
// -----------------------------------------------------------------------------
// In-process IBookCache. Each entry stores its expiry time computed from the
// injected ITimeProvider; get() treats an entry as gone once
// now_ms() >= expires_at_ms and drops it. A non-positive TTL stores nothing.
//
// Thread model: one mutex around the map; safe from any thread.
// Ownership: borrows the clock, which must outlive the cache.
// -----------------------------------------------------------------------------
class TtlBookCache final : public IBookCache {
 public:
  explicit TtlBookCache(const ITimeProvider& clock);

  std::optional<std::string> get(const std::string& key) override;
  void set(const std::string& key, std::string value,
           std::int64_t ttl_ms) override;
  void erase(const std::string& key) override;

  // Entries currently held, expired or not (diagnostics and tests).
  std::size_t size() const;

 private:
  struct Entry {
    std::string value;
    std::int64_t expires_at_ms{0};
  };

  const ITimeProvider& clock_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

// -----------------------------------------------------------------------------
// NullBookCache
// -----------------------------------------------------------------------------
// Caching disabled: every get() misses and set()/erase() do nothing.
// -----------------------------------------------------------------------------
class NullBookCache final : public IBookCache {
 public:
  std::optional<std::string> get(const std::string&) override {
    return std::nullopt;
  }
  void set(const std::string&, std::string, std::int64_t) override {}
  void erase(const std::string&) override {}
};

}  // namespace matchcore
