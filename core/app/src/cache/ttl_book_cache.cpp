#include "matchcore/cache/ttl_book_cache.hpp"

#include <utility>

namespace matchcore {

std::string bookCacheKey(const std::string& symbol) {
  return "order_book:" + symbol;
}

TtlBookCache::TtlBookCache(const ITimeProvider& clock) : clock_(clock) {}

// -----------------------------------------------------------------------------
// get(): lazy expiry
// -----------------------------------------------------------------------------
std::optional<std::string> TtlBookCache::get(const std::string& key) {
  const std::int64_t now = clock_.now_ms();

  std::lock_guard lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  if (now >= it->second.expires_at_ms) {
    entries_.erase(it);
    return std::nullopt;
  }
  return it->second.value;
}

// -----------------------------------------------------------------------------
// set()
// -----------------------------------------------------------------------------
void TtlBookCache::set(const std::string& key, std::string value,
                       std::int64_t ttl_ms) {
  if (ttl_ms <= 0) {
    return;
  }
  const std::int64_t expires_at = clock_.now_ms() + ttl_ms;

  std::lock_guard lock(mutex_);
  entries_[key] = Entry{std::move(value), expires_at};
}

void TtlBookCache::erase(const std::string& key) {
  std::lock_guard lock(mutex_);
  entries_.erase(key);
}

std::size_t TtlBookCache::size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

}  // namespace matchcore
