#include "context_cache.hpp"

#include <iostream>
#include <utility>

namespace continuity {

ContextCache::ContextCache(int64_t ttl_ms, const Clock* clock)
    : ttl_ms_(ttl_ms > 0 ? ttl_ms : 1), clock_(clock ? clock : DefaultClock()) {}

std::optional<std::vector<ContextItem>> ContextCache::Get(const std::string& key) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;
  if (clock_->SteadyMs() - it->second.stored_ms > ttl_ms_) {
    entries_.erase(it);
    return std::nullopt;
  }
  return it->second.items;
}

void ContextCache::Put(const std::string& key, std::vector<ContextItem> items) {
  std::lock_guard<std::mutex> lock(mu_);
  const int64_t now = clock_->SteadyMs();
  if (!last_sweep_ms_ || now - *last_sweep_ms_ >= ttl_ms_ / 2) SweepLocked(now);
  Entry e;
  e.stored_ms = now;
  e.items = std::move(items);
  entries_[key] = std::move(e);
}

void ContextCache::SweepLocked(int64_t now) {
  last_sweep_ms_ = now;
  last_sweep_wall_ms_ = clock_->WallMs();
  size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (now - it->second.stored_ms > ttl_ms_) {
      it = entries_.erase(it);
      removed++;
    } else {
      ++it;
    }
  }
  if (removed > 0) std::cout << "[context-cache] swept expired=" << removed << " remaining=" << entries_.size() << "\n";
}

void ContextCache::Clear() {
  std::lock_guard<std::mutex> lock(mu_);
  entries_.clear();
}

size_t ContextCache::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

std::optional<int64_t> ContextCache::last_sweep_wall_ms() const {
  std::lock_guard<std::mutex> lock(mu_);
  return last_sweep_wall_ms_;
}

}  // namespace continuity
