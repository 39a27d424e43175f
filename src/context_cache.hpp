#pragma once

#include "clock.hpp"
#include "providers/context_provider.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace continuity {

// TTL cache of assembled item lists. Expired entries are dropped on lookup
// and by a sweep that runs on insert at most once per ttl/2.
class ContextCache {
 public:
  ContextCache(int64_t ttl_ms, const Clock* clock = DefaultClock());

  std::optional<std::vector<ContextItem>> Get(const std::string& key);
  void Put(const std::string& key, std::vector<ContextItem> items);
  void Clear();

  size_t size() const;
  // Wall time of the last sweep, std::nullopt before the first insert.
  std::optional<int64_t> last_sweep_wall_ms() const;
  int64_t ttl_ms() const { return ttl_ms_; }

 private:
  struct Entry {
    int64_t stored_ms = 0;
    std::vector<ContextItem> items;
  };

  void SweepLocked(int64_t now);

  int64_t ttl_ms_;
  const Clock* clock_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, Entry> entries_;
  std::optional<int64_t> last_sweep_ms_;
  std::optional<int64_t> last_sweep_wall_ms_;
};

}  // namespace continuity
