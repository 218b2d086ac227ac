#ifndef TTLCACHE_MEMORY_STORE_HPP
#define TTLCACHE_MEMORY_STORE_HPP

#include "slow_store.hpp"
#include <cstddef>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace ttlcache {

/** Unbounded in-process SlowStore with per-key expiry. Expired keys are dropped when read. */
class MemoryStore : public SlowStore {
 public:
  std::error_code Get(const Context& ctx, const std::string& key,
                      Bytes& value) override;

  /** Returns Errc::invalidTtl when \a ttl is not positive. */
  std::error_code Set(const Context& ctx, const std::string& key,
                      const Bytes& value, Duration ttl) override;

  std::error_code TTL(const Context& ctx, const std::string& key,
                      Duration& ttl) override;

  std::error_code Delete(const Context& ctx, const std::string& key,
                         int64_t& count) override;

  /** Number of stored keys, expired ones included. */
  size_t Size() const;

 private:
  struct Item {
    Bytes value;
    Clock::time_point expiresAt;
  };

  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, Item> m_;
};

}  // namespace ttlcache

#endif  // TTLCACHE_MEMORY_STORE_HPP
