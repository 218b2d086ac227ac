#ifndef TTLCACHE_SHARDED_CACHE_HPP
#define TTLCACHE_SHARDED_CACHE_HPP

#include "errors.hpp"
#include "expiring_cache.hpp"
#include "hash.hpp"
#include "log.hpp"
#include "types.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace ttlcache {

/** Configuration for ShardedCache: shard count, total entry budget, TTL and eviction observer. */
template <typename V>
struct ShardedCacheConfig {
  int shards = defaultNShards;
  int maxEntries = defaultMaxEntries;
  Duration defaultTtl = defaultEntryTtl;
  std::function<void(const std::string&, const V&)> onEvicted;
};

/**
 * Fixed array of independently locked caches. A key always maps to the same
 * shard; callers issue every operation for that key against PickShard(key).
 * There is no cache-wide lock, so LRU order is per shard and the aggregate
 * Len and Keys are snapshots that may never have existed at one instant.
 */
template <typename V>
class ShardedCache {
  struct Passkey {};

 public:
  using Config = ShardedCacheConfig<V>;
  using Shard = SyncExpiringCache<std::string, V>;

  explicit ShardedCache(Passkey) {}

  /** Builds \a config.shards caches of ceil(maxEntries / shards) entries each. Returns nullptr and sets \a ec to Errc::invalidConfig unless shards, defaultTtl gt 0 and maxEntries gt shards. */
  static std::unique_ptr<ShardedCache> New(Config config,
                                           std::error_code* ec = nullptr) {
    if (config.shards <= 0 || config.defaultTtl <= Duration::zero() ||
        config.maxEntries <= config.shards) {
      Logger()->error(
          "default ttl, shards and max entries must be gt 0, and max entries "
          "gt shards (shards={}, maxEntries={}, ttl={}ns)",
          config.shards, config.maxEntries, config.defaultTtl.count());
      if (ec) *ec = Errc::invalidConfig;
      return nullptr;
    }

    ExpiringCacheConfig<std::string, V> shardConfig;
    shardConfig.maxEntries =
        (config.maxEntries + config.shards - 1) / config.shards;
    shardConfig.defaultTtl = config.defaultTtl;
    shardConfig.onEvicted = config.onEvicted;

    auto sc = std::make_unique<ShardedCache>(Passkey{});
    sc->shards_.resize(config.shards);
    for (int i = 0; i < config.shards; ++i) {
      sc->shards_[i] = Shard::New(shardConfig, ec);
      if (!sc->shards_[i]) return nullptr;
    }
    return sc;
  }

  /** Returns the shard that owns \a key. */
  Shard& PickShard(const std::string& key) const {
    return *shards_[ShardIndex(key)];
  }

  size_t ShardIndex(const std::string& key) const {
    return static_cast<size_t>(HashString(key) % shards_.size());
  }

  size_t ShardCount() const { return shards_.size(); }

  /** Sum of unexpired entries across shards, read shard by shard. */
  int Len() const {
    int n = 0;
    for (const auto& s : shards_) n += s->Len();
    return n;
  }

  /** Unexpired keys of every shard, shard by shard. */
  std::vector<std::string> Keys() const {
    std::vector<std::string> keys;
    for (const auto& s : shards_) {
      auto part = s->Keys();
      keys.insert(keys.end(), part.begin(), part.end());
    }
    return keys;
  }

 private:
  std::vector<std::unique_ptr<Shard>> shards_;
};

}  // namespace ttlcache

#endif  // TTLCACHE_SHARDED_CACHE_HPP
