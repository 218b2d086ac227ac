#ifndef TTLCACHE_TIERED_CACHE_HPP
#define TTLCACHE_TIERED_CACHE_HPP

#include "codec.hpp"
#include "context.hpp"
#include "expiring_cache.hpp"
#include "slow_store.hpp"
#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

namespace ttlcache {

/** Smallest default TTL accepted by TieredCache; slow stores commonly keep second granularity. */
constexpr Duration minTieredTtl = std::chrono::seconds(1);

/** Configuration for TieredCache. */
struct TieredCacheConfig {
  /** Capacity of the near cache. */
  int maxEntries = defaultMaxEntries;
  /** TTL used by Set/SetBytes when the caller gives none (or zero). */
  Duration defaultTtl = defaultEntryTtl;
  /** Prepended to every key before either tier sees it. */
  std::string prefix;
  /** Slow store error that GetIgnoreNotFound turns into success. Empty mutes nothing. */
  std::error_code notFound;
};

/**
 * Bounded near cache in front of a slow, durable store.
 *
 * Reads try the near cache first and fall back to the slow store, copying a
 * fetched value back into the near cache under the slow store's TTL. Writes
 * go to the slow store first; the near cache is only updated once that write
 * succeeded, so it never holds data the durable tier rejected. Expiry found
 * in the near cache is not propagated to the slow store.
 */
class TieredCache {
  struct Passkey {};

 public:
  using NearCache = SyncExpiringCache<std::string, Bytes>;

  TieredCache(Passkey, std::shared_ptr<SlowStore> slow,
              TieredCacheConfig config, std::unique_ptr<NearCache> near);

  /** Returns nullptr and sets \a ec to Errc::invalidConfig if \a slow is null, maxEntries is not gt 0 or defaultTtl is below minTieredTtl. */
  static std::unique_ptr<TieredCache> New(std::shared_ptr<SlowStore> slow,
                                          TieredCacheConfig config,
                                          std::error_code* ec = nullptr);

  /** Writes prefix + \a key into \a resolved. Errc::keyIsEmpty for an empty key. */
  std::error_code ResolveKey(const std::string& key,
                             std::string& resolved) const;

  /**
   * Raw bytes for \a key from the near cache or, failing that, the slow store.
   * Slow store errors are returned as is. A value fetched from the slow store
   * is copied into the near cache only when the store reports a TTL gt 0; a
   * store that reports a negative TTL for keys without expiry never fills the
   * near cache.
   */
  std::error_code GetBytes(const Context& ctx, const std::string& key,
                           Bytes& value);

  /** Stores raw bytes in the slow store, then in the near cache. Zero or missing \a ttl means the default TTL. */
  std::error_code SetBytes(const Context& ctx, const std::string& key,
                           const Bytes& value,
                           std::optional<Duration> ttl = std::nullopt);

  /** GetBytes followed by Codec::Unmarshal into \a result. */
  template <typename T, typename Codec = JsonCodec>
  std::error_code Get(const Context& ctx, const std::string& key, T& result) {
    std::string resolved;
    if (auto err = ResolveKey(key, resolved)) return err;
    Bytes buf;
    if (auto err = getResolved(ctx, resolved, buf)) return err;
    return Codec::Unmarshal(buf, result);
  }

  /** Get, except that the configured notFound error is reported as success with \a result untouched. */
  template <typename T, typename Codec = JsonCodec>
  std::error_code GetIgnoreNotFound(const Context& ctx, const std::string& key,
                                    T& result) {
    std::error_code err = Get<T, Codec>(ctx, key, result);
    if (err && config_.notFound && err == config_.notFound) return {};
    return err;
  }

  /** Codec::Marshal then SetBytes. An encode failure touches neither tier. */
  template <typename T, typename Codec = JsonCodec>
  std::error_code Set(const Context& ctx, const std::string& key,
                      const T& value,
                      std::optional<Duration> ttl = std::nullopt) {
    std::string resolved;
    if (auto err = ResolveKey(key, resolved)) return err;
    Bytes buf;
    if (auto err = Codec::Marshal(value, buf)) return err;
    return setResolved(ctx, resolved, buf, ttl);
  }

  /** Removes \a key from the near cache, then from the slow store; \a count is the slow store's deletion count. */
  std::error_code Delete(const Context& ctx, const std::string& key,
                         int64_t& count);

  /** Remaining TTL from the near cache when it holds \a key, otherwise from the slow store. */
  std::error_code TTL(const Context& ctx, const std::string& key,
                      Duration& ttl);

  NearCache& Near() { return *near_; }
  const TieredCacheConfig& Config() const { return config_; }

 private:
  /** Near cache, then slow store. Repopulates the near cache only for a slow TTL gt 0. */
  std::error_code getResolved(const Context& ctx, const std::string& key,
                              Bytes& value);
  std::error_code setResolved(const Context& ctx, const std::string& key,
                              const Bytes& value, std::optional<Duration> ttl);

  std::shared_ptr<SlowStore> slow_;
  TieredCacheConfig config_;
  std::unique_ptr<NearCache> near_;
};

}  // namespace ttlcache

#endif  // TTLCACHE_TIERED_CACHE_HPP
