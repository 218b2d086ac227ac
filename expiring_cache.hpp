#ifndef TTLCACHE_EXPIRING_CACHE_HPP
#define TTLCACHE_EXPIRING_CACHE_HPP

#include "bounded_store.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "types.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <system_error>
#include <utility>
#include <vector>

namespace ttlcache {

/** Stored value plus the monotonic instant after which it is stale. */
template <typename V>
struct Entry {
  V value{};
  Clock::time_point expiresAt{};
};

/** Configuration for ExpiringCache: capacity, default TTL and capacity-eviction observer. */
template <typename K, typename V>
struct ExpiringCacheConfig {
  int maxEntries = defaultMaxEntries;
  Duration defaultTtl = defaultEntryTtl;
  /** Fired only for capacity evictions, never for TTL expiry or Remove. */
  std::function<void(const K&, const V&)> onEvicted;
};

/**
 * Bounded LRU cache with per-entry TTL and lazy expiry. Not synchronized; see
 * SyncExpiringCache for the locked variant.
 *
 * An expired entry keeps its slot until Get, Remove, Clear or capacity
 * eviction drops it. Get and Peek both hand back the stale value of an
 * expired entry while returning false; only the boolean marks a hit.
 */
template <typename K, typename V>
class ExpiringCache {
  struct Passkey {};

 public:
  using Config = ExpiringCacheConfig<K, V>;
  using EntryStore = Store<K, Entry<V>>;
  using Visitor = std::function<void(const K&, const V&)>;

  /** Use New. */
  ExpiringCache(Passkey, Config config, std::unique_ptr<EntryStore> store)
      : config_(std::move(config)), store_(std::move(store)) {
    auto onEvicted = config_.onEvicted;
    store_->SetEvictionCallback(
        [onEvicted](const K& key, const Entry<V>& e) {
          Logger()->trace("evicted least recently used entry");
          if (onEvicted) onEvicted(key, e.value);
        });
  }

  /** Builds a cache on an LruStore. Returns nullptr and sets \a ec to Errc::invalidConfig unless maxEntries and defaultTtl are gt 0. */
  static std::unique_ptr<ExpiringCache> New(Config config,
                                            std::error_code* ec = nullptr) {
    if (!validate(config, ec)) return nullptr;
    auto store = std::make_unique<LruStore<K, Entry<V>>>(
        static_cast<size_t>(config.maxEntries));
    return std::make_unique<ExpiringCache>(Passkey{}, std::move(config),
                                           std::move(store));
  }

  /** Builds a cache on a caller-supplied \a store. The store must enforce config.maxEntries itself. */
  static std::unique_ptr<ExpiringCache> New(Config config,
                                            std::unique_ptr<EntryStore> store,
                                            std::error_code* ec = nullptr) {
    if (!validate(config, ec)) return nullptr;
    if (!store) {
      Logger()->error("expiring cache needs a backing store");
      if (ec) *ec = Errc::invalidConfig;
      return nullptr;
    }
    return std::make_unique<ExpiringCache>(Passkey{}, std::move(config),
                                           std::move(store));
  }

  /** Stores \a value under \a key for \a ttl, or for the default TTL when \a ttl is empty. */
  void Add(const K& key, V value, std::optional<Duration> ttl = std::nullopt) {
    Entry<V> e;
    e.value = std::move(value);
    e.expiresAt = ExpiryAfter(Clock::now(), ttl.value_or(config_.defaultTtl));
    store_->Add(key, std::move(e));
  }

  /** Promotes and returns \a key. An expired entry is removed and its stale value written to \a value; returns false. */
  bool Get(const K& key, V& value) {
    Entry<V> e;
    if (!store_->Get(key, e)) return false;
    value = std::move(e.value);
    if (expired(e, Clock::now())) {
      store_->Remove(key);
      return false;
    }
    return true;
  }

  /** Like Get but leaves recency and expired entries untouched. */
  bool Peek(const K& key, V& value) const {
    Entry<V> e;
    if (!store_->Peek(key, e)) return false;
    value = std::move(e.value);
    return !expired(e, Clock::now());
  }

  /** Remaining lifetime of \a key: ttlAbsent if not stored, ttlExpired if stale. */
  Duration TTL(const K& key) const {
    Entry<V> e;
    if (!store_->Peek(key, e)) return ttlAbsent;
    auto now = Clock::now();
    if (expired(e, now)) return ttlExpired;
    return std::chrono::duration_cast<Duration>(e.expiresAt - now);
  }

  void Remove(const K& key) { store_->Remove(key); }

  void Clear() { store_->Clear(); }

  /** Number of unexpired entries. Expired entries still occupying slots are not counted. */
  int Len() const {
    int n = 0;
    auto now = Clock::now();
    store_->ForEach([&](const K&, const Entry<V>& e) {
      if (!expired(e, now)) ++n;
    });
    return n;
  }

  /** Unexpired keys, most recently used first. */
  std::vector<K> Keys() const {
    std::vector<K> keys;
    auto now = Clock::now();
    store_->ForEach([&](const K& k, const Entry<V>& e) {
      if (!expired(e, now)) keys.push_back(k);
    });
    return keys;
  }

  /** Visits unexpired entries, most recently used first. \a visit must not mutate the cache. */
  void ForEach(const Visitor& visit) const {
    auto now = Clock::now();
    store_->ForEach([&](const K& k, const Entry<V>& e) {
      if (!expired(e, now)) visit(k, e.value);
    });
  }

  int Capacity() const { return config_.maxEntries; }
  Duration DefaultTtl() const { return config_.defaultTtl; }

 private:
  static bool validate(const Config& config, std::error_code* ec) {
    if (config.maxEntries <= 0 || config.defaultTtl <= Duration::zero()) {
      Logger()->error(
          "maxEntries and default ttl must be gt 0 (maxEntries={}, ttl={}ns)",
          config.maxEntries, config.defaultTtl.count());
      if (ec) *ec = Errc::invalidConfig;
      return false;
    }
    if (ec) ec->clear();
    return true;
  }

  static bool expired(const Entry<V>& e, Clock::time_point now) {
    return e.expiresAt < now;
  }

  Config config_;
  std::unique_ptr<EntryStore> store_;
};

/**
 * ExpiringCache guarded by a reader/writer lock.
 *
 * Add, Get, Remove and Clear take the lock exclusively (Get reorders recency
 * and may drop an expired entry). Peek, TTL, Len, Keys and ForEach share it.
 * The eviction callback runs with the exclusive lock held and must not call
 * back into this cache.
 */
template <typename K, typename V>
class SyncExpiringCache {
  struct Passkey {};

 public:
  using Config = ExpiringCacheConfig<K, V>;
  using Core = ExpiringCache<K, V>;
  using Visitor = typename Core::Visitor;

  SyncExpiringCache(Passkey, std::unique_ptr<Core> core)
      : core_(std::move(core)) {}

  /** Same validation as ExpiringCache::New. */
  static std::unique_ptr<SyncExpiringCache> New(Config config,
                                                std::error_code* ec = nullptr) {
    auto core = Core::New(std::move(config), ec);
    if (!core) return nullptr;
    return std::make_unique<SyncExpiringCache>(Passkey{}, std::move(core));
  }

  /** Wraps an existing unsynchronized cache. Returns nullptr if \a core is null. */
  static std::unique_ptr<SyncExpiringCache> Wrap(std::unique_ptr<Core> core) {
    if (!core) return nullptr;
    return std::make_unique<SyncExpiringCache>(Passkey{}, std::move(core));
  }

  void Add(const K& key, V value, std::optional<Duration> ttl = std::nullopt) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    core_->Add(key, std::move(value), ttl);
  }

  bool Get(const K& key, V& value) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    return core_->Get(key, value);
  }

  bool Peek(const K& key, V& value) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return core_->Peek(key, value);
  }

  Duration TTL(const K& key) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return core_->TTL(key);
  }

  void Remove(const K& key) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    core_->Remove(key);
  }

  void Clear() {
    std::unique_lock<std::shared_mutex> lock(mu_);
    core_->Clear();
  }

  int Len() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return core_->Len();
  }

  std::vector<K> Keys() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return core_->Keys();
  }

  void ForEach(const Visitor& visit) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    core_->ForEach(visit);
  }

  int Capacity() const { return core_->Capacity(); }
  Duration DefaultTtl() const { return core_->DefaultTtl(); }

 private:
  mutable std::shared_mutex mu_;
  std::unique_ptr<Core> core_;
};

}  // namespace ttlcache

#endif  // TTLCACHE_EXPIRING_CACHE_HPP
