#include "tiered_cache.hpp"
#include "errors.hpp"
#include "log.hpp"

namespace ttlcache {

std::unique_ptr<TieredCache> TieredCache::New(std::shared_ptr<SlowStore> slow,
                                              TieredCacheConfig config,
                                              std::error_code* ec) {
  if (!slow || config.defaultTtl < minTieredTtl) {
    Logger()->error(
        "tiered cache needs a slow store and a default ttl of at least one "
        "second (ttl={}ns)",
        config.defaultTtl.count());
    if (ec) *ec = Errc::invalidConfig;
    return nullptr;
  }

  ExpiringCacheConfig<std::string, Bytes> nearConfig;
  nearConfig.maxEntries = config.maxEntries;
  nearConfig.defaultTtl = config.defaultTtl;
  auto near = NearCache::New(std::move(nearConfig), ec);
  if (!near) return nullptr;

  return std::make_unique<TieredCache>(Passkey{}, std::move(slow),
                                       std::move(config), std::move(near));
}

TieredCache::TieredCache(Passkey, std::shared_ptr<SlowStore> slow,
                         TieredCacheConfig config,
                         std::unique_ptr<NearCache> near)
    : slow_(std::move(slow)),
      config_(std::move(config)),
      near_(std::move(near)) {}

std::error_code TieredCache::ResolveKey(const std::string& key,
                                        std::string& resolved) const {
  if (key.empty()) return Errc::keyIsEmpty;
  resolved = config_.prefix + key;
  return {};
}

std::error_code TieredCache::GetBytes(const Context& ctx,
                                      const std::string& key, Bytes& value) {
  std::string resolved;
  if (auto err = ResolveKey(key, resolved)) return err;
  return getResolved(ctx, resolved, value);
}

std::error_code TieredCache::SetBytes(const Context& ctx,
                                      const std::string& key,
                                      const Bytes& value,
                                      std::optional<Duration> ttl) {
  std::string resolved;
  if (auto err = ResolveKey(key, resolved)) return err;
  return setResolved(ctx, resolved, value, ttl);
}

std::error_code TieredCache::getResolved(const Context& ctx,
                                         const std::string& key,
                                         Bytes& value) {
  Bytes buf;
  if (near_->Get(key, buf) && !buf.empty()) {
    value = std::move(buf);
    return {};
  }

  Logger()->debug("near cache miss for {}, reading slow store", key);
  buf.clear();
  if (auto err = slow_->Get(ctx, key, buf)) return err;

  if (!buf.empty()) {
    Duration ttl{};
    if (auto err = slow_->TTL(ctx, key, ttl)) {
      Logger()->debug("ttl lookup for {} failed, near cache not refilled: {}",
                      key, err.message());
    } else if (ttl > Duration::zero()) {
      near_->Add(key, buf, ttl);
    } else {
      Logger()->debug("slow store reports ttl {}ns for {}, near cache not "
                      "refilled",
                      ttl.count(), key);
    }
  }
  value = std::move(buf);
  return {};
}

std::error_code TieredCache::setResolved(const Context& ctx,
                                         const std::string& key,
                                         const Bytes& value,
                                         std::optional<Duration> ttl) {
  Duration t = config_.defaultTtl;
  if (ttl && *ttl != Duration::zero()) t = *ttl;

  if (auto err = slow_->Set(ctx, key, value, t)) return err;
  near_->Add(key, value, t);
  return {};
}

std::error_code TieredCache::Delete(const Context& ctx, const std::string& key,
                                    int64_t& count) {
  std::string resolved;
  if (auto err = ResolveKey(key, resolved)) return err;
  near_->Remove(resolved);
  return slow_->Delete(ctx, resolved, count);
}

std::error_code TieredCache::TTL(const Context& ctx, const std::string& key,
                                 Duration& ttl) {
  std::string resolved;
  if (auto err = ResolveKey(key, resolved)) return err;
  Duration d = near_->TTL(resolved);
  if (d >= Duration::zero()) {
    ttl = d;
    return {};
  }
  return slow_->TTL(ctx, resolved, ttl);
}

}
