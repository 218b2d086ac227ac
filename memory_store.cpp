#include "memory_store.hpp"
#include "errors.hpp"
#include <mutex>

namespace ttlcache {

std::error_code MemoryStore::Get(const Context& ctx, const std::string& key,
                                 Bytes& value) {
  if (auto err = ctx.Err()) return err;

  std::unique_lock<std::shared_mutex> lock(mu_);
  auto it = m_.find(key);
  if (it == m_.end()) return Errc::notFound;
  if (it->second.expiresAt < Clock::now()) {
    m_.erase(it);
    return Errc::notFound;
  }
  value = it->second.value;
  return {};
}

std::error_code MemoryStore::Set(const Context& ctx, const std::string& key,
                                 const Bytes& value, Duration ttl) {
  if (auto err = ctx.Err()) return err;
  if (ttl <= Duration::zero()) return Errc::invalidTtl;

  std::unique_lock<std::shared_mutex> lock(mu_);
  m_[key] = Item{value, ExpiryAfter(Clock::now(), ttl)};
  return {};
}

std::error_code MemoryStore::TTL(const Context& ctx, const std::string& key,
                                 Duration& ttl) {
  if (auto err = ctx.Err()) return err;

  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = m_.find(key);
  auto now = Clock::now();
  if (it == m_.end() || it->second.expiresAt < now) {
    ttl = ttlAbsent;
    return {};
  }
  ttl = std::chrono::duration_cast<Duration>(it->second.expiresAt - now);
  return {};
}

std::error_code MemoryStore::Delete(const Context& ctx, const std::string& key,
                                    int64_t& count) {
  if (auto err = ctx.Err()) return err;

  std::unique_lock<std::shared_mutex> lock(mu_);
  count = static_cast<int64_t>(m_.erase(key));
  return {};
}

size_t MemoryStore::Size() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return m_.size();
}

}
