#ifndef TTLCACHE_SLOW_STORE_HPP
#define TTLCACHE_SLOW_STORE_HPP

#include "context.hpp"
#include "types.hpp"
#include <cstdint>
#include <string>
#include <system_error>

namespace ttlcache {

/**
 * Larger, slower and durable tier behind TieredCache (a remote key/value
 * server, a file store, ...). It is the only place where blocking I/O
 * happens, so implementations should give up with ctx.Err() once the
 * context is done.
 */
class SlowStore {
 public:
  virtual ~SlowStore() = default;

  /** Reads \a key into \a value. */
  virtual std::error_code Get(const Context& ctx, const std::string& key,
                              Bytes& value) = 0;

  /** Durably stores \a value under \a key for \a ttl. Success means the write is confirmed. */
  virtual std::error_code Set(const Context& ctx, const std::string& key,
                              const Bytes& value, Duration ttl) = 0;

  /** Writes the remaining lifetime of \a key into \a ttl (ttlAbsent when it is not stored). */
  virtual std::error_code TTL(const Context& ctx, const std::string& key,
                              Duration& ttl) = 0;

  /** Deletes \a key and writes the number of removed entries into \a count. */
  virtual std::error_code Delete(const Context& ctx, const std::string& key,
                                 int64_t& count) = 0;
};

}  // namespace ttlcache

#endif  // TTLCACHE_SLOW_STORE_HPP
