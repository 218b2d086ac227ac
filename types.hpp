#ifndef TTLCACHE_TYPES_HPP
#define TTLCACHE_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <vector>

namespace ttlcache {

/** Monotonic clock used for every expiry timestamp in the cache layers. */
using Clock = std::chrono::steady_clock;
using Duration = std::chrono::nanoseconds;

/** Serialized value exchanged with codecs and slow stores. */
using Bytes = std::vector<uint8_t>;

/** TTL reported for a key that is not stored at all. */
constexpr Duration ttlAbsent{-2};
/** TTL reported for a key that is stored but already expired. */
constexpr Duration ttlExpired{-1};

/** Default number of shards for ShardedCache. */
constexpr int defaultNShards = 16;
/** Default total entry budget. */
constexpr int defaultMaxEntries = 2048;
/** Default time-to-live applied when no per-call TTL is given. */
constexpr Duration defaultEntryTtl = std::chrono::minutes(1);

/** Returns now + ttl, clamped to the clock's range instead of wrapping. */
inline Clock::time_point ExpiryAfter(Clock::time_point now, Duration ttl) {
  if (ttl > Duration::zero() && ttl > Clock::time_point::max() - now) {
    return Clock::time_point::max();
  }
  if (ttl < Duration::zero() &&
      now.time_since_epoch() < Clock::duration::min() - ttl) {
    return Clock::time_point::min();
  }
  return now + ttl;
}

}  // namespace ttlcache

#endif  // TTLCACHE_TYPES_HPP
