#ifndef TTLCACHE_ERRORS_HPP
#define TTLCACHE_ERRORS_HPP

#include <system_error>
#include <type_traits>

namespace ttlcache {

/** Error sentinels exposed by the cache layers. Compare with `ec == Errc::x`. */
enum class Errc {
  /** Construction parameters out of range (capacity, TTL, shard count). */
  invalidConfig = 1,
  /** Raw key passed to TieredCache is empty. */
  keyIsEmpty,
  /** Decoded or encoded value does not fit the requested type. */
  invalidType,
  /** Key is not held by the slow store. */
  notFound,
  /** Codec could not encode the value. */
  marshalFailed,
  /** Codec could not parse the stored bytes. */
  unmarshalFailed,
  /** Slow store was asked to keep a value with a non-positive TTL. */
  invalidTtl,
  /** Caller cancelled the context. */
  cancelled,
  /** Context deadline passed before the slow store answered. */
  deadlineExceeded,
};

/** Category shared by every Errc value; name() is "ttlcache". */
const std::error_category& ErrorCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;

}  // namespace ttlcache

namespace std {
template <>
struct is_error_code_enum<ttlcache::Errc> : true_type {};
}  // namespace std

#endif  // TTLCACHE_ERRORS_HPP
