#ifndef TTLCACHE_HASH_HPP
#define TTLCACHE_HASH_HPP

#include <cstdint>
#include <string_view>

namespace ttlcache {

/** Hashes \a s with 64-bit FNV-1a. Stable across runs; not collision resistant. */
uint64_t HashString(std::string_view s) noexcept;

}  // namespace ttlcache

#endif  // TTLCACHE_HASH_HPP
