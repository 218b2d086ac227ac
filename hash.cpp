#include "hash.hpp"

namespace ttlcache {

namespace {
constexpr uint64_t fnvOffsetBasis = 14695981039346656037ull;
constexpr uint64_t fnvPrime = 1099511628211ull;
}  // namespace

uint64_t HashString(std::string_view s) noexcept {
  uint64_t h = fnvOffsetBasis;
  for (unsigned char c : s) {
    h ^= c;
    h *= fnvPrime;
  }
  return h;
}

}
