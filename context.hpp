#ifndef TTLCACHE_CONTEXT_HPP
#define TTLCACHE_CONTEXT_HPP

#include "types.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <system_error>

namespace ttlcache {

/**
 * Cancellation flag plus optional deadline, passed by the caller down to the
 * slow store. Copies share the cancellation flag, so cancelling any copy
 * cancels all of them. The cache layers only forward it.
 */
class Context {
 public:
  /** Never cancelled by itself and without deadline. */
  static Context Background();

  static Context WithDeadline(Clock::time_point deadline);

  static Context WithTimeout(Duration timeout);

  /** Marks this context and its copies as cancelled. */
  void Cancel() const;

  /** Returns Errc::cancelled, Errc::deadlineExceeded, or an empty code while still live. */
  std::error_code Err() const;

  bool Done() const { return static_cast<bool>(Err()); }

  std::optional<Clock::time_point> Deadline() const { return deadline_; }

 private:
  Context();

  std::shared_ptr<std::atomic<bool>> cancelled_;
  std::optional<Clock::time_point> deadline_;
};

}  // namespace ttlcache

#endif  // TTLCACHE_CONTEXT_HPP
