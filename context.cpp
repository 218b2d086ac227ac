#include "context.hpp"
#include "errors.hpp"

namespace ttlcache {

Context::Context() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

Context Context::Background() { return Context(); }

Context Context::WithDeadline(Clock::time_point deadline) {
  Context ctx;
  ctx.deadline_ = deadline;
  return ctx;
}

Context Context::WithTimeout(Duration timeout) {
  return WithDeadline(ExpiryAfter(Clock::now(), timeout));
}

void Context::Cancel() const { cancelled_->store(true); }

std::error_code Context::Err() const {
  if (cancelled_->load()) return Errc::cancelled;
  if (deadline_ && Clock::now() >= *deadline_) return Errc::deadlineExceeded;
  return {};
}

}
