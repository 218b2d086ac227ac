#include "errors.hpp"
#include <string>

namespace ttlcache {

namespace {

class ErrorCategoryImpl : public std::error_category {
 public:
  const char* name() const noexcept override { return "ttlcache"; }

  std::string message(int ev) const override {
    switch (static_cast<Errc>(ev)) {
      case Errc::invalidConfig:
        return "invalid cache configuration";
      case Errc::keyIsEmpty:
        return "key is empty";
      case Errc::invalidType:
        return "invalid type";
      case Errc::notFound:
        return "not found";
      case Errc::marshalFailed:
        return "marshal failed";
      case Errc::unmarshalFailed:
        return "unmarshal failed";
      case Errc::invalidTtl:
        return "ttl must be gt 0";
      case Errc::cancelled:
        return "context cancelled";
      case Errc::deadlineExceeded:
        return "context deadline exceeded";
    }
    return "unknown ttlcache error";
  }
};

}  // namespace

const std::error_category& ErrorCategory() noexcept {
  static const ErrorCategoryImpl category;
  return category;
}

std::error_code make_error_code(Errc e) noexcept {
  return {static_cast<int>(e), ErrorCategory()};
}

}
