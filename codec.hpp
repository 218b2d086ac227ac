#ifndef TTLCACHE_CODEC_HPP
#define TTLCACHE_CODEC_HPP

#include "errors.hpp"
#include "log.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <system_error>

namespace ttlcache {

/**
 * Default codec: JSON text through nlohmann::json. Works for any type with
 * to_json/from_json (standard containers, strings, arithmetic types and
 * structs declared with NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE).
 */
struct JsonCodec {
  template <typename T>
  static std::error_code Marshal(const T& value, Bytes& out) {
    try {
      std::string text = nlohmann::json(value).dump();
      out.assign(text.begin(), text.end());
    } catch (const nlohmann::json::exception& e) {
      Logger()->debug("json marshal failed: {}", e.what());
      return Errc::marshalFailed;
    }
    return {};
  }

  /** Parses \a data into \a result. Malformed text is Errc::unmarshalFailed; valid JSON of the wrong shape is Errc::invalidType. */
  template <typename T>
  static std::error_code Unmarshal(const Bytes& data, T& result) {
    nlohmann::json j = nlohmann::json::parse(data.begin(), data.end(), nullptr,
                                             /*allow_exceptions=*/false);
    if (j.is_discarded()) return Errc::unmarshalFailed;
    try {
      j.get_to(result);
    } catch (const nlohmann::json::exception& e) {
      Logger()->debug("json value does not fit the target type: {}", e.what());
      return Errc::invalidType;
    }
    return {};
  }
};

/** Pass-through codec for callers holding serialized data. Only Bytes and std::string are accepted; anything else is Errc::invalidType. Unmarshal appends to \a result like a write into a buffer. */
struct BufferCodec {
  static std::error_code Marshal(const Bytes& value, Bytes& out);
  static std::error_code Marshal(const std::string& value, Bytes& out);

  template <typename T>
  static std::error_code Marshal(const T&, Bytes&) {
    return Errc::invalidType;
  }

  static std::error_code Unmarshal(const Bytes& data, Bytes& result);
  static std::error_code Unmarshal(const Bytes& data, std::string& result);

  template <typename T>
  static std::error_code Unmarshal(const Bytes&, T&) {
    return Errc::invalidType;
  }
};

}  // namespace ttlcache

#endif  // TTLCACHE_CODEC_HPP
