#include "codec.hpp"

namespace ttlcache {

std::error_code BufferCodec::Marshal(const Bytes& value, Bytes& out) {
  out = value;
  return {};
}

std::error_code BufferCodec::Marshal(const std::string& value, Bytes& out) {
  out.assign(value.begin(), value.end());
  return {};
}

std::error_code BufferCodec::Unmarshal(const Bytes& data, Bytes& result) {
  result.insert(result.end(), data.begin(), data.end());
  return {};
}

std::error_code BufferCodec::Unmarshal(const Bytes& data, std::string& result) {
  result.append(data.begin(), data.end());
  return {};
}

}
