#ifndef TTLCACHE_FILE_STORE_HPP
#define TTLCACHE_FILE_STORE_HPP

#include "slow_store.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>

namespace ttlcache {

/** Size of the per-file header: big-endian wall-clock expiry in milliseconds since the epoch. */
constexpr size_t fileHeaderSize = 8;

/**
 * Durable SlowStore keeping one file per key inside a directory.
 *
 * The file name is the hex encoding of the key, so keys are limited to half
 * the file system's name length and the empty key is rejected with
 * Errc::keyIsEmpty. A Set is written to a temporary file,
 * fsynced and renamed over the old one before it returns success. Expiry uses
 * the wall clock so it survives restarts; an expired file is unlinked the
 * next time Get reads it.
 */
class FileStore : public SlowStore {
  struct Passkey {};

 public:
  FileStore(Passkey, std::string dir, int dirFd);

  /** Opens directory \a dir, creating it if missing. Returns nullptr and sets \a ec on failure. */
  static std::unique_ptr<FileStore> New(const std::string& dir,
                                        std::error_code* ec = nullptr);

  FileStore(const FileStore&) = delete;
  FileStore& operator=(const FileStore&) = delete;

  /** Closes the directory handle. */
  ~FileStore() override;

  std::error_code Get(const Context& ctx, const std::string& key,
                      Bytes& value) override;

  std::error_code Set(const Context& ctx, const std::string& key,
                      const Bytes& value, Duration ttl) override;

  std::error_code TTL(const Context& ctx, const std::string& key,
                      Duration& ttl) override;

  std::error_code Delete(const Context& ctx, const std::string& key,
                         int64_t& count) override;

  /** Path of the file holding \a key. */
  std::string PathFor(const std::string& key) const;

 private:
  /** Reads the expiry header of the open file \a fd into \a expiresAtMs. */
  static std::error_code readHeader(int fd, int64_t& expiresAtMs);

  std::string dir_;
  int dirFd_;
  std::shared_mutex mu_;
};

}  // namespace ttlcache

#endif  // TTLCACHE_FILE_STORE_HPP
