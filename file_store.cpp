#include "file_store.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <limits>
#include <mutex>
#include <sys/stat.h>
#include <unistd.h>

namespace ttlcache {

namespace {

std::error_code lastError() { return {errno, std::generic_category()}; }

int64_t nowMs() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch())
      .count();
}

std::error_code preadFull(int fd, uint8_t* buf, size_t len, off_t off) {
  size_t done = 0;
  while (done < len) {
    ssize_t n = pread(fd, buf + done, len - done, off + static_cast<off_t>(done));
    if (n < 0) {
      if (errno == EINTR) continue;
      return lastError();
    }
    if (n == 0) return std::make_error_code(std::errc::io_error);
    done += static_cast<size_t>(n);
  }
  return {};
}

std::error_code pwriteFull(int fd, const uint8_t* buf, size_t len, off_t off) {
  size_t done = 0;
  while (done < len) {
    ssize_t n =
        pwrite(fd, buf + done, len - done, off + static_cast<off_t>(done));
    if (n < 0) {
      if (errno == EINTR) continue;
      return lastError();
    }
    done += static_cast<size_t>(n);
  }
  return {};
}

/** Closes the descriptor on scope exit. */
struct FdGuard {
  explicit FdGuard(int f) : fd(f) {}
  ~FdGuard() {
    if (fd >= 0) close(fd);
  }
  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;
  int fd;
};

std::string hexEncode(const std::string& s) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(s.size() * 2);
  for (unsigned char c : s) {
    out.push_back(digits[c >> 4]);
    out.push_back(digits[c & 0x0f]);
  }
  return out;
}

}  // namespace

std::unique_ptr<FileStore> FileStore::New(const std::string& dir,
                                          std::error_code* ec) {
  if (mkdir(dir.c_str(), 0700) < 0 && errno != EEXIST) {
    auto err = lastError();
    Logger()->error("cannot create store directory {}: {}", dir, err.message());
    if (ec) *ec = err;
    return nullptr;
  }
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0) {
    auto err = lastError();
    Logger()->error("cannot open store directory {}: {}", dir, err.message());
    if (ec) *ec = err;
    return nullptr;
  }
  if (ec) ec->clear();
  return std::make_unique<FileStore>(Passkey{}, dir, fd);
}

FileStore::FileStore(Passkey, std::string dir, int dirFd)
    : dir_(std::move(dir)), dirFd_(dirFd) {}

FileStore::~FileStore() {
  if (dirFd_ >= 0) close(dirFd_);
}

std::string FileStore::PathFor(const std::string& key) const {
  return dir_ + "/" + hexEncode(key);
}

std::error_code FileStore::readHeader(int fd, int64_t& expiresAtMs) {
  uint8_t hdr[fileHeaderSize];
  if (auto err = preadFull(fd, hdr, fileHeaderSize, 0)) return err;
  uint64_t v = 0;
  for (size_t i = 0; i < fileHeaderSize; ++i) v = (v << 8) | hdr[i];
  expiresAtMs = static_cast<int64_t>(v);
  return {};
}

std::error_code FileStore::Get(const Context& ctx, const std::string& key,
                               Bytes& value) {
  if (auto err = ctx.Err()) return err;
  if (key.empty()) return Errc::keyIsEmpty;
  std::string path = PathFor(key);

  std::shared_lock<std::shared_mutex> lock(mu_);
  FdGuard f(open(path.c_str(), O_RDONLY));
  if (f.fd < 0) {
    if (errno == ENOENT) return Errc::notFound;
    return lastError();
  }

  struct stat st;
  if (fstat(f.fd, &st) < 0) return lastError();
  int64_t expiresAtMs = 0;
  if (auto err = readHeader(f.fd, expiresAtMs)) {
    Logger()->error("corrupt store file {}: {}", path, err.message());
    return err;
  }
  if (expiresAtMs < nowMs()) {
    if (unlink(path.c_str()) < 0 && errno != ENOENT) {
      Logger()->error("cannot remove expired file {}: {}", path,
                      lastError().message());
    }
    return Errc::notFound;
  }

  Bytes buf(static_cast<size_t>(st.st_size) - fileHeaderSize);
  if (!buf.empty()) {
    if (auto err = preadFull(f.fd, buf.data(), buf.size(),
                             static_cast<off_t>(fileHeaderSize))) {
      return err;
    }
  }
  value = std::move(buf);
  return {};
}

std::error_code FileStore::Set(const Context& ctx, const std::string& key,
                               const Bytes& value, Duration ttl) {
  if (auto err = ctx.Err()) return err;
  if (key.empty()) return Errc::keyIsEmpty;
  if (ttl <= Duration::zero()) return Errc::invalidTtl;

  std::string path = PathFor(key);
  std::string tmp = path + "." + std::to_string(getpid()) + ".tmp";
  int64_t ttlMs =
      std::chrono::duration_cast<std::chrono::milliseconds>(ttl).count();
  int64_t now = nowMs();
  int64_t expiresAtMs = ttlMs > std::numeric_limits<int64_t>::max() - now
                            ? std::numeric_limits<int64_t>::max()
                            : now + ttlMs;

  Bytes buf(fileHeaderSize + value.size());
  uint64_t v = static_cast<uint64_t>(expiresAtMs);
  for (size_t i = 0; i < fileHeaderSize; ++i) {
    buf[fileHeaderSize - 1 - i] = static_cast<uint8_t>(v & 0xff);
    v >>= 8;
  }
  std::copy(value.begin(), value.end(), buf.begin() + fileHeaderSize);

  std::unique_lock<std::shared_mutex> lock(mu_);
  {
    FdGuard f(open(tmp.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0600));
    if (f.fd < 0) {
      auto err = lastError();
      Logger()->error("cannot create {}: {}", tmp, err.message());
      return err;
    }
    std::error_code err = pwriteFull(f.fd, buf.data(), buf.size(), 0);
    if (!err && fsync(f.fd) < 0) err = lastError();
    if (err) {
      Logger()->error("write to {} failed: {}", tmp, err.message());
      unlink(tmp.c_str());
      return err;
    }
  }

  if (auto err = ctx.Err()) {
    unlink(tmp.c_str());
    return err;
  }
  if (rename(tmp.c_str(), path.c_str()) < 0) {
    auto err = lastError();
    Logger()->error("rename {} failed: {}", tmp, err.message());
    unlink(tmp.c_str());
    return err;
  }
  if (fsync(dirFd_) < 0) {
    auto err = lastError();
    Logger()->error("fsync of {} failed: {}", dir_, err.message());
    return err;
  }
  return {};
}

std::error_code FileStore::TTL(const Context& ctx, const std::string& key,
                               Duration& ttl) {
  if (auto err = ctx.Err()) return err;
  if (key.empty()) return Errc::keyIsEmpty;
  std::string path = PathFor(key);

  std::shared_lock<std::shared_mutex> lock(mu_);
  FdGuard f(open(path.c_str(), O_RDONLY));
  if (f.fd < 0) {
    if (errno == ENOENT) {
      ttl = ttlAbsent;
      return {};
    }
    return lastError();
  }
  int64_t expiresAtMs = 0;
  if (auto err = readHeader(f.fd, expiresAtMs)) return err;
  int64_t remaining = expiresAtMs - nowMs();
  if (remaining < 0) {
    ttl = ttlAbsent;
    return {};
  }
  auto maxMs =
      std::chrono::duration_cast<std::chrono::milliseconds>(Duration::max());
  ttl = remaining > maxMs.count()
            ? Duration::max()
            : std::chrono::duration_cast<Duration>(
                  std::chrono::milliseconds(remaining));
  return {};
}

std::error_code FileStore::Delete(const Context& ctx, const std::string& key,
                                  int64_t& count) {
  if (auto err = ctx.Err()) return err;
  if (key.empty()) return Errc::keyIsEmpty;
  std::string path = PathFor(key);

  std::unique_lock<std::shared_mutex> lock(mu_);
  if (unlink(path.c_str()) < 0) {
    if (errno == ENOENT) {
      count = 0;
      return {};
    }
    return lastError();
  }
  count = 1;
  return {};
}

}
