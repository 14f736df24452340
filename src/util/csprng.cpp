#include "util/csprng.hpp"

#include <cerrno>
#include <cstring>
#include <limits>

#include <fcntl.h>
#include <unistd.h>
#if defined(__linux__)
#include <sys/random.h>
#endif

namespace x1memo::util {

namespace {

class UrandomFile {
 public:
  UrandomFile() : fd_(::open("/dev/urandom", O_RDONLY | O_CLOEXEC)) {}
  ~UrandomFile() {
    if (fd_ >= 0) ::close(fd_);
  }
  UrandomFile(const UrandomFile&) = delete;
  UrandomFile& operator=(const UrandomFile&) = delete;

  int fd() const { return fd_; }

 private:
  int fd_;
};

bool ReadUrandom(std::span<std::uint8_t> out, std::size_t filled, std::string* error) {
  UrandomFile file;
  if (file.fd() < 0) {
    if (error) *error = std::string("open(/dev/urandom): ") + std::strerror(errno);
    return false;
  }
  while (filled < out.size()) {
    const ssize_t n = ::read(file.fd(), out.data() + filled, out.size() - filled);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) {
      if (error) {
        *error = n == 0 ? "/dev/urandom returned EOF"
                        : std::string("read(/dev/urandom): ") + std::strerror(errno);
      }
      return false;
    }
    filled += static_cast<std::size_t>(n);
  }
  return true;
}

bool RandomUint64(std::uint64_t* out, std::string* error) {
  std::uint8_t buffer[8] = {};
  if (!FillSecureRandomBytes(std::span<std::uint8_t>(buffer, sizeof(buffer)), error)) {
    return false;
  }
  std::uint64_t value = 0;
  for (std::uint8_t byte : buffer) {
    value = (value << 8) | byte;
  }
  *out = value;
  return true;
}

}  // namespace

bool FillSecureRandomBytes(std::span<std::uint8_t> out, std::string* error) {
  std::size_t filled = 0;
#if defined(__linux__)
  while (filled < out.size()) {
    const ssize_t n = getrandom(out.data() + filled, out.size() - filled, 0);
    if (n < 0) {
      if (errno == EINTR) continue;
      break;
    }
    filled += static_cast<std::size_t>(n);
  }
#endif
  if (filled == out.size()) {
    return true;
  }
  return ReadUrandom(out, filled, error);
}

bool SecureRandomBelow(std::uint64_t bound, std::uint64_t* out, std::string* error) {
  if (bound == 0 || out == nullptr) {
    if (error) *error = "random bound must be non-zero";
    return false;
  }
  // Rejection sampling keeps the result unbiased.
  const std::uint64_t limit =
      std::numeric_limits<std::uint64_t>::max() - std::numeric_limits<std::uint64_t>::max() % bound;
  std::uint64_t value = 0;
  do {
    if (!RandomUint64(&value, error)) return false;
  } while (value >= limit);
  *out = value % bound;
  return true;
}

bool SecureRandomPositiveId(std::uint64_t* out, std::string* error) {
  if (out == nullptr) {
    return false;
  }
  std::uint64_t value = 0;
  do {
    if (!RandomUint64(&value, error)) return false;
    value &= 0x7FFFFFFFFFFFFFFFULL;
  } while (value == 0);
  *out = value;
  return true;
}

}  // namespace x1memo::util
