#include "errors.hpp"

#include <cstdio>
#include <cstring>

namespace blobverify {

const char* to_string(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::io:              return "io";
    case ErrorKind::length_mismatch: return "length_mismatch";
    case ErrorKind::config:          return "config";
    case ErrorKind::internal:        return "internal";
  }
  return "unknown";
}

namespace {
  std::string describe_io(const std::string& path, const std::string& what, int errno_value) {
    std::string msg = "Cannot " + what + " " + path;
    if (errno_value != 0) {
      msg += " (";
      msg += std::strerror(errno_value);
      msg += ", errno=" + std::to_string(errno_value) + ")";
    }
    return msg;
  }

  std::string describe_lengths(std::uint64_t reference_size, std::uint64_t candidate_size) {
    char buf[160];
    std::snprintf(buf, sizeof(buf),
                  "Length mismatch: reference is 0x%llX bytes, candidate is 0x%llX bytes",
                  static_cast<unsigned long long>(reference_size),
                  static_cast<unsigned long long>(candidate_size));
    return buf;
  }
}

IoError::IoError(const std::string& path, const std::string& what, int errno_value)
    : VerifyError(ErrorKind::io, describe_io(path, what, errno_value)),
      path_(path),
      errno_(errno_value) {}

LengthMismatchError::LengthMismatchError(std::uint64_t reference_size, std::uint64_t candidate_size)
    : VerifyError(ErrorKind::length_mismatch, describe_lengths(reference_size, candidate_size)),
      reference_size_(reference_size),
      candidate_size_(candidate_size) {}

}  // namespace blobverify
