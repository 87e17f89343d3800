#pragma once
// blobverify - errors.hpp
// Exception hierarchy for comparison failures. Every fatal condition surfaces
// as a VerifyError; nothing is retried or downgraded to a partial report.

#include <cstdint>
#include <stdexcept>
#include <string>

namespace blobverify {

enum class ErrorKind : std::uint8_t {
  io,               // open/stat/map/read failure
  length_mismatch,  // blobs differ in total length
  config,           // invalid options or caller misuse
  internal          // broken ordering invariant
};

const char* to_string(ErrorKind kind) noexcept;

class VerifyError : public std::runtime_error {
 public:
  VerifyError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

class IoError : public VerifyError {
 public:
  // errno_value of 0 means the failure did not come from a syscall (e.g. short read)
  IoError(const std::string& path, const std::string& what, int errno_value);

  const std::string& path() const noexcept { return path_; }
  int error_number() const noexcept { return errno_; }

 private:
  std::string path_;
  int errno_;
};

class LengthMismatchError : public VerifyError {
 public:
  LengthMismatchError(std::uint64_t reference_size, std::uint64_t candidate_size);

  std::uint64_t reference_size() const noexcept { return reference_size_; }
  std::uint64_t candidate_size() const noexcept { return candidate_size_; }

 private:
  std::uint64_t reference_size_;
  std::uint64_t candidate_size_;
};

class ConfigError : public VerifyError {
 public:
  explicit ConfigError(const std::string& message)
      : VerifyError(ErrorKind::config, message) {}
};

class InternalError : public VerifyError {
 public:
  explicit InternalError(const std::string& message)
      : VerifyError(ErrorKind::internal, message) {}
};

}  // namespace blobverify
