#include "byte_source.hpp"

#include <cerrno>
#include <cstdio>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include "errors.hpp"

namespace blobverify {

const char* to_string(SourceKind kind) noexcept {
  switch (kind) {
    case SourceKind::mapped:   return "mapped";
    case SourceKind::buffered: return "buffered";
  }
  return "unknown";
}

namespace {
  int open_readonly(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0)
      throw IoError(path, "open", errno);
    return fd;
  }

  std::uint64_t file_size(int fd, const std::string& path) {
    struct stat st;
    if (::fstat(fd, &st) != 0) {
      int err = errno;
      ::close(fd);
      throw IoError(path, "stat", err);
    }
    if (!S_ISREG(st.st_mode)) {
      ::close(fd);
      throw IoError(path, "read non-regular file", 0);
    }
    return static_cast<std::uint64_t>(st.st_size);
  }
}

void ByteSource::check_range(std::uint64_t offset, std::size_t length) const {
  if (offset > size() || length > size() - offset) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "Range 0x%llX+0x%llX outside blob of 0x%llX bytes",
                  static_cast<unsigned long long>(offset),
                  static_cast<unsigned long long>(length),
                  static_cast<unsigned long long>(size()));
    throw ConfigError(std::string(buf) + " (" + path_ + ")");
  }
}

// ---------------------------------------------------------------------------
// MappedByteSource
// ---------------------------------------------------------------------------

MappedByteSource::MappedByteSource(const std::string& path) : ByteSource(path) {
  fd_ = open_readonly(path);
  size_ = file_size(fd_, path);

  // mmap rejects zero-length mappings; an empty blob is just an empty range
  if (size_ == 0)
    return;

  void* mapped = ::mmap(nullptr, size_, PROT_READ, MAP_SHARED, fd_, 0);
  if (mapped == MAP_FAILED) {
    int err = errno;
    ::close(fd_);
    throw IoError(path, "mmap", err);
  }
  data_ = static_cast<const std::uint8_t*>(mapped);

  if (int err = ::posix_madvise(mapped, size_, POSIX_MADV_SEQUENTIAL); err != 0) {
    ::munmap(mapped, size_);
    ::close(fd_);
    throw IoError(path, "madvise", err);
  }
}

MappedByteSource::~MappedByteSource() {
  if (data_ != nullptr)
    ::munmap(const_cast<std::uint8_t*>(data_), size_);
  if (fd_ != -1)
    ::close(fd_);
}

ByteRange MappedByteSource::view(std::uint64_t offset, std::size_t length,
                                 std::vector<std::uint8_t>& /*scratch*/) const {
  check_range(offset, length);
  if (length == 0)
    return {data_, 0};
  return {data_ + offset, length};
}

// ---------------------------------------------------------------------------
// BufferedByteSource
// ---------------------------------------------------------------------------

BufferedByteSource::BufferedByteSource(const std::string& path) : ByteSource(path) {
  fd_ = open_readonly(path);
  size_ = file_size(fd_, path);
  if (int err = ::posix_fadvise(fd_, 0, 0, POSIX_FADV_SEQUENTIAL); err != 0) {
    ::close(fd_);
    throw IoError(path, "fadvise", err);
  }
}

BufferedByteSource::~BufferedByteSource() {
  if (fd_ != -1)
    ::close(fd_);
}

ByteRange BufferedByteSource::view(std::uint64_t offset, std::size_t length,
                                   std::vector<std::uint8_t>& scratch) const {
  check_range(offset, length);
  if (scratch.size() < length)
    scratch.resize(length);

  std::size_t done = 0;
  while (done < length) {
    ssize_t got = ::pread(fd_, scratch.data() + done, length - done,
                          static_cast<off_t>(offset + done));
    if (got < 0) {
      if (errno == EINTR)
        continue;
      throw IoError(path(), "read", errno);
    }
    if (got == 0) {
      // File shrank underneath us
      char buf[96];
      std::snprintf(buf, sizeof(buf), "read 0x%llX bytes at 0x%llX from",
                    static_cast<unsigned long long>(length - done),
                    static_cast<unsigned long long>(offset + done));
      throw IoError(path(), buf, 0);
    }
    done += static_cast<std::size_t>(got);
  }
  return {scratch.data(), length};
}

std::unique_ptr<ByteSource> open_byte_source(const std::string& path, SourceKind kind) {
  switch (kind) {
    case SourceKind::mapped:   return std::make_unique<MappedByteSource>(path);
    case SourceKind::buffered: return std::make_unique<BufferedByteSource>(path);
  }
  throw ConfigError("Unknown source kind");
}

}  // namespace blobverify
