#pragma once
// blobverify - byte_source.hpp
// Read-only access to a blob's bytes.
//
// Precondition for every source: the underlying file is neither modified nor
// truncated while the source is alive. A mapped source reading a truncated
// file faults instead of reporting an error.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace blobverify {

struct ByteRange {
  const std::uint8_t* data;
  std::size_t size;
};

enum class SourceKind : std::uint8_t {
  mapped,    // mmap of the whole file
  buffered   // pread into caller-owned scratch buffers
};

const char* to_string(SourceKind kind) noexcept;

class ByteSource {
 public:
  virtual ~ByteSource() = default;

  ByteSource(const ByteSource&) = delete;
  ByteSource& operator=(const ByteSource&) = delete;

  virtual std::uint64_t size() const = 0;

  // Bytes [offset, offset + length). The returned range stays valid until the
  // next call with the same scratch buffer, or for the source's lifetime when
  // the source is mapped. Throws IoError on read failure and ConfigError if
  // the range lies outside the blob. Safe to call concurrently as long as each
  // caller passes its own scratch.
  virtual ByteRange view(std::uint64_t offset, std::size_t length,
                         std::vector<std::uint8_t>& scratch) const = 0;

  virtual SourceKind kind() const = 0;

  const std::string& path() const { return path_; }

 protected:
  explicit ByteSource(std::string path) : path_(std::move(path)) {}

  void check_range(std::uint64_t offset, std::size_t length) const;

 private:
  std::string path_;
};

class MappedByteSource final : public ByteSource {
 public:
  explicit MappedByteSource(const std::string& path);
  ~MappedByteSource() override;

  std::uint64_t size() const override { return size_; }
  ByteRange view(std::uint64_t offset, std::size_t length,
                 std::vector<std::uint8_t>& scratch) const override;
  SourceKind kind() const override { return SourceKind::mapped; }

 private:
  int fd_ = -1;
  const std::uint8_t* data_ = nullptr;
  std::uint64_t size_ = 0;
};

class BufferedByteSource final : public ByteSource {
 public:
  explicit BufferedByteSource(const std::string& path);
  ~BufferedByteSource() override;

  std::uint64_t size() const override { return size_; }
  ByteRange view(std::uint64_t offset, std::size_t length,
                 std::vector<std::uint8_t>& scratch) const override;
  SourceKind kind() const override { return SourceKind::buffered; }

 private:
  int fd_ = -1;
  std::uint64_t size_ = 0;
};

std::unique_ptr<ByteSource> open_byte_source(const std::string& path, SourceKind kind);

}  // namespace blobverify
