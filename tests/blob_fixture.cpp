#include "blob_fixture.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>

#include <unistd.h>

#include "blobverify/errors.hpp"

namespace fs = std::filesystem;

namespace blobverify_test {

void expect_well_formed(const blobverify::CorruptionReport& report, std::uint64_t chunk_size,
                        std::uint64_t blob_size) {
  for (std::size_t i = 0; i < report.size(); ++i) {
    const auto& r = report[i];
    EXPECT_GT(r.length, 0u) << "empty record at " << i;
    EXPECT_EQ(r.offset % chunk_size, 0u) << "unaligned offset at " << i;
    EXPECT_LE(r.end(), blob_size) << "record past EOF at " << i;
    if (r.end() != blob_size)
      EXPECT_EQ(r.length % chunk_size, 0u) << "partial-chunk length at " << i;
    if (i > 0) {
      EXPECT_LT(report[i - 1].end(), r.offset) << "records " << i - 1 << " and " << i
                                               << " touch or overlap";
    }
  }
}

TempDir::TempDir() {
  static std::atomic<int> counter{0};
  fs::path base = fs::temp_directory_path();
  path_ = (base / ("blobverify_test_" + std::to_string(::getpid()) + "_" +
                   std::to_string(++counter))).string();
  fs::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  fs::remove_all(path_, ec);
}

std::string TempDir::file(const std::string& name) const {
  return (fs::path(path_) / name).string();
}

std::string TempDir::write(const std::string& name, const std::vector<std::uint8_t>& bytes) const {
  std::string path = file(name);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  out.close();
  if (!out)
    throw std::runtime_error("Cannot write fixture " + path);
  return path;
}

MemoryByteSource::MemoryByteSource(std::string name, std::vector<std::uint8_t> bytes,
                                   std::uint64_t fail_at)
    : ByteSource(std::move(name)), bytes_(std::move(bytes)), fail_at_(fail_at) {}

blobverify::ByteRange MemoryByteSource::view(std::uint64_t offset, std::size_t length,
                                             std::vector<std::uint8_t>& /*scratch*/) const {
  check_range(offset, length);
  if (offset + length > fail_at_)
    throw blobverify::IoError(path(), "read", EIO);
  return {bytes_.data() + offset, length};
}

}  // namespace blobverify_test
