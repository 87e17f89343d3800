#include <gtest/gtest.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "blob_fixture.hpp"
#include "blobverify/byte_source.hpp"
#include "blobverify/errors.hpp"

#include <unistd.h>

using namespace blobverify;
using blobverify_test::TempDir;
using blobverify_test::make_pattern;

class ByteSourceTest : public ::testing::TestWithParam<SourceKind> {};

TEST_P(ByteSourceTest, ReportsSizeAndServesRanges) {
  TempDir dir;
  std::vector<std::uint8_t> bytes = make_pattern(10000);
  std::string path = dir.write("blob.bin", bytes);

  auto source = open_byte_source(path, GetParam());
  EXPECT_EQ(source->kind(), GetParam());
  EXPECT_EQ(source->path(), path);
  ASSERT_EQ(source->size(), 10000u);

  std::vector<std::uint8_t> scratch;
  ByteRange head = source->view(0, 16, scratch);
  ASSERT_EQ(head.size, 16u);
  EXPECT_EQ(std::memcmp(head.data, bytes.data(), 16), 0);

  ByteRange tail = source->view(9000, 1000, scratch);
  ASSERT_EQ(tail.size, 1000u);
  EXPECT_EQ(std::memcmp(tail.data, bytes.data() + 9000, 1000), 0);
}

TEST_P(ByteSourceTest, EmptyFileHasZeroSize) {
  TempDir dir;
  std::string path = dir.write("empty.bin", {});

  auto source = open_byte_source(path, GetParam());
  EXPECT_EQ(source->size(), 0u);
  std::vector<std::uint8_t> scratch;
  EXPECT_EQ(source->view(0, 0, scratch).size, 0u);
}

TEST_P(ByteSourceTest, RangePastEndIsRejected) {
  TempDir dir;
  std::string path = dir.write("blob.bin", make_pattern(100));

  auto source = open_byte_source(path, GetParam());
  std::vector<std::uint8_t> scratch;
  EXPECT_THROW(source->view(90, 20, scratch), ConfigError);
  EXPECT_THROW(source->view(101, 0, scratch), ConfigError);
}

TEST_P(ByteSourceTest, MissingFileRaisesIoError) {
  TempDir dir;
  try {
    open_byte_source(dir.file("does-not-exist.bin"), GetParam());
    FAIL() << "expected IoError";
  } catch (const IoError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::io);
    EXPECT_EQ(e.error_number(), ENOENT);
    EXPECT_NE(std::string(e.what()).find("does-not-exist.bin"), std::string::npos);
  }
}

TEST_P(ByteSourceTest, DirectoryIsRejected) {
  TempDir dir;
  std::string path = dir.write("blob.bin", make_pattern(8));
  std::string parent = path.substr(0, path.rfind('/'));
  EXPECT_THROW(open_byte_source(parent, GetParam()), IoError);
}

INSTANTIATE_TEST_SUITE_P(Kinds, ByteSourceTest,
                         ::testing::Values(SourceKind::mapped, SourceKind::buffered),
                         [](const ::testing::TestParamInfo<SourceKind>& info) {
                           return std::string(to_string(info.param));
                         });

TEST(BufferedByteSource, ReusesCallerScratch) {
  TempDir dir;
  std::vector<std::uint8_t> bytes = make_pattern(4096);
  BufferedByteSource source(dir.write("blob.bin", bytes));

  std::vector<std::uint8_t> scratch;
  ByteRange first = source.view(0, 4096, scratch);
  EXPECT_EQ(first.data, scratch.data());
  ByteRange second = source.view(1024, 512, scratch);
  EXPECT_EQ(second.data, scratch.data());
  EXPECT_EQ(std::memcmp(second.data, bytes.data() + 1024, 512), 0);
}

TEST(BufferedByteSource, FileShrunkAfterOpenRaisesIoError) {
  TempDir dir;
  std::string path = dir.write("blob.bin", make_pattern(8192));
  BufferedByteSource source(path);
  ASSERT_EQ(source.size(), 8192u);

  ASSERT_EQ(::truncate(path.c_str(), 4096), 0);

  std::vector<std::uint8_t> scratch;
  EXPECT_EQ(source.view(0, 4096, scratch).size, 4096u);
  try {
    source.view(0, 8192, scratch);
    FAIL() << "expected IoError";
  } catch (const IoError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::io);
    EXPECT_EQ(e.path(), path);
  }
}

TEST(MappedByteSource, ViewsPointIntoMapping) {
  TempDir dir;
  MappedByteSource source(dir.write("blob.bin", make_pattern(4096)));

  std::vector<std::uint8_t> scratch;
  ByteRange a = source.view(0, 64, scratch);
  ByteRange b = source.view(64, 64, scratch);
  EXPECT_EQ(a.data + 64, b.data);
  EXPECT_TRUE(scratch.empty());
}
