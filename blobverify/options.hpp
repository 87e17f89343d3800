#pragma once
// blobverify - options.hpp
// Knobs for one comparison. Defaults match the operational setup: 1 KiB
// chunks, 10240 chunks per work unit, SIMD lanes, all cores, mmap.

#include <cstdint>

#include "byte_source.hpp"
#include "chunk_compare.hpp"

namespace blobverify {

constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 1024;
constexpr std::uint64_t DEFAULT_CHUNKS_PER_UNIT = 10240;

enum class ExecutionMode : std::uint8_t {
  sequential,  // one work unit spanning the blob
  parallel     // work units dispatched to a TBB arena
};

enum class LengthPolicy : std::uint8_t {
  error,       // unequal lengths raise LengthMismatchError
  report_tail  // the excess tail becomes a trailing corruption record
};

const char* to_string(ExecutionMode mode) noexcept;
const char* to_string(LengthPolicy policy) noexcept;

struct CompareOptions {
  std::uint64_t chunk_size = DEFAULT_CHUNK_SIZE;
  std::uint64_t chunks_per_unit = DEFAULT_CHUNKS_PER_UNIT;
  CompareStrategy strategy = CompareStrategy::simd;
  ExecutionMode mode = ExecutionMode::parallel;
  unsigned threads = 0;  // 0 = TBB default
  SourceKind source = SourceKind::mapped;
  LengthPolicy length_policy = LengthPolicy::error;

  std::uint64_t work_unit_size() const { return chunk_size * chunks_per_unit; }
};

// Throws ConfigError for a zero chunk size, a zero unit size, a unit size
// that overflows 64 bits, or a thread count beyond INT_MAX.
void validate_options(const CompareOptions& options);

}  // namespace blobverify
