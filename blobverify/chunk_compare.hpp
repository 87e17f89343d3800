#pragma once
// blobverify - chunk_compare.hpp
// Equality of two equal-length byte ranges, byte-wise or in SIMD lanes.
// Both strategies return the same verdict for every input.

#include <cstddef>
#include <cstdint>

#include "byte_source.hpp"

// Vector unit picked from the compiler's target macros
#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
  #define BLOBVERIFY_ARCH_X86 1
  #if defined(__AVX2__)
    #define BLOBVERIFY_SIMD_AVX2 1
  #elif defined(__SSE2__) || defined(_M_X64)
    #define BLOBVERIFY_SIMD_SSE2 1
  #endif
#elif defined(__aarch64__) || defined(__ARM_NEON) || defined(__ARM_NEON__)
  #define BLOBVERIFY_ARCH_ARM 1
  #if defined(__ARM_NEON) || defined(__ARM_NEON__) || defined(__aarch64__)
    #define BLOBVERIFY_SIMD_NEON 1
  #endif
#endif

#if defined(BLOBVERIFY_SIMD_AVX2) || defined(BLOBVERIFY_SIMD_SSE2) || defined(BLOBVERIFY_SIMD_NEON)
  #define BLOBVERIFY_HAVE_SIMD 1
#else
  #define BLOBVERIFY_HAVE_SIMD 0
#endif

namespace blobverify {

// Bytes compared per SIMD lane
constexpr std::size_t LANE_WIDTH = 64;

enum class CompareStrategy : std::uint8_t {
  scalar,
  simd
};

const char* to_string(CompareStrategy strategy) noexcept;

// "avx2", "sse2", "neon" or "scalar" when no vector unit is targeted
const char* simd_lane_backend() noexcept;

bool equal_scalar(const std::uint8_t* a, const std::uint8_t* b, std::size_t size) noexcept;
bool equal_simd(const std::uint8_t* a, const std::uint8_t* b, std::size_t size) noexcept;

class ChunkComparator {
 public:
  explicit ChunkComparator(CompareStrategy strategy = CompareStrategy::simd)
      : strategy_(strategy) {}

  // Throws ConfigError when the ranges differ in length.
  bool compare(const ByteRange& a, const ByteRange& b) const;

  CompareStrategy strategy() const { return strategy_; }

 private:
  CompareStrategy strategy_;
};

}  // namespace blobverify
