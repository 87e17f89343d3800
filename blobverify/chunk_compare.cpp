#include "chunk_compare.hpp"

#include <cstdio>
#include <cstring>

#if defined(BLOBVERIFY_SIMD_AVX2)
  #include <immintrin.h>
#elif defined(BLOBVERIFY_SIMD_SSE2)
  #include <emmintrin.h>
#elif defined(BLOBVERIFY_SIMD_NEON)
  #include <arm_neon.h>
#endif

#include "errors.hpp"

namespace blobverify {

const char* to_string(CompareStrategy strategy) noexcept {
  switch (strategy) {
    case CompareStrategy::scalar: return "scalar";
    case CompareStrategy::simd:   return "simd";
  }
  return "unknown";
}

const char* simd_lane_backend() noexcept {
#if defined(BLOBVERIFY_SIMD_AVX2)
  return "avx2";
#elif defined(BLOBVERIFY_SIMD_SSE2)
  return "sse2";
#elif defined(BLOBVERIFY_SIMD_NEON)
  return "neon";
#else
  return "scalar";
#endif
}

bool equal_scalar(const std::uint8_t* a, const std::uint8_t* b, std::size_t size) noexcept {
  if (size == 0)
    return true;
  return std::memcmp(a, b, size) == 0;
}

namespace {
  // True when the 64-byte lane at a/b holds at least one differing byte
#if defined(BLOBVERIFY_SIMD_AVX2)
  inline bool lane_differs(const std::uint8_t* a, const std::uint8_t* b) noexcept {
    __m256i a0 = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(a));
    __m256i b0 = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(b));
    __m256i a1 = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(a + 32));
    __m256i b1 = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(b + 32));
    __m256i eq = _mm256_and_si256(_mm256_cmpeq_epi8(a0, b0), _mm256_cmpeq_epi8(a1, b1));
    // movemask has one bit per byte; all ones means every byte matched
    return static_cast<std::uint32_t>(_mm256_movemask_epi8(eq)) != 0xFFFFFFFFu;
  }
#elif defined(BLOBVERIFY_SIMD_SSE2)
  inline bool lane_differs(const std::uint8_t* a, const std::uint8_t* b) noexcept {
    __m128i eq = _mm_set1_epi8(static_cast<char>(0xFF));
    for (std::size_t i = 0; i < LANE_WIDTH; i += 16) {
      __m128i va = _mm_loadu_si128(reinterpret_cast<const __m128i*>(a + i));
      __m128i vb = _mm_loadu_si128(reinterpret_cast<const __m128i*>(b + i));
      eq = _mm_and_si128(eq, _mm_cmpeq_epi8(va, vb));
    }
    return _mm_movemask_epi8(eq) != 0xFFFF;
  }
#elif defined(BLOBVERIFY_SIMD_NEON)
  inline bool lane_differs(const std::uint8_t* a, const std::uint8_t* b) noexcept {
    uint8x16_t ne = vdupq_n_u8(0);
    for (std::size_t i = 0; i < LANE_WIDTH; i += 16) {
      ne = vorrq_u8(ne, veorq_u8(vld1q_u8(a + i), vld1q_u8(b + i)));
    }
    uint64x2_t folded = vreinterpretq_u64_u8(ne);
    return (vgetq_lane_u64(folded, 0) | vgetq_lane_u64(folded, 1)) != 0;
  }
#endif
}

bool equal_simd(const std::uint8_t* a, const std::uint8_t* b, std::size_t size) noexcept {
#if BLOBVERIFY_HAVE_SIMD
  std::size_t i = 0;
  for (; i + LANE_WIDTH <= size; i += LANE_WIDTH) {
    if (lane_differs(a + i, b + i))
      return false;
  }
  // Tail shorter than one lane
  return equal_scalar(a + i, b + i, size - i);
#else
  return equal_scalar(a, b, size);
#endif
}

bool ChunkComparator::compare(const ByteRange& a, const ByteRange& b) const {
  if (a.size != b.size) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "Chunk comparison of unequal ranges (0x%zX vs 0x%zX bytes)",
                  a.size, b.size);
    throw ConfigError(buf);
  }
  if (strategy_ == CompareStrategy::simd)
    return equal_simd(a.data, b.data, a.size);
  return equal_scalar(a.data, b.data, a.size);
}

}  // namespace blobverify
