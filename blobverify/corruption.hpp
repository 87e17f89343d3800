#pragma once
// blobverify - corruption.hpp
// Report types. A CorruptionReport is strictly increasing in offset and no two
// records touch: a.offset + a.length == b.offset never holds for neighbours.

#include <cstdint>
#include <string>
#include <vector>

namespace blobverify {

struct CorruptionRecord {
  std::uint64_t offset;  // chunk-aligned start
  std::uint64_t length;  // whole chunks, except a record ending at EOF

  std::uint64_t end() const { return offset + length; }

  bool operator==(const CorruptionRecord& other) const {
    return offset == other.offset && length == other.length;
  }
  bool operator!=(const CorruptionRecord& other) const { return !(*this == other); }
};

using CorruptionReport = std::vector<CorruptionRecord>;

// "0x%08llX +0x%llX"
std::string format_record(const CorruptionRecord& record);

// Total corrupted bytes across the report.
std::uint64_t corrupted_bytes(const CorruptionReport& report);

}  // namespace blobverify
