#include "corruption.hpp"

#include <cstdio>

namespace blobverify {

std::string format_record(const CorruptionRecord& record) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "0x%08llX +0x%llX",
                static_cast<unsigned long long>(record.offset),
                static_cast<unsigned long long>(record.length));
  return buf;
}

std::uint64_t corrupted_bytes(const CorruptionReport& report) {
  std::uint64_t total = 0;
  for (const auto& record : report)
    total += record.length;
  return total;
}

}  // namespace blobverify
