#include "run_merger.hpp"

#include <cstdio>
#include <utility>

#include "errors.hpp"

namespace blobverify {

void RunMerger::check_order(std::uint64_t offset) {
  if (offset < next_offset_) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "Out-of-order input at 0x%llX (expected >= 0x%llX)",
                  static_cast<unsigned long long>(offset),
                  static_cast<unsigned long long>(next_offset_));
    throw InternalError(buf);
  }
}

void RunMerger::add_chunk(std::uint64_t offset, std::uint64_t length, bool corrupted) {
  if (corrupted && length != 0) {
    add_record({offset, length});
    return;
  }
  check_order(offset);
  next_offset_ = offset + length;
}

void RunMerger::add_record(const CorruptionRecord& record) {
  if (record.length == 0)
    return;
  check_order(record.offset);
  if (has_open_) {
    if (open_.end() == record.offset) {
      open_.length += record.length;
      next_offset_ = open_.end();
      return;
    }
    report_.push_back(open_);
  }
  open_ = record;
  has_open_ = true;
  next_offset_ = record.end();
}

CorruptionReport RunMerger::finish() {
  if (has_open_)
    report_.push_back(open_);
  has_open_ = false;
  open_ = {0, 0};
  next_offset_ = 0;
  return std::exchange(report_, CorruptionReport{});
}

}  // namespace blobverify
