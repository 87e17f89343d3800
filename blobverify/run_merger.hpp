#pragma once
// blobverify - run_merger.hpp
// Left-to-right fold of chunk verdicts into maximal corruption runs.

#include <cstdint>

#include "corruption.hpp"

namespace blobverify {

class RunMerger {
 public:
  RunMerger() = default;

  // Feed one chunk verdict. Offsets must be strictly increasing and must not
  // fall inside a previously fed chunk.
  void add_chunk(std::uint64_t offset, std::uint64_t length, bool corrupted);

  // Fold an already merged record; extends the open record when it starts
  // exactly where the open record ends.
  void add_record(const CorruptionRecord& record);

  // Finalize any open record and hand the report over. The merger is empty
  // afterwards and can be reused.
  CorruptionReport finish();

  bool has_open() const { return has_open_; }

 private:
  void check_order(std::uint64_t offset);

  CorruptionReport report_;
  CorruptionRecord open_{0, 0};
  bool has_open_ = false;
  std::uint64_t next_offset_ = 0;  // first offset not yet covered by fed input
};

}  // namespace blobverify
