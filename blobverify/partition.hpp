#pragma once
// blobverify - partition.hpp
// Splits a blob pair into ordered work units, scans each independently and
// stitches the partial reports back together in unit order.

#include <cstddef>
#include <cstdint>
#include <vector>

#include "byte_source.hpp"
#include "chunk_compare.hpp"
#include "corruption.hpp"
#include "options.hpp"

namespace blobverify {

struct WorkUnit {
  std::size_t index;
  std::uint64_t offset;
  std::uint64_t length;
};

// Bytes read per view when scanning; rounded down to whole chunks, never
// smaller than one chunk.
constexpr std::uint64_t READ_WINDOW = 4 * 1024 * 1024;

// Ordered, non-overlapping units covering [0, length). All units except the
// last are exactly unit_size bytes.
std::vector<WorkUnit> plan_work_units(std::uint64_t length, std::uint64_t unit_size);

// Chunk-by-chunk scan of one unit through a local RunMerger. Scratch buffers
// belong to the calling worker.
CorruptionReport scan_work_unit(const ByteSource& reference, const ByteSource& candidate,
                                const WorkUnit& unit, std::uint64_t chunk_size,
                                const ChunkComparator& comparator,
                                std::vector<std::uint8_t>& reference_scratch,
                                std::vector<std::uint8_t>& candidate_scratch);

// Left fold over partials in unit order. The last record of one unit and the
// first record of the next merge when they touch.
CorruptionReport merge_partials(const std::vector<CorruptionReport>& partials);

class PartitionScheduler {
 public:
  explicit PartitionScheduler(const CompareOptions& options);

  // Compares [0, length) of both sources. length must not exceed either
  // source's size. Any failure aborts the whole scan.
  CorruptionReport run(const ByteSource& reference, const ByteSource& candidate,
                       std::uint64_t length) const;

  std::vector<WorkUnit> plan(std::uint64_t length) const;

 private:
  CorruptionReport run_parallel(const ByteSource& reference, const ByteSource& candidate,
                                const std::vector<WorkUnit>& units) const;

  CompareOptions options_;
  ChunkComparator comparator_;
};

}  // namespace blobverify
