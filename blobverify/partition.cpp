#include "partition.hpp"

#include <algorithm>
#include <cstdio>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include "errors.hpp"
#include "run_merger.hpp"

namespace blobverify {

std::vector<WorkUnit> plan_work_units(std::uint64_t length, std::uint64_t unit_size) {
  if (unit_size == 0)
    throw ConfigError("Work unit size must be greater than zero");

  std::vector<WorkUnit> units;
  if (length == 0)
    return units;
  units.reserve(static_cast<std::size_t>((length + unit_size - 1) / unit_size));

  std::uint64_t offset = 0;
  while (offset < length) {
    std::uint64_t unit_length = std::min(unit_size, length - offset);
    units.push_back({units.size(), offset, unit_length});
    offset += unit_length;
  }
  return units;
}

CorruptionReport scan_work_unit(const ByteSource& reference, const ByteSource& candidate,
                                const WorkUnit& unit, std::uint64_t chunk_size,
                                const ChunkComparator& comparator,
                                std::vector<std::uint8_t>& reference_scratch,
                                std::vector<std::uint8_t>& candidate_scratch) {
  const std::uint64_t window = std::max(chunk_size, READ_WINDOW / chunk_size * chunk_size);
  const std::uint64_t unit_end = unit.offset + unit.length;

  RunMerger merger;
  for (std::uint64_t window_start = unit.offset; window_start < unit_end; window_start += window) {
    auto window_length = static_cast<std::size_t>(std::min(window, unit_end - window_start));
    ByteRange ref = reference.view(window_start, window_length, reference_scratch);
    ByteRange cand = candidate.view(window_start, window_length, candidate_scratch);

    for (std::size_t pos = 0; pos < window_length; pos += chunk_size) {
      auto chunk_length = static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size, window_length - pos));
      bool equal = comparator.compare({ref.data + pos, chunk_length}, {cand.data + pos, chunk_length});
      merger.add_chunk(window_start + pos, chunk_length, !equal);
    }
  }
  return merger.finish();
}

CorruptionReport merge_partials(const std::vector<CorruptionReport>& partials) {
  RunMerger merger;
  for (const auto& partial : partials) {
    for (const auto& record : partial)
      merger.add_record(record);
  }
  return merger.finish();
}

PartitionScheduler::PartitionScheduler(const CompareOptions& options)
    : options_(options), comparator_(options.strategy) {
  validate_options(options_);
}

std::vector<WorkUnit> PartitionScheduler::plan(std::uint64_t length) const {
  if (options_.mode == ExecutionMode::sequential)
    return plan_work_units(length, std::max<std::uint64_t>(length, 1));
  return plan_work_units(length, options_.work_unit_size());
}

CorruptionReport PartitionScheduler::run(const ByteSource& reference, const ByteSource& candidate,
                                         std::uint64_t length) const {
  if (length > reference.size() || length > candidate.size()) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "Scan length 0x%llX exceeds blob size",
                  static_cast<unsigned long long>(length));
    throw ConfigError(buf);
  }

  std::vector<WorkUnit> units = plan(length);
  if (options_.mode == ExecutionMode::parallel && units.size() > 1)
    return run_parallel(reference, candidate, units);

  std::vector<std::uint8_t> reference_scratch;
  std::vector<std::uint8_t> candidate_scratch;
  std::vector<CorruptionReport> partials;
  partials.reserve(units.size());
  for (const auto& unit : units) {
    partials.push_back(scan_work_unit(reference, candidate, unit, options_.chunk_size,
                                      comparator_, reference_scratch, candidate_scratch));
  }
  return merge_partials(partials);
}

CorruptionReport PartitionScheduler::run_parallel(const ByteSource& reference, const ByteSource& candidate,
                                                  const std::vector<WorkUnit>& units) const {
  // Each task writes only its own slot; completion order does not matter
  std::vector<CorruptionReport> partials(units.size());

  auto scan_units = [&](const tbb::blocked_range<std::size_t>& range) {
    std::vector<std::uint8_t> reference_scratch;
    std::vector<std::uint8_t> candidate_scratch;
    for (std::size_t i = range.begin(); i != range.end(); ++i) {
      partials[i] = scan_work_unit(reference, candidate, units[i], options_.chunk_size,
                                   comparator_, reference_scratch, candidate_scratch);
    }
  };

  const int concurrency = options_.threads > 0 ? static_cast<int>(options_.threads)
                                               : tbb::task_arena::automatic;
  tbb::task_arena arena(concurrency);
  // A throwing unit cancels the rest; the exception resurfaces here
  arena.execute([&]() {
    tbb::parallel_for(tbb::blocked_range<std::size_t>(0, units.size(), 1), scan_units);
  });

  return merge_partials(partials);
}

}  // namespace blobverify
