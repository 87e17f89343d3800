#include "find_corruptions.hpp"

#include <algorithm>
#include <memory>

#include "errors.hpp"
#include "partition.hpp"
#include "run_merger.hpp"

namespace blobverify {

CorruptionReport find_corruptions(const std::string& reference, const std::string& candidate,
                                  std::uint64_t chunk_size) {
  CompareOptions options;
  options.chunk_size = chunk_size;
  return find_corruptions(reference, candidate, options);
}

CorruptionReport find_corruptions(const std::string& reference, const std::string& candidate,
                                  const CompareOptions& options) {
  // Reject bad configuration before touching the filesystem
  validate_options(options);

  std::unique_ptr<ByteSource> ref = open_byte_source(reference, options.source);
  std::unique_ptr<ByteSource> cand = open_byte_source(candidate, options.source);
  return find_corruptions(*ref, *cand, options);
}

CorruptionReport find_corruptions(const ByteSource& reference, const ByteSource& candidate,
                                  const CompareOptions& options) {
  PartitionScheduler scheduler(options);

  const std::uint64_t ref_size = reference.size();
  const std::uint64_t cand_size = candidate.size();
  if (ref_size == cand_size)
    return scheduler.run(reference, candidate, ref_size);

  if (options.length_policy == LengthPolicy::error)
    throw LengthMismatchError(ref_size, cand_size);

  const std::uint64_t shorter = std::min(ref_size, cand_size);
  const std::uint64_t longer = std::max(ref_size, cand_size);
  const std::uint64_t aligned = shorter / options.chunk_size * options.chunk_size;

  RunMerger merger;
  for (const auto& record : scheduler.run(reference, candidate, aligned))
    merger.add_record(record);
  merger.add_record({aligned, longer - aligned});
  return merger.finish();
}

}  // namespace blobverify
