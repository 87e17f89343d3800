#pragma once
// blobverify - find_corruptions.hpp
// Entry points: compare a reference blob against a candidate and return every
// chunk-aligned range where they differ.

#include <cstdint>
#include <string>

#include "byte_source.hpp"
#include "corruption.hpp"
#include "options.hpp"

namespace blobverify {

CorruptionReport find_corruptions(const std::string& reference, const std::string& candidate,
                                  std::uint64_t chunk_size);

CorruptionReport find_corruptions(const std::string& reference, const std::string& candidate,
                                  const CompareOptions& options);

// Sources must outlive the call. Unequal sizes follow options.length_policy:
// LengthMismatchError, or a trailing record from the last chunk boundary both
// blobs fully contain up to the end of the longer blob.
CorruptionReport find_corruptions(const ByteSource& reference, const ByteSource& candidate,
                                  const CompareOptions& options);

}  // namespace blobverify
