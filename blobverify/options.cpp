#include "options.hpp"

#include <limits>
#include <string>

#include "errors.hpp"

namespace blobverify {

const char* to_string(ExecutionMode mode) noexcept {
  switch (mode) {
    case ExecutionMode::sequential: return "sequential";
    case ExecutionMode::parallel:   return "parallel";
  }
  return "unknown";
}

const char* to_string(LengthPolicy policy) noexcept {
  switch (policy) {
    case LengthPolicy::error:       return "error";
    case LengthPolicy::report_tail: return "report-tail";
  }
  return "unknown";
}

void validate_options(const CompareOptions& options) {
  if (options.chunk_size == 0)
    throw ConfigError("Chunk size must be greater than zero");
  if (options.chunks_per_unit == 0)
    throw ConfigError("Chunks per work unit must be greater than zero");
  if (options.chunks_per_unit > std::numeric_limits<std::uint64_t>::max() / options.chunk_size)
    throw ConfigError("Work unit size overflows 64 bits");
  if (options.threads > static_cast<unsigned>(std::numeric_limits<int>::max()))
    throw ConfigError("Thread count exceeds " + std::to_string(std::numeric_limits<int>::max()));
}

}  // namespace blobverify
