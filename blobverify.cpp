// blobverify.cpp : Tool for locating corrupted regions in a binary blob against a trusted reference
//
// Both files are split into fixed-size chunks, compared chunk by chunk (in parallel work units),
// and every run of consecutive mismatching chunks is reported as one chunk-aligned region.
// Useful for checking copies pulled off flaky media or a network transfer against the trusted copy.

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <vector>

#include <cxxopts.hpp>

#include "blobverify/byte_source.hpp"
#include "blobverify/chunk_compare.hpp"
#include "blobverify/corruption.hpp"
#include "blobverify/errors.hpp"
#include "blobverify/find_corruptions.hpp"
#include "blobverify/options.hpp"

namespace {
  constexpr int EXIT_CLEAN = 0;
  constexpr int EXIT_CORRUPT = 1;
  constexpr int EXIT_ERROR = 2;

  constexpr int MAX_REGIONS_TO_PRINT = 1000;

  // Accepts decimal or 0x-prefixed hex, like the offsets printed below
  bool parse_u64(const std::string& text, uint64_t& out) {
    if (text.empty() || text[0] == '-')
      return false;
    errno = 0;
    char* end = nullptr;
    unsigned long long value = strtoull(text.c_str(), &end, 0);
    if (errno != 0 || end == text.c_str() || *end != '\0')
      return false;
    out = static_cast<uint64_t>(value);
    return true;
  }

  void print_region(int index, const blobverify::CorruptionRecord& record, uint64_t chunk_size,
                    bool show_chunks) {
    printf("Region %3d: CORRUPT @ 0x%08llX, Size: 0x%06llX",
           index, static_cast<unsigned long long>(record.offset),
           static_cast<unsigned long long>(record.length));
    if (show_chunks) {
      printf(" (chunks %llu-%llu)",
             static_cast<unsigned long long>(record.offset / chunk_size),
             static_cast<unsigned long long>((record.end() - 1) / chunk_size));
    }
    printf("\n");
  }
}

int main(int argc, char* argv[]) {
  cxxopts::Options options("blobverify", "Blob Corruption Verification Tool\n"
    "Compares a candidate blob against a trusted reference and lists every corrupted chunk range.\n");

  options.add_options()
    ("h,help", "Display this help message")
    ("v,verbose", "Verbose output - show configuration and SIMD backend")
    ("s,chunk-size", "Chunk size in bytes (decimal or hex, e.g. 0x400)", cxxopts::value<std::string>()->default_value("1024"))
    ("u,chunks-per-unit", "Chunks per parallel work unit", cxxopts::value<std::string>()->default_value("10240"))
    ("j,threads", "Worker threads (0 = all cores)", cxxopts::value<unsigned>()->default_value("0"))
    ("sequential", "Single-threaded scan over one work unit")
    ("scalar", "Byte-wise comparison instead of SIMD lanes")
    ("buffered", "Read files with pread instead of memory mapping")
    ("report-tail", "Report a length mismatch as a trailing corrupt region instead of failing")
    ("c,show-chunks", "Show chunk indices for each region")
    ("t,timing", "Show elapsed time and throughput")
    ("positional", "Reference and candidate files", cxxopts::value<std::vector<std::string>>());

  options.parse_positional({ "positional" });
  options.positional_help("<reference> <candidate>");

  cxxopts::ParseResult result;
  try {
    result = options.parse(argc, argv);
  } catch (const cxxopts::exceptions::exception& e) {
    printf("Error: %s\n", e.what());
    return EXIT_ERROR;
  }

  if (result.count("help") || !result.count("positional")) {
    printf("%s", options.help().c_str());
    return EXIT_CLEAN;
  }

  auto& positional = result["positional"].as<std::vector<std::string>>();
  if (positional.size() != 2) {
    printf("Error: Expected exactly two files: <reference> <candidate>\n");
    return EXIT_ERROR;
  }
  auto& reference_path = positional[0];
  auto& candidate_path = positional[1];

  bool verbose = result["v"].as<bool>();
  bool show_chunks = result["c"].as<bool>();
  bool timing = result["t"].as<bool>();

  blobverify::CompareOptions compare;
  if (!parse_u64(result["s"].as<std::string>(), compare.chunk_size)) {
    printf("Error: Invalid chunk size '%s'\n", result["s"].as<std::string>().c_str());
    return EXIT_ERROR;
  }
  if (!parse_u64(result["u"].as<std::string>(), compare.chunks_per_unit)) {
    printf("Error: Invalid chunks per unit '%s'\n", result["u"].as<std::string>().c_str());
    return EXIT_ERROR;
  }
  compare.threads = result["j"].as<unsigned>();
  if (result["sequential"].as<bool>())
    compare.mode = blobverify::ExecutionMode::sequential;
  if (result["scalar"].as<bool>())
    compare.strategy = blobverify::CompareStrategy::scalar;
  if (result["buffered"].as<bool>())
    compare.source = blobverify::SourceKind::buffered;
  if (result["report-tail"].as<bool>())
    compare.length_policy = blobverify::LengthPolicy::report_tail;

  printf("Blob Corruption Verification Tool\n");
  printf("=================================\n");
  printf("Reference: %s\n", reference_path.c_str());
  printf("Candidate: %s\n", candidate_path.c_str());
  printf("Chunk size: 0x%llX (%llu bytes)\n\n",
         static_cast<unsigned long long>(compare.chunk_size),
         static_cast<unsigned long long>(compare.chunk_size));

  blobverify::CorruptionReport report;
  std::chrono::steady_clock::duration elapsed{};
  uint64_t scanned_bytes = 0;
  try {
    blobverify::validate_options(compare);

    if (verbose) {
      printf("Configuration:\n");
      printf("  Work unit: 0x%llX bytes (%llu chunks)\n",
             static_cast<unsigned long long>(compare.work_unit_size()),
             static_cast<unsigned long long>(compare.chunks_per_unit));
      printf("  Mode: %s", blobverify::to_string(compare.mode));
      if (compare.mode == blobverify::ExecutionMode::parallel) {
        if (compare.threads > 0)
          printf(" (%u threads)", compare.threads);
        else
          printf(" (all cores)");
      }
      printf("\n");
      printf("  Comparison: %s", blobverify::to_string(compare.strategy));
      if (compare.strategy == blobverify::CompareStrategy::simd)
        printf(" (%s, %zu-byte lanes)", blobverify::simd_lane_backend(), blobverify::LANE_WIDTH);
      printf("\n");
      printf("  Source: %s\n", blobverify::to_string(compare.source));
      printf("  Length mismatch: %s\n\n", blobverify::to_string(compare.length_policy));
    }

    std::unique_ptr<blobverify::ByteSource> reference =
      blobverify::open_byte_source(reference_path, compare.source);
    std::unique_ptr<blobverify::ByteSource> candidate =
      blobverify::open_byte_source(candidate_path, compare.source);

    printf("Reference size: 0x%llX (%llu bytes)\n",
           static_cast<unsigned long long>(reference->size()),
           static_cast<unsigned long long>(reference->size()));
    printf("Candidate size: 0x%llX (%llu bytes)\n",
           static_cast<unsigned long long>(candidate->size()),
           static_cast<unsigned long long>(candidate->size()));
    printf("Blob spans %llu chunks\n\n",
           static_cast<unsigned long long>((reference->size() + compare.chunk_size - 1) / compare.chunk_size));
    scanned_bytes = reference->size() < candidate->size() ? reference->size() : candidate->size();

    auto start = std::chrono::steady_clock::now();
    report = blobverify::find_corruptions(*reference, *candidate, compare);
    elapsed = std::chrono::steady_clock::now() - start;
  } catch (const blobverify::VerifyError& e) {
    printf("Error: %s\n", e.what());
    if (e.kind() == blobverify::ErrorKind::length_mismatch)
      printf("       Use --report-tail to report the excess bytes as a corrupt region.\n");
    return EXIT_ERROR;
  } catch (const std::exception& e) {
    printf("Error: %s\n", e.what());
    return EXIT_ERROR;
  }

  printf("=== Corruption Scan ===\n\n");
  int index = 0;
  for (const auto& record : report) {
    if (index < MAX_REGIONS_TO_PRINT || verbose)
      print_region(index, record, compare.chunk_size, show_chunks);
    index++;
  }
  if (index > MAX_REGIONS_TO_PRINT && !verbose) {
    printf("  ... and %d more regions (use -v to list all)\n", index - MAX_REGIONS_TO_PRINT);
  }

  printf("\n=== Summary ===\n");
  printf("Corrupt regions: %zu\n", report.size());
  uint64_t bad_bytes = blobverify::corrupted_bytes(report);
  printf("Corrupt bytes: 0x%llX (%llu bytes, %llu chunks)\n",
         static_cast<unsigned long long>(bad_bytes), static_cast<unsigned long long>(bad_bytes),
         static_cast<unsigned long long>((bad_bytes + compare.chunk_size - 1) / compare.chunk_size));

  if (timing) {
    double seconds = std::chrono::duration<double>(elapsed).count();
    printf("Elapsed: %.3f s", seconds);
    if (seconds > 0.0)
      printf(" (%.1f MB/s)", static_cast<double>(scanned_bytes) / (1024.0 * 1024.0) / seconds);
    printf("\n");
  }

  if (!report.empty()) {
    printf("\n*** CORRUPTION DETECTED ***\n");
    printf("First corruption at:\n");
    printf("  File offset: 0x%08llX\n", static_cast<unsigned long long>(report.front().offset));
    printf("  Chunk: %llu\n", static_cast<unsigned long long>(report.front().offset / compare.chunk_size));
    return EXIT_CORRUPT;
  }

  printf("\n*** ALL CHUNKS MATCH ***\n");
  printf("Candidate is identical to the reference.\n");
  return EXIT_CLEAN;
}
