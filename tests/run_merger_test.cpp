#include <gtest/gtest.h>

#include "blobverify/errors.hpp"
#include "blobverify/run_merger.hpp"

using blobverify::CorruptionRecord;
using blobverify::CorruptionReport;
using blobverify::RunMerger;

TEST(RunMerger, CleanChunksProduceEmptyReport) {
  RunMerger merger;
  for (std::uint64_t i = 0; i < 8; ++i)
    merger.add_chunk(i * 1024, 1024, false);
  EXPECT_TRUE(merger.finish().empty());
}

TEST(RunMerger, ConsecutiveCorruptChunksMergeIntoOneRecord) {
  RunMerger merger;
  merger.add_chunk(0, 1024, false);
  merger.add_chunk(1024, 1024, true);
  merger.add_chunk(2048, 1024, true);
  merger.add_chunk(3072, 1024, true);
  merger.add_chunk(4096, 1024, false);

  CorruptionReport report = merger.finish();
  ASSERT_EQ(report.size(), 1u);
  EXPECT_EQ(report[0], (CorruptionRecord{1024, 3072}));
}

TEST(RunMerger, CleanChunkSplitsRuns) {
  RunMerger merger;
  merger.add_chunk(0, 512, true);
  merger.add_chunk(512, 512, false);
  merger.add_chunk(1024, 512, true);

  CorruptionReport report = merger.finish();
  ASSERT_EQ(report.size(), 2u);
  EXPECT_EQ(report[0], (CorruptionRecord{0, 512}));
  EXPECT_EQ(report[1], (CorruptionRecord{1024, 512}));
}

TEST(RunMerger, ShortFinalChunkExtendsOpenRecord) {
  RunMerger merger;
  merger.add_chunk(0, 1024, false);
  merger.add_chunk(1024, 1024, true);
  merger.add_chunk(2048, 100, true);

  CorruptionReport report = merger.finish();
  ASSERT_EQ(report.size(), 1u);
  EXPECT_EQ(report[0], (CorruptionRecord{1024, 1124}));
}

TEST(RunMerger, AdjacentRecordsFoldTogether) {
  RunMerger merger;
  merger.add_record({0, 2048});
  merger.add_record({2048, 1024});
  merger.add_record({8192, 1024});

  CorruptionReport report = merger.finish();
  ASSERT_EQ(report.size(), 2u);
  EXPECT_EQ(report[0], (CorruptionRecord{0, 3072}));
  EXPECT_EQ(report[1], (CorruptionRecord{8192, 1024}));
}

TEST(RunMerger, ZeroLengthRecordIsIgnored) {
  RunMerger merger;
  merger.add_record({4096, 0});
  EXPECT_FALSE(merger.has_open());
  EXPECT_TRUE(merger.finish().empty());
}

TEST(RunMerger, OutOfOrderInputThrows) {
  RunMerger merger;
  merger.add_chunk(4096, 1024, true);
  EXPECT_THROW(merger.add_chunk(1024, 1024, true), blobverify::InternalError);
}

TEST(RunMerger, OverlappingRecordThrows) {
  RunMerger merger;
  merger.add_record({0, 4096});
  EXPECT_THROW(merger.add_record({2048, 4096}), blobverify::InternalError);
}

TEST(RunMerger, FinishResetsForReuse) {
  RunMerger merger;
  merger.add_chunk(0, 1024, true);
  ASSERT_EQ(merger.finish().size(), 1u);

  merger.add_chunk(0, 1024, true);
  CorruptionReport again = merger.finish();
  ASSERT_EQ(again.size(), 1u);
  EXPECT_EQ(again[0], (CorruptionRecord{0, 1024}));
}
