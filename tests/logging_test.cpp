#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "caption_suite/logging.hpp"

using namespace caption_suite;

TEST(TimingCollectorTest, FoldsRunsPerStage) {
  TimingCollector::clear();
  TimingCollector::record("generate", 1500000);
  TimingCollector::record("extract_frames", 200000);
  TimingCollector::record("generate", 500000);

  auto rows = TimingCollector::summary();
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].name, "extract_frames");
  EXPECT_EQ(rows[0].count, 1);
  EXPECT_EQ(rows[1].name, "generate");
  EXPECT_EQ(rows[1].count, 2);
  EXPECT_DOUBLE_EQ(rows[1].total_seconds(), 2.0);
  EXPECT_DOUBLE_EQ(rows[1].average_seconds(), 1.0);
}

TEST(TimingCollectorTest, ConcurrentRecordsAreAllCounted) {
  TimingCollector::clear();
  std::vector<std::thread> workers;
  for (int w = 0; w < 4; ++w) {
    workers.emplace_back([] {
      for (int i = 0; i < 250; ++i)
        TimingCollector::record("write_caption", 10);
    });
  }
  for (auto &t : workers)
    t.join();

  auto rows = TimingCollector::summary();
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].count, 1000);
  EXPECT_EQ(rows[0].total_us, 10000);
}

TEST(TimingCollectorTest, ClearDropsEverything) {
  TimingCollector::record("encode", 42);
  TimingCollector::clear();
  EXPECT_TRUE(TimingCollector::summary().empty());
}
