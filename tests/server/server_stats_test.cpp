/**
 * @file server_stats_test.cpp
 * @brief Unit tests for ServerStats
 */

#include <gtest/gtest.h>

#include <chrono>
#include <ctime>
#include <memory>
#include <thread>
#include <vector>

#include "server/server_types.h"

using namespace finrag::server;

/**
 * @brief Test fixture for ServerStats tests
 */
class ServerStatsTest : public ::testing::Test {
 protected:
  void SetUp() override { stats_ = std::make_unique<ServerStats>(); }

  std::unique_ptr<ServerStats> stats_;
};

/**
 * @brief Test that statistics counters are initialized to zero
 */
TEST_F(ServerStatsTest, InitializedToZero) {
  EXPECT_EQ(stats_->total_requests, 0);
  EXPECT_EQ(stats_->failed_requests, 0);
  EXPECT_EQ(stats_->query_requests, 0);
  EXPECT_EQ(stats_->search_requests, 0);
  EXPECT_EQ(stats_->similar_requests, 0);
  EXPECT_EQ(stats_->chunk_requests, 0);
  EXPECT_EQ(stats_->info_requests, 0);
  EXPECT_EQ(stats_->broadened_queries, 0);
}

/**
 * @brief Test start time is reasonable
 */
TEST_F(ServerStatsTest, StartTimeReasonable) {
  uint64_t now = static_cast<uint64_t>(std::time(nullptr));
  EXPECT_LE(stats_->start_time, now);
  EXPECT_GT(stats_->start_time, now - 10);  // Should be within last 10 seconds
}

/**
 * @brief Test uptime calculation
 */
TEST_F(ServerStatsTest, UptimeCalculation) {
  uint64_t uptime1 = stats_->GetUptimeSeconds();
  EXPECT_LE(uptime1, 1);

  std::this_thread::sleep_for(std::chrono::seconds(1));
  uint64_t uptime2 = stats_->GetUptimeSeconds();
  EXPECT_GE(uptime2, 1);
  EXPECT_LE(uptime2, 2);
}

/**
 * @brief Test queries per second calculation
 */
TEST_F(ServerStatsTest, QueriesPerSecond) {
  // Start one second in the past so the rate is well defined
  stats_->start_time -= 1;
  for (int i = 0; i < 100; ++i) {
    stats_->total_requests++;
  }

  double qps = stats_->GetQueriesPerSecond();
  EXPECT_GT(qps, 30.0);
  EXPECT_LE(qps, 100.0);
}

/**
 * @brief Test thread safety of statistics counters
 */
TEST_F(ServerStatsTest, ThreadSafety) {
  constexpr int kNumThreads = 10;
  constexpr int kIncrementsPerThread = 1000;

  std::vector<std::thread> threads;
  for (int i = 0; i < kNumThreads; ++i) {
    threads.emplace_back([this]() {
      for (int j = 0; j < kIncrementsPerThread; ++j) {
        stats_->total_requests++;
        stats_->query_requests++;
        stats_->search_requests.fetch_add(1);
        stats_->broadened_queries++;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(stats_->total_requests, kNumThreads * kIncrementsPerThread);
  EXPECT_EQ(stats_->query_requests, kNumThreads * kIncrementsPerThread);
  EXPECT_EQ(stats_->search_requests, kNumThreads * kIncrementsPerThread);
  EXPECT_EQ(stats_->broadened_queries, kNumThreads * kIncrementsPerThread);
}
