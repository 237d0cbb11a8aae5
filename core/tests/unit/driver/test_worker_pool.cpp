// test_worker_pool.cpp - Parallel per-file task runner
//
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "schemaflow/driver/worker_pool.hpp"

using namespace schemaflow;

TEST(WorkerPool, EffectiveJobs)
{
  EXPECT_EQ(effective_jobs(4, 10), 4U);
  EXPECT_EQ(effective_jobs(4, 2), 2U);
  EXPECT_EQ(effective_jobs(4, 0), 1U);
  EXPECT_GE(effective_jobs(0, 100), 1U);
  EXPECT_EQ(effective_jobs(0, 1), 1U);
}

TEST(WorkerPool, EveryIndexRunsOnce)
{
  constexpr size_t k_count = 200;
  std::vector<std::atomic<int>> hits(k_count);
  parallel_for(k_count, 8, [&](size_t i) { hits[i].fetch_add(1); });

  for (size_t i = 0; i < k_count; ++i) {
    EXPECT_EQ(hits[i].load(), 1) << "index " << i;
  }
}

TEST(WorkerPool, ZeroTasksIsANoOp)
{
  bool called = false;
  parallel_for(0, 4, [&](size_t) { called = true; });
  EXPECT_FALSE(called);
}

TEST(WorkerPool, ExceptionIsRethrownOnCaller)
{
  std::atomic<int> ran{0};
  EXPECT_THROW(
    parallel_for(
      50, 4,
      [&](size_t i) {
        ran.fetch_add(1);
        if (i == 7) {
          throw std::runtime_error("task failed");
        }
      }),
    std::runtime_error);
  EXPECT_GE(ran.load(), 1);
}

TEST(WorkerPool, SingleWorkerRunsInOrder)
{
  std::vector<size_t> order;
  parallel_for(5, 1, [&](size_t i) { order.push_back(i); });
  EXPECT_EQ(order, (std::vector<size_t>{0, 1, 2, 3, 4}));
}

TEST(WorkerPool, ThreadsAreJoinedWhileUnwinding)
{
  std::atomic<bool> finished{false};
  try {
    JoiningThreads threads;
    threads.spawn([&]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      finished.store(true);
    });
    EXPECT_EQ(threads.size(), 1U);
    throw std::runtime_error("could not start worker");
  } catch (const std::runtime_error & e) {
    EXPECT_STREQ(e.what(), "could not start worker");
  }
  EXPECT_TRUE(finished.load());
}
