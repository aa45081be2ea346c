#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

#include "thread_pool.h"

using namespace fastblur;

TEST(ThreadPool, ParallelForVisitsEveryIndexOnce)
{
  ThreadPool pool(4);
  std::vector<std::atomic<int>> hits(1000);
  for (auto& h : hits) h.store(0);

  pool.parallel_for(0, hits.size(), 37, [&hits](size_t i0, size_t i1) {
    for (size_t i = i0; i < i1; ++i) hits[i].fetch_add(1);
  });

  for (size_t i = 0; i < hits.size(); ++i) EXPECT_EQ(hits[i].load(), 1) << i;
}

TEST(ThreadPool, SingleChunkRunsOnTheCallingThread)
{
  ThreadPool pool(2);
  const std::thread::id caller = std::this_thread::get_id();
  std::thread::id ran;
  pool.parallel_for(5, 9, 100, [&ran](size_t i0, size_t i1) {
    EXPECT_EQ(i0, 5u);
    EXPECT_EQ(i1, 9u);
    ran = std::this_thread::get_id();
  });
  EXPECT_EQ(ran, caller);
}

TEST(ThreadPool, EmptyRangeDoesNothing)
{
  ThreadPool pool(2);
  bool called = false;
  pool.parallel_for(3, 3, 1, [&called](size_t, size_t) { called = true; });
  EXPECT_FALSE(called);
}

TEST(ThreadPool, RethrowsChunkException)
{
  ThreadPool pool(3);
  std::atomic<int> finished{0};
  EXPECT_THROW(pool.parallel_for(0, 8, 1,
                                 [&finished](size_t i0, size_t) {
                                   if (i0 == 5) throw std::runtime_error("chunk failed");
                                   finished.fetch_add(1);
                                 }),
               std::runtime_error);
  // every other chunk still ran to completion before the rethrow
  EXPECT_EQ(finished.load(), 7);

  // pool is still usable
  std::atomic<int> count{0};
  pool.parallel_for(0, 6, 2, [&count](size_t i0, size_t i1) { count.fetch_add(static_cast<int>(i1 - i0)); });
  EXPECT_EQ(count.load(), 6);
}

TEST(ThreadPool, ZeroMeansHardwareConcurrency)
{
  ThreadPool pool(0);
  EXPECT_EQ(pool.size(), ThreadPool::hardware_threads());
  EXPECT_GE(ThreadPool::hardware_threads(), 1u);
}
