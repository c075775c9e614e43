// Repository: MediaMirror
// Component: WorkQueue Tests
// Purpose: Capacity bound, timeout-based put, FIFO, exactly-once delivery.
// Copyright (c) 2026 MediaMirror

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#include "mediamirror/pipeline/WorkQueue.hpp"

namespace mediamirror::pipeline::testing {
namespace {

using std::chrono::milliseconds;

WorkItem MakeBatch(const std::string& dir) {
  WorkBatch batch;
  batch.output_directory = dir;
  batch.pairs.push_back({dir + "/in.wav", dir + "/in.mp3"});
  return WorkItem{std::move(batch)};
}

std::string DirOf(const WorkItem& item) {
  return std::get<WorkBatch>(item).output_directory.string();
}

TEST(WorkQueueTest, ZeroCapacityRejected) {
  EXPECT_THROW(WorkQueue(0), std::invalid_argument);
}

TEST(WorkQueueTest, TryPutTimesOutWhenFullAndLeavesItemIntact) {
  WorkQueue queue(2);
  WorkItem a = MakeBatch("a");
  WorkItem b = MakeBatch("b");
  WorkItem c = MakeBatch("c");
  ASSERT_TRUE(queue.TryPut(a, milliseconds(10)));
  ASSERT_TRUE(queue.TryPut(b, milliseconds(10)));

  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(queue.TryPut(c, milliseconds(30)));
  EXPECT_GE(std::chrono::steady_clock::now() - start, milliseconds(25));

  // Rejected item not consumed: still usable for the retry.
  ASSERT_TRUE(std::holds_alternative<WorkBatch>(c));
  EXPECT_EQ(DirOf(c), "c");
  EXPECT_EQ(std::get<WorkBatch>(c).pairs.size(), 1u);
  EXPECT_EQ(queue.Size(), 2u);
}

TEST(WorkQueueTest, FifoOrder) {
  WorkQueue queue(4);
  for (const char* d : {"1", "2", "3"}) {
    WorkItem item = MakeBatch(d);
    ASSERT_TRUE(queue.TryPut(item, milliseconds(10)));
  }
  EXPECT_EQ(DirOf(queue.Get()), "1");
  EXPECT_EQ(DirOf(queue.Get()), "2");
  EXPECT_EQ(DirOf(queue.Get()), "3");
}

TEST(WorkQueueTest, GetUnblocksFullProducer) {
  WorkQueue queue(1);
  WorkItem first = MakeBatch("first");
  ASSERT_TRUE(queue.TryPut(first, milliseconds(10)));

  std::thread consumer([&queue] {
    std::this_thread::sleep_for(milliseconds(20));
    queue.Get();
  });
  WorkItem second = MakeBatch("second");
  EXPECT_TRUE(queue.TryPut(second, milliseconds(2000)));
  consumer.join();
  EXPECT_EQ(DirOf(queue.Get()), "second");
}

TEST(WorkQueueTest, EndOfWorkMarkerPassesThrough) {
  WorkQueue queue(1);
  WorkItem marker{EndOfWork{}};
  ASSERT_TRUE(queue.TryPut(marker, milliseconds(10)));
  EXPECT_TRUE(IsEndOfWork(queue.Get()));
}

// N consumers, M items, capacity << M: every item delivered exactly once and
// the queue never holds more than its capacity.
TEST(WorkQueueTest, ExactlyOnceDeliveryUnderContention) {
  constexpr int kConsumers = 4;
  constexpr int kItems = 400;
  constexpr size_t kCapacity = 3;
  WorkQueue queue(kCapacity);

  std::mutex seen_mutex;
  std::multiset<std::string> seen;
  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([&] {
      while (true) {
        WorkItem item = queue.Get();
        if (IsEndOfWork(item)) return;
        std::lock_guard<std::mutex> lock(seen_mutex);
        seen.insert(DirOf(item));
      }
    });
  }

  for (int i = 0; i < kItems; ++i) {
    WorkItem item = MakeBatch(std::to_string(i));
    while (!queue.TryPut(item, milliseconds(5))) {
    }
  }
  for (int c = 0; c < kConsumers; ++c) {
    WorkItem marker{EndOfWork{}};
    while (!queue.TryPut(marker, milliseconds(5))) {
    }
  }
  for (auto& t : consumers) t.join();

  ASSERT_EQ(seen.size(), static_cast<size_t>(kItems));
  for (int i = 0; i < kItems; ++i) {
    EXPECT_EQ(seen.count(std::to_string(i)), 1u) << "item " << i;
  }
  EXPECT_LE(queue.HighWaterMark(), kCapacity);
  EXPECT_EQ(queue.Size(), 0u);
}

}  // namespace
}  // namespace mediamirror::pipeline::testing
