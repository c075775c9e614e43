// Repository: MediaMirror
// Component: Bounded Work Queue
// Purpose: Single shared, capacity-limited FIFO between the producer and
//          the workers.
// Copyright (c) 2026 MediaMirror

#ifndef MEDIAMIRROR_PIPELINE_WORK_QUEUE_HPP_
#define MEDIAMIRROR_PIPELINE_WORK_QUEUE_HPP_

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

#include "mediamirror/pipeline/PipelineTypes.hpp"

namespace mediamirror::pipeline {

// WorkQueue bounds the number of undistributed items in flight, so memory
// stays flat no matter how large the input tree is.
//
// Producer: TryPut() waits at most `timeout` for a free slot and reports
// "not accepted" instead of blocking forever. The producer uses the returned
// control to refresh the dashboard and retry.
//
// Consumers: Get() blocks until an item is available. Each item is handed
// to exactly one caller, in FIFO order.
//
// Thread safety: all public methods are safe to call from any thread.
class WorkQueue {
 public:
  explicit WorkQueue(size_t capacity);

  WorkQueue(const WorkQueue&) = delete;
  WorkQueue& operator=(const WorkQueue&) = delete;

  // Enqueue `item` if a slot frees up within `timeout`. On success the item
  // is moved from; on false it is left untouched for the retry.
  bool TryPut(WorkItem& item, std::chrono::milliseconds timeout);

  // Block until an item is available and remove it.
  WorkItem Get();

  size_t Size() const;
  size_t Capacity() const { return capacity_; }

  // Largest Size() ever observed after an enqueue.
  size_t HighWaterMark() const;

 private:
  const size_t capacity_;

  mutable std::mutex mutex_;
  std::condition_variable not_full_cv_;
  std::condition_variable not_empty_cv_;
  std::deque<WorkItem> items_;
  size_t high_water_mark_ = 0;
};

}  // namespace mediamirror::pipeline

#endif  // MEDIAMIRROR_PIPELINE_WORK_QUEUE_HPP_
