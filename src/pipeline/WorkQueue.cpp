// Repository: MediaMirror
// Component: Bounded Work Queue Implementation
// Purpose: Bounded blocking queue shared by the enumerator and the workers.
// Copyright (c) 2026 MediaMirror

#include "mediamirror/pipeline/WorkQueue.hpp"

#include <algorithm>
#include <stdexcept>

namespace mediamirror::pipeline {

WorkQueue::WorkQueue(size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("WorkQueue: capacity must be at least 1");
  }
}

bool WorkQueue::TryPut(WorkItem& item, std::chrono::milliseconds timeout) {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!not_full_cv_.wait_for(lock, timeout,
                               [this] { return items_.size() < capacity_; })) {
      return false;
    }
    items_.push_back(std::move(item));
    high_water_mark_ = std::max(high_water_mark_, items_.size());
  }
  not_empty_cv_.notify_one();
  return true;
}

WorkItem WorkQueue::Get() {
  WorkItem item;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_cv_.wait(lock, [this] { return !items_.empty(); });
    item = std::move(items_.front());
    items_.pop_front();
  }
  not_full_cv_.notify_one();
  return item;
}

size_t WorkQueue::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.size();
}

size_t WorkQueue::HighWaterMark() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return high_water_mark_;
}

}  // namespace mediamirror::pipeline
