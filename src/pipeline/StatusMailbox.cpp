// Repository: MediaMirror
// Component: Status Mailbox Implementation
// Purpose: Single-slot latest-value channel from a worker to the aggregator.
// Copyright (c) 2026 MediaMirror

#include "mediamirror/pipeline/StatusMailbox.hpp"

namespace mediamirror::pipeline {

void StatusMailbox::Send(StatusSnapshot snapshot) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (slot_.has_value()) {
    ++overwrites_;
  }
  slot_ = std::move(snapshot);
}

std::optional<StatusSnapshot> StatusMailbox::TryReceive() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<StatusSnapshot> out = std::move(slot_);
  slot_.reset();
  return out;
}

uint64_t StatusMailbox::OverwriteCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return overwrites_;
}

}  // namespace mediamirror::pipeline
