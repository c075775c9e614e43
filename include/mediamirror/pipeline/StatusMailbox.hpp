// Repository: MediaMirror
// Component: Status Mailbox
// Purpose: Per-worker single-slot channel carrying the latest snapshot.
// Copyright (c) 2026 MediaMirror

#ifndef MEDIAMIRROR_PIPELINE_STATUS_MAILBOX_HPP_
#define MEDIAMIRROR_PIPELINE_STATUS_MAILBOX_HPP_

#include <cstdint>
#include <mutex>
#include <optional>

#include "mediamirror/pipeline/PipelineTypes.hpp"

namespace mediamirror::pipeline {

// StatusMailbox is LOSSY: Send() replaces any unread snapshot instead of
// queueing behind it. Only the newest state of a worker matters to the
// dashboard, so the slot never holds more than one value and a worker never
// waits on a slow reader.
//
// Single writer (the owning worker), single reader (the aggregator). The
// slot is guarded by one mutex, so a reader never observes a partially
// written snapshot.
class StatusMailbox {
 public:
  StatusMailbox() = default;

  StatusMailbox(const StatusMailbox&) = delete;
  StatusMailbox& operator=(const StatusMailbox&) = delete;

  // Non-blocking. Overwrites an unread snapshot.
  void Send(StatusSnapshot snapshot);

  // Non-blocking. nullopt if nothing was sent since the last receive.
  std::optional<StatusSnapshot> TryReceive();

  // Number of snapshots discarded unread by a later Send().
  uint64_t OverwriteCount() const;

 private:
  mutable std::mutex mutex_;
  std::optional<StatusSnapshot> slot_;
  uint64_t overwrites_ = 0;
};

}  // namespace mediamirror::pipeline

#endif  // MEDIAMIRROR_PIPELINE_STATUS_MAILBOX_HPP_
