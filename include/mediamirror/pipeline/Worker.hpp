// Repository: MediaMirror
// Component: Worker
// Purpose: Consumes batches from the work queue on its own thread and
//          reports every state change to its status mailbox.
// Copyright (c) 2026 MediaMirror

#ifndef MEDIAMIRROR_PIPELINE_WORKER_HPP_
#define MEDIAMIRROR_PIPELINE_WORKER_HPP_

#include <cstdint>
#include <thread>
#include <vector>

#include "mediamirror/pipeline/FileConverter.hpp"
#include "mediamirror/pipeline/PipelineTypes.hpp"
#include "mediamirror/pipeline/StatusMailbox.hpp"
#include "mediamirror/pipeline/WorkQueue.hpp"

namespace mediamirror::pipeline {

// Worker runs:
//
//   loop:
//     item = queue.Get()
//     EndOfWork -> send ErrorBatchEvent (finished=true), exit
//     WorkBatch -> ensure output dir (MakeDirEvent), convert each pair
//
// Every file ends in exactly one outcome. Errors are accumulated locally and
// shipped once, in the final snapshot, so nothing is printed mid-run.
//
// Lifetime: queue, mailbox and converter are borrowed and must outlive the
// worker. The destructor joins.
class Worker {
 public:
  struct Options {
    bool verbose = false;  // log each event as a plain line
  };

  Worker(int id, WorkQueue& queue, StatusMailbox& mailbox,
         const FileConverter& converter, Options options);
  ~Worker();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  void Start();
  void Join();

  int Id() const { return id_; }

  // Valid after Join().
  const WorkerCounters& Counters() const { return counters_; }
  uint64_t TranscodesDone() const { return transcodes_done_; }
  size_t BatchesProcessed() const { return batches_processed_; }

 private:
  void Run();
  void ProcessBatch(const WorkBatch& batch);
  FileOutcome ProcessFile(const FilePair& pair);
  void Apply(const FileOutcome& outcome);
  void Report(FileEvent event, bool finished = false);

  const int id_;
  WorkQueue& queue_;
  StatusMailbox& mailbox_;
  const FileConverter& converter_;
  Options options_;

  // Worker-thread state.
  WorkerCounters counters_;
  uint64_t transcodes_done_ = 0;
  size_t batches_processed_ = 0;
  std::vector<ErrorRecord> errors_;

  std::thread thread_;
};

}  // namespace mediamirror::pipeline

#endif  // MEDIAMIRROR_PIPELINE_WORKER_HPP_
