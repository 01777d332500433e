#pragma once

#include "channel.hpp"
#include "engine_messages.hpp"
#include "pair_analysis.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace zones {

/// Background analysis threads.
///
/// Consumes JobRequests from a channel, runs the PairAnalyzer and sends a
/// JobResult back for every request, success or failure. The worker never
/// touches engine state; results are drained by the engine thread with
/// poll_result().
class AnalysisWorker {
public:
  /// @param analyzer Computation to run per job
  /// @param num_threads Worker threads (>= 1)
  /// @throws std::invalid_argument if analyzer is null or num_threads is 0
  explicit AnalysisWorker(std::shared_ptr<PairAnalyzer> analyzer,
                          uint32_t num_threads = 1);

  ~AnalysisWorker();

  AnalysisWorker(const AnalysisWorker &) = delete;
  AnalysisWorker &operator=(const AnalysisWorker &) = delete;

  /// Start the worker threads (no-op if already running)
  void start();

  /// Close the job channel and join. Jobs already queued are still
  /// processed; a stopped worker cannot be restarted.
  void stop();

  /// Queue a job (thread-safe)
  /// @return false if the worker has been stopped
  bool submit(JobRequest request);

  /// Next finished result, if any (non-blocking)
  std::optional<JobResult> poll_result();

  /// Block until a result arrives or the worker is stopped and drained
  std::optional<JobResult> wait_result();

  bool running() const { return running_; }
  uint64_t jobs_completed() const { return jobs_completed_; }

private:
  void worker_loop();
  JobResult run_job(const JobRequest &request);

  std::shared_ptr<PairAnalyzer> analyzer_;
  uint32_t num_threads_;
  std::atomic<bool> running_;
  std::atomic<uint64_t> jobs_completed_;

  Channel<JobRequest> jobs_;
  Channel<JobResult> results_;
  std::vector<std::thread> worker_threads_;
};

} // namespace zones
