#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace ledger::dlq {
class SequenceDeadLetterQueue;
}

namespace ledger::projection {

class ProjectionRunner;

struct WorkerOptions {
  std::chrono::milliseconds poll_interval = std::chrono::milliseconds(1000);
  bool                      auto_redrive  = false;
};

/*
  Background worker that keeps projections moving.

  Each tick:
      CatchUpAll() over every registered projection
      redrive of due DLQ entries (only when auto_redrive is set)
*/
class ProjectionWorker {
 public:
  ProjectionWorker(std::shared_ptr<ProjectionRunner> runner, std::shared_ptr<dlq::SequenceDeadLetterQueue> dlq, WorkerOptions options);
  ~ProjectionWorker();

  void Start();
  void Stop();

  // One tick on the caller's thread.
  void RunOnce();

 private:
  void Run();

  std::shared_ptr<ProjectionRunner>             runner_;
  std::shared_ptr<dlq::SequenceDeadLetterQueue> dlq_;
  WorkerOptions                                 options_;

  std::mutex              wake_mutex_;
  std::condition_variable wake_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace ledger::projection
