#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "evaluation_task.hpp"

namespace tracebrain::evaluation {

/*
  Thread-safe blocking queue for evaluation workers.
*/
class EvaluationScheduler {
 public:
  // Returns false once Shutdown() has been called.
  bool Enqueue(const EvaluationTask& task);

  // Blocks until a task is available. Returns nullopt after Shutdown()
  // once the queue is drained.
  std::optional<EvaluationTask> Dequeue();

  void Shutdown();

  std::size_t Pending() const;

 private:
  mutable std::mutex         mutex_;
  std::condition_variable    cv_;
  std::queue<EvaluationTask> queue_;
  bool                       shutdown_ = false;
};

} // namespace tracebrain::evaluation
