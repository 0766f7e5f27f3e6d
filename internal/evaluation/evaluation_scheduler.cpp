#include "evaluation_scheduler.hpp"

namespace tracebrain::evaluation {

bool EvaluationScheduler::Enqueue(const EvaluationTask& task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(task);
  }
  cv_.notify_one();
  return true;
}

std::optional<EvaluationTask> EvaluationScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  EvaluationTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void EvaluationScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t EvaluationScheduler::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace tracebrain::evaluation
