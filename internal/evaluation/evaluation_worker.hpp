#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>

#include "evaluation_scheduler.hpp"

namespace tracebrain::evaluation {

class Evaluator;

/*
  Background worker that runs queued evaluations one at a time.
  Stop() drains the queue before joining.
*/
class EvaluationWorker {
 public:
  EvaluationWorker(std::shared_ptr<EvaluationScheduler> scheduler, std::shared_ptr<Evaluator> evaluator);
  ~EvaluationWorker();

  void Start();
  void Stop();

  uint64_t Completed() const { return completed_; }
  uint64_t Failed() const { return failed_; }

 private:
  void Run();

  std::shared_ptr<EvaluationScheduler> scheduler_;
  std::shared_ptr<Evaluator>           evaluator_;

  std::thread           thread_;
  std::atomic<uint64_t> completed_{0};
  std::atomic<uint64_t> failed_{0};
};

} // namespace tracebrain::evaluation
