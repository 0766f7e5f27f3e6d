#include "evaluation_worker.hpp"

#include "evaluator.hpp"
#include "internal/observability/logging.hpp"

namespace tracebrain::evaluation {

EvaluationWorker::EvaluationWorker(std::shared_ptr<EvaluationScheduler> scheduler,
                                   std::shared_ptr<Evaluator> evaluator)
    : scheduler_(std::move(scheduler)),
      evaluator_(std::move(evaluator)) {}

EvaluationWorker::~EvaluationWorker() {
  Stop();
}

void EvaluationWorker::Start() {
  if (thread_.joinable())
    return;
  thread_ = std::thread(&EvaluationWorker::Run, this);
}

void EvaluationWorker::Stop() {
  scheduler_->Shutdown();
  if (thread_.joinable())
    thread_.join();
}

void EvaluationWorker::Run() {
  while (auto task = scheduler_->Dequeue()) {
    try {
      evaluator_->Evaluate(task->trace_id, task->judge_model);
      ++completed_;
    }
    catch (const std::exception& e) {
      ++failed_;
      TRACEBRAIN_LOG_ERROR("evaluation failed", {observability::StringField("trace_id", task->trace_id),
                                                 observability::StringField("error", e.what())});
    }
  }
}

}
