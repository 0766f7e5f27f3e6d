#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/evaluation/evaluator.hpp"
#include "internal/query/query_translator.hpp"

namespace tracebrain::db {
class Repository;
}
namespace tracebrain::core {
class TraceStore;
}
namespace tracebrain::evaluation {
class EvaluationScheduler;
class EvaluationWorker;
}
namespace tracebrain::service {
class TraceService;
}

namespace tracebrain::factory {

/*
  Application

  Owns all long-lived components used by the server. Everything here
  lives for the lifetime of the process; the evaluation worker (when
  evaluation is enabled) is already running.
*/
struct Application {
  std::shared_ptr<db::Repository>                  repository;
  std::shared_ptr<core::TraceStore>                store;
  std::shared_ptr<evaluation::EvaluationScheduler> evaluations;
  std::shared_ptr<evaluation::EvaluationWorker>    evaluation_worker;
  std::shared_ptr<service::TraceService>           service;

  // Drains queued evaluations and joins the worker.
  void Shutdown();
};

/*
  Composition root. The only place that knows concrete repository and
  provider types.
*/
std::shared_ptr<db::Repository> BuildRepository(const tracebrain::runtime::config::DatabaseConfig& database);

// Both honour llm.max_tokens; the judge defaults to llm.model.
query::TranslatorOptions     TranslatorOptionsFrom(const tracebrain::runtime::config::LlmConfig& llm);
evaluation::EvaluatorOptions EvaluatorOptionsFrom(const tracebrain::runtime::config::RuntimeConfig& config);

Application Build(const tracebrain::runtime::config::RuntimeConfig& config);

} // namespace tracebrain::factory
