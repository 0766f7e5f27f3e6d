#pragma once

#include <chrono>
#include <cstdint>
#include <memory>

namespace tracebrain::core {
class TraceStore;
}
namespace tracebrain::analytics {
class AnalyticsEngine;
}
namespace tracebrain::query {
class QueryTranslator;
class QueryExecutor;
}
namespace tracebrain::evaluation {
class EvaluationScheduler;
}

namespace tracebrain::service {

/*
  Dependency container shared by the service facade.
  `evaluations` is null when evaluation is disabled.
*/
struct ServiceContext {
  std::shared_ptr<tracebrain::core::TraceStore>               store;
  std::shared_ptr<tracebrain::analytics::AnalyticsEngine>     analytics;
  std::shared_ptr<tracebrain::query::QueryTranslator>         translator;
  std::shared_ptr<tracebrain::query::QueryExecutor>           executor;
  std::shared_ptr<tracebrain::evaluation::EvaluationScheduler> evaluations;

  uint32_t default_limit = 20;
  uint32_t max_limit     = 100;
};

} // namespace tracebrain::service
