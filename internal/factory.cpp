#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

#include "internal/analytics/analytics_engine.hpp"
#include "internal/core/trace_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/evaluation/evaluation_scheduler.hpp"
#include "internal/evaluation/evaluation_worker.hpp"
#include "internal/evaluation/evaluator.hpp"
#include "internal/llm/provider_factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/query/query_executor.hpp"
#include "internal/query/query_translator.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/trace_service.hpp"
#include "internal/util/time.hpp"
#if TRACEBRAIN_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if TRACEBRAIN_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace tracebrain::factory {

using tracebrain::observability::StringField;

namespace {

llm::RetryPolicy RetryPolicyFrom(const tracebrain::runtime::config::LlmConfig& llm) {
  llm::RetryPolicy policy;
  policy.max_retries = llm.max_retries();
  policy.backoff     = util::ToMillis(llm.retry_backoff(), policy.backoff);
  return policy;
}

} // namespace

query::TranslatorOptions TranslatorOptionsFrom(const tracebrain::runtime::config::LlmConfig& llm) {
  query::TranslatorOptions options;
  options.retry       = RetryPolicyFrom(llm);
  options.temperature = llm.temperature();
  if (llm.max_tokens() > 0) {
    options.max_tokens = llm.max_tokens();
  }
  return options;
}

evaluation::EvaluatorOptions EvaluatorOptionsFrom(const tracebrain::runtime::config::RuntimeConfig& config) {
  const auto& llm = config.llm();

  evaluation::EvaluatorOptions options;
  options.retry       = RetryPolicyFrom(llm);
  options.judge_model = config.evaluation().judge_model().empty() ? llm.model() : config.evaluation().judge_model();
  options.temperature = llm.temperature();
  if (llm.max_tokens() > 0) {
    options.max_tokens = llm.max_tokens();
  }
  return options;
}

std::shared_ptr<db::Repository> BuildRepository(const tracebrain::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) {
#if TRACEBRAIN_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    TRACEBRAIN_LOG_INFO("Using sqlite repository", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if TRACEBRAIN_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    db::postgres::PgRepository::BootstrapSchema(*pool);
    TRACEBRAIN_LOG_INFO("Using postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  TRACEBRAIN_LOG_WARN("No database configured; traces are kept in memory only");
  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const tracebrain::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config.database());

  core::TraceStoreOptions store_options;
  store_options.max_commit_retries   = config.ingestion().max_commit_retries();
  store_options.commit_retry_backoff = util::ToMillis(config.ingestion().commit_retry_backoff(), store_options.commit_retry_backoff);
  app.store = std::make_shared<core::TraceStore>(app.repository, store_options);

  auto analytics = std::make_shared<analytics::AnalyticsEngine>(app.store);

  // ------------------------------------------------------------------
  // Language model
  // ------------------------------------------------------------------
  const auto& llm_config = config.llm();
  auto        provider   = llm::MakeProvider(llm_config);
  if (provider) {
    TRACEBRAIN_LOG_INFO("Language model provider ready", {StringField("provider", provider->Name()), StringField("model", llm_config.model())});
  } else {
    TRACEBRAIN_LOG_WARN("No language model provider configured; natural language queries and evaluation will fail");
  }

  auto translator = std::make_shared<query::QueryTranslator>(provider, TranslatorOptionsFrom(llm_config));
  auto executor   = std::make_shared<query::QueryExecutor>(app.store, analytics, static_cast<int>(config.query().default_limit()));

  // ------------------------------------------------------------------
  // Evaluation
  // ------------------------------------------------------------------
  if (config.evaluation().enabled()) {
    auto evaluator        = std::make_shared<evaluation::Evaluator>(app.store, provider, EvaluatorOptionsFrom(config));
    app.evaluations       = std::make_shared<evaluation::EvaluationScheduler>();
    app.evaluation_worker = std::make_shared<evaluation::EvaluationWorker>(app.evaluations, evaluator);
    app.evaluation_worker->Start();
  }

  // ------------------------------------------------------------------
  // Service
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store         = app.store;
  ctx.analytics     = analytics;
  ctx.translator    = translator;
  ctx.executor      = executor;
  ctx.evaluations   = app.evaluations;
  ctx.default_limit = config.query().default_limit();
  ctx.max_limit     = config.query().max_limit();

  app.service = std::make_shared<service::TraceService>(std::move(ctx));
  return app;
}

void Application::Shutdown() {
  if (evaluation_worker) {
    evaluation_worker->Stop();
  }
}

} // namespace tracebrain::factory
