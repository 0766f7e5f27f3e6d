#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/trace_record.hpp"

#if TRACEBRAIN_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if TRACEBRAIN_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using tracebrain::db::ErrorCode;
using tracebrain::db::Repository;
using tracebrain::db::memory::MemoryRepository;
using tracebrain::db::model::FeedbackRecord;
using tracebrain::db::model::ReviewSignalRecord;
using tracebrain::db::model::SpanRecord;
using tracebrain::db::model::TraceRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

TraceRecord MakeTrace(const std::string& id, uint64_t created_at_ms) {
  return TraceRecord{.trace_id = id, .attributes_json = R"({"trace.status":"running"})", .created_at_ms = created_at_ms, .updated_at_ms = created_at_ms};
}

SpanRecord MakeSpan(const std::string& trace_id, const std::string& span_id, const std::string& parent_id, uint64_t seq) {
  return SpanRecord{.trace_id        = trace_id,
                    .span_id         = span_id,
                    .parent_id       = parent_id,
                    .name            = "step",
                    .start_time_ns   = 1'700'000'000'000'000'000,
                    .end_time_ns     = 1'700'000'001'000'000'000,
                    .attributes_json = R"({"tracebrain.span.type":"llm_inference"})",
                    .seq             = seq};
}

void VerifyTraceInsertUpdateGet(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();

  auto trace = MakeTrace(id, NowMs());
  assert(repo.InsertTrace(*tx, trace));

  auto resolved = repo.GetTrace(*tx, id);
  assert(resolved.has_value());
  assert(resolved->attributes_json == trace.attributes_json);

  trace.attributes_json = R"({"trace.status":"completed"})";
  trace.updated_at_ms += 10;
  assert(repo.UpdateTrace(*tx, trace));

  auto updated = repo.GetTrace(*tx, id);
  assert(updated.has_value());
  assert(updated->attributes_json == trace.attributes_json);
  assert(updated->created_at_ms == resolved->created_at_ms);

  auto missing = repo.UpdateTrace(*tx, MakeTrace(id + "-missing", NowMs()));
  assert(missing.code == ErrorCode::NotFound);
  assert(!repo.GetTrace(*tx, id + "-missing").has_value());

  tx->Commit();

  // a failed statement poisons a postgres transaction, so it gets its own
  auto dup_tx    = repo.Begin();
  auto duplicate = repo.InsertTrace(*dup_tx, trace);
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);
  dup_tx->Rollback();
}

void VerifySpansKeepAppendOrder(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();
  assert(repo.InsertTrace(*tx, MakeTrace(id, NowMs())));

  // seq order differs from span id order
  std::vector<SpanRecord> spans = {MakeSpan(id, "z-root", "", 0), MakeSpan(id, "a-child", "z-root", 1), MakeSpan(id, "m-leaf", "a-child", 2)};
  assert(repo.InsertSpans(*tx, spans));

  auto read = repo.GetSpans(*tx, id);
  assert(read.size() == 3);
  assert(read[0].span_id == "z-root");
  assert(read[0].parent_id.empty());
  assert(read[1].span_id == "a-child");
  assert(read[1].parent_id == "z-root");
  assert(read[2].span_id == "m-leaf");
  assert(read[2].start_time_ns == spans[2].start_time_ns);
  assert(read[2].attributes_json == spans[2].attributes_json);

  tx->Commit();

  {
    auto dup_tx    = repo.Begin();
    auto duplicate = repo.InsertSpans(*dup_tx, {MakeSpan(id, "a-child", "z-root", 3)});
    assert(duplicate.code == ErrorCode::AlreadyExists);
    dup_tx->Rollback();
  }
  {
    auto orphan_tx = repo.Begin();
    auto orphan    = repo.InsertSpans(*orphan_tx, {MakeSpan(id + "-missing", "x", "", 0)});
    assert(!orphan);
    orphan_tx->Rollback();
  }

  auto check_tx = repo.Begin();
  assert(repo.GetSpans(*check_tx, id).size() == 3);
  check_tx->Commit();
}

void VerifyFeedbackAndSignals(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();
  assert(repo.InsertTrace(*tx, MakeTrace(id, NowMs())));

  assert(repo.AppendFeedback(*tx, FeedbackRecord{.trace_id = id, .seq = 0, .json = R"({"rating":2})", .created_at_ms = NowMs()}));
  assert(repo.AppendFeedback(*tx, FeedbackRecord{.trace_id = id, .seq = 1, .json = R"({"rating":5})", .created_at_ms = NowMs()}));

  auto feedback = repo.GetFeedback(*tx, id);
  assert(feedback.size() == 2);
  assert(feedback[0].json == R"({"rating":2})");
  assert(feedback[1].seq == 1);

  const auto before = repo.ListReviewSignals(*tx).size();
  assert(repo.AppendReviewSignal(*tx, ReviewSignalRecord{.trace_id = id, .reason = "first", .created_at_ms = NowMs()}));
  assert(repo.AppendReviewSignal(*tx, ReviewSignalRecord{.trace_id = id, .reason = "second", .created_at_ms = NowMs()}));

  auto signals = repo.ListReviewSignals(*tx);
  assert(signals.size() == before + 2);
  assert(signals[before].reason == "first");
  assert(signals[before + 1].reason == "second");

  const auto other = id + "-other";
  assert(repo.InsertTrace(*tx, MakeTrace(other, NowMs())));
  assert(repo.AppendReviewSignal(*tx, ReviewSignalRecord{.trace_id = other, .reason = "elsewhere", .created_at_ms = NowMs()}));

  auto own = repo.GetReviewSignals(*tx, id);
  assert(own.size() == 2);
  assert(own[0].reason == "first");
  assert(own[1].reason == "second");
  assert(repo.GetReviewSignals(*tx, other).size() == 1);
  assert(repo.GetReviewSignals(*tx, id + "-missing").empty());

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertTrace(*tx, MakeTrace(id, NowMs())));
    assert(repo.InsertSpans(*tx, {MakeSpan(id, "root", "", 0)}));
    tx->Rollback();
  }

  {
    // destructor rolls back
    auto tx = repo.Begin();
    assert(repo.InsertTrace(*tx, MakeTrace(id + "-dropped", NowMs())));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetTrace(*check_tx, id).has_value());
  assert(!repo.GetTrace(*check_tx, id + "-dropped").has_value());
  assert(repo.GetSpans(*check_tx, id).empty());
  check_tx->Commit();
}

// A finished transaction that is still in scope must not block the next one.
void VerifyBeginAfterFinish(Repository& repo, const std::string& id) {
  auto begin_elsewhere = [&repo]() {
    auto next = std::async(std::launch::async, [&repo]() {
      auto tx = repo.Begin();
      tx->Rollback();
    });
    assert(next.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    next.get();
  };

  auto committed = repo.Begin();
  assert(repo.InsertTrace(*committed, MakeTrace(id, NowMs())));
  committed->Commit();
  begin_elsewhere();

  auto rolled_back = repo.Begin();
  assert(repo.InsertTrace(*rolled_back, MakeTrace(id + "-dropped", NowMs())));
  rolled_back->Rollback();
  begin_elsewhere();

  // same thread, both predecessors still alive
  auto tx = repo.Begin();
  assert(repo.GetTrace(*tx, id).has_value());
  assert(!repo.GetTrace(*tx, id + "-dropped").has_value());
  tx->Commit();
}

void VerifyListings(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();
  const auto traces_before = repo.ListTraces(*tx).size();
  const auto spans_before  = repo.ListSpans(*tx).size();

  assert(repo.InsertTrace(*tx, MakeTrace(prefix + "-a", 1000)));
  assert(repo.InsertTrace(*tx, MakeTrace(prefix + "-b", 2000)));
  assert(repo.InsertSpans(*tx, {MakeSpan(prefix + "-a", "s0", "", 0), MakeSpan(prefix + "-a", "s1", "s0", 1)}));
  assert(repo.InsertSpans(*tx, {MakeSpan(prefix + "-b", "s0", "", 0)}));
  assert(repo.AppendFeedback(*tx, FeedbackRecord{.trace_id = prefix + "-b", .seq = 0, .json = "{}", .created_at_ms = 2000}));
  tx->Commit();

  auto read_tx = repo.Begin();
  assert(repo.ListTraces(*read_tx).size() == traces_before + 2);

  auto spans = repo.ListSpans(*read_tx);
  assert(spans.size() == spans_before + 3);
  std::size_t a_seen = 0;
  for (const auto& span : spans) {
    if (span.trace_id == prefix + "-a") {
      assert(span.seq == a_seen);
      ++a_seen;
    }
  }
  assert(a_seen == 2);

  bool found = false;
  for (const auto& feedback : repo.ListFeedback(*read_tx)) {
    found = found || feedback.trace_id == prefix + "-b";
  }
  assert(found);
  read_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertTrace(*tx, MakeTrace(id, 4242)));
    assert(repo->InsertSpans(*tx, {MakeSpan(id, "root", "", 0), MakeSpan(id, "child", "root", 1)}));
    assert(repo->AppendFeedback(*tx, FeedbackRecord{.trace_id = id, .seq = 0, .json = R"({"comment":"kept"})", .created_at_ms = 4243}));
    assert(repo->AppendReviewSignal(*tx, ReviewSignalRecord{.trace_id = id, .reason = "durable", .created_at_ms = 4244}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto t  = repo->GetTrace(*tx, id);
  assert(t.has_value());
  assert(t->created_at_ms == 4242);

  auto spans = repo->GetSpans(*tx, id);
  assert(spans.size() == 2);
  assert(spans[1].parent_id == "root");

  auto feedback = repo->GetFeedback(*tx, id);
  assert(feedback.size() == 1);
  assert(feedback[0].json == R"({"comment":"kept"})");

  bool signal_kept = false;
  for (const auto& signal : repo->ListReviewSignals(*tx)) {
    signal_kept = signal_kept || (signal.trace_id == id && signal.reason == "durable");
  }
  assert(signal_kept);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if TRACEBRAIN_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("tracebrain_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<tracebrain::db::sqlite::SqliteDB>(db_path);
    tracebrain::db::sqlite::SqliteRepository::BootstrapSchema(*db);
    return std::make_shared<tracebrain::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if TRACEBRAIN_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("TRACEBRAIN_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("TRACEBRAIN_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<tracebrain::db::postgres::PgPool>(conninfo);
    tracebrain::db::postgres::PgRepository::BootstrapSchema(*pool);
    return std::make_shared<tracebrain::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  // postgres keeps rows between runs
  const auto run = backend.name + "-" + std::to_string(NowMs());

  {
    auto repo = backend.make_repository();
    VerifyTraceInsertUpdateGet(*repo, run + "-trace");
    VerifySpansKeepAppendOrder(*repo, run + "-spans");
    VerifyFeedbackAndSignals(*repo, run + "-feedback");
    VerifyRollbackBehavior(*repo, run + "-rollback");
    VerifyBeginAfterFinish(*repo, run + "-sequential");
    VerifyListings(*repo, run + "-list");
  }

  VerifyRestartDurability(backend, run + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if TRACEBRAIN_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if TRACEBRAIN_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "tracebrain_integration_repository_parity: pass\n";
  return 0;
}
