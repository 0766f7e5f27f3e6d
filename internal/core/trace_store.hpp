#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/schema/attribute_schema.hpp"
#include "internal/util/deadline.hpp"
#include "tracebrain/core/v1/trace.pb.h"
#include "tracebrain/query/v1/query.pb.h"

namespace tracebrain::core {

struct TraceStoreOptions {
  uint32_t                  max_commit_retries = 5;
  std::chrono::milliseconds commit_retry_backoff{20};
};

struct IngestResult {
  tracebrain::core::v1::Trace trace;
  int                         spans_added   = 0;
  int                         spans_skipped = 0;
};

struct TracePage {
  std::vector<tracebrain::core::v1::Trace> traces;
  int64_t                                  total = 0;
};

struct ReviewPage {
  std::vector<tracebrain::core::v1::ReviewSignal> signals;
  int64_t                                         total = 0;
};

struct Reconstruction {
  std::string              content;
  std::vector<std::string> path;
};

/*
  TraceStore owns traces, spans, the feedback ledger and the review queue.

  Every mutation runs in one repository transaction under the trace's
  lock stripe, so a trace is either fully updated or untouched. Commits that
  lose against a concurrent writer are retried on a fresh snapshot.

  Reads return committed state only. Spans come back in ingestion order
  with `content` filled in from their ancestor chain.
*/
class TraceStore {
 public:
  // Fixed lock table; traces hashing to the same stripe serialize.
  static constexpr std::size_t kTraceLockStripes = 64;

  explicit TraceStore(std::shared_ptr<db::Repository> repository, TraceStoreOptions options = {});

  // Upsert. Spans already stored with identical content are skipped; a
  // stored span_id with different content raises util::ConflictError.
  // Trace attributes are shallow-merged (incoming keys win) and the
  // optional feedback is appended in the same transaction.
  IngestResult Ingest(const std::string& trace_id, const std::vector<tracebrain::core::v1::Span>& spans,
                      const google::protobuf::Struct& attributes, const tracebrain::core::v1::Feedback* feedback,
                      const util::Deadline& deadline = {});

  tracebrain::core::v1::Trace Get(const std::string& trace_id, const util::Deadline& deadline = {});

  // Ordered by created_at descending, ties by trace_id ascending.
  TracePage List(const tracebrain::query::v1::TraceFilter& filter, int skip, int limit, const util::Deadline& deadline = {});

  tracebrain::core::v1::Trace AddFeedback(const std::string& trace_id, tracebrain::core::v1::Feedback feedback,
                                          const util::Deadline& deadline = {});

  // Appends a review signal and marks the trace needs_review.
  tracebrain::core::v1::ReviewSignal Signal(const std::string& trace_id, const std::string& reason, const util::Deadline& deadline = {});

  // Newest first.
  ReviewPage ListReviewQueue(int skip, int limit, const util::Deadline& deadline = {});

  // Replaces the trace's evaluation block.
  tracebrain::core::v1::Trace SetEvaluation(const std::string& trace_id, const schema::Evaluation& evaluation,
                                            const util::Deadline& deadline = {});

  Reconstruction Reconstruct(const std::string& trace_id, const std::string& span_id, const util::Deadline& deadline = {});

  // Traces of one episode, oldest first. Throws util::NotFound when empty.
  std::vector<tracebrain::core::v1::Trace> EpisodeTraces(const std::string& episode_id, const util::Deadline& deadline = {});

  // Every committed trace, spans without reconstructed content.
  std::vector<tracebrain::core::v1::Trace> Snapshot(const util::Deadline& deadline = {});

 private:
  std::mutex& TraceLock(const std::string& trace_id);

  template <typename Fn>
  auto Mutate(const std::string& operation, const util::Deadline& deadline, Fn&& fn);

  tracebrain::core::v1::Trace              LoadTrace(db::Transaction& tx, const std::string& trace_id, bool with_content);
  std::vector<tracebrain::core::v1::Trace> LoadAll(db::Transaction& tx, bool with_content);

  std::shared_ptr<db::Repository> repository_;
  TraceStoreOptions               options_;

  std::array<std::mutex, kTraceLockStripes> trace_locks_;
};

} // namespace tracebrain::core
