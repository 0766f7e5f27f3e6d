#pragma once

#include <memory>

#include "internal/util/deadline.hpp"
#include "tracebrain/query/v1/query.pb.h"

namespace tracebrain::core {
class TraceStore;
}
namespace tracebrain::analytics {
class AnalyticsEngine;
}

namespace tracebrain::query {

/*
  Runs a validated StructuredQuery against the store and analytics and
  renders a short textual answer with the trace ids it drew on.
*/
class QueryExecutor {
 public:
  QueryExecutor(std::shared_ptr<core::TraceStore> store, std::shared_ptr<analytics::AnalyticsEngine> analytics, int default_limit = 20);

  tracebrain::query::v1::QueryAnswer Execute(const tracebrain::query::v1::StructuredQuery& query, const util::Deadline& deadline = {});

 private:
  std::shared_ptr<core::TraceStore>           store_;
  std::shared_ptr<analytics::AnalyticsEngine> analytics_;
  int                                         default_limit_;
};

} // namespace tracebrain::query
