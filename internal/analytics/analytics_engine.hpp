#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/deadline.hpp"
#include "internal/util/time.hpp"
#include "tracebrain/analytics/v1/analytics.pb.h"
#include "tracebrain/core/v1/trace.pb.h"

namespace tracebrain::core {
class TraceStore;
}

namespace tracebrain::analytics {

struct EpisodePage {
  std::vector<tracebrain::core::v1::EpisodeSummary> episodes;
  int64_t                                           total = 0;
};

/*
  Single-pass aggregates over a trace snapshot. The Compute* functions are
  pure; AnalyticsEngine only fetches the snapshot from the store.

  Confidence rollups skip traces without an evaluation block instead of
  counting them as zero.
*/

tracebrain::analytics::v1::TraceStats ComputeStats(const std::vector<tracebrain::core::v1::Trace>& traces, util::TimePoint now);

// Sorted by invocation count descending, then tool name.
std::vector<tracebrain::analytics::v1::ToolUsage> ComputeToolUsage(const std::vector<tracebrain::core::v1::Trace>& traces);

// `traces` are the episode's traces in creation order.
tracebrain::core::v1::EpisodeSummary SummarizeEpisode(const std::string&                              episode_id,
                                                      const std::vector<tracebrain::core::v1::Trace>& traces);

class AnalyticsEngine {
 public:
  explicit AnalyticsEngine(std::shared_ptr<core::TraceStore> store);

  tracebrain::analytics::v1::TraceStats Stats(const util::Deadline& deadline = {});

  std::vector<tracebrain::analytics::v1::ToolUsage> ToolUsageReport(const util::Deadline& deadline = {});

  // Most recently active first. With max_avg_confidence set, episodes
  // without evaluated traces are left out.
  EpisodePage ListEpisodes(std::optional<double> max_avg_confidence, int skip, int limit, const util::Deadline& deadline = {});

 private:
  std::shared_ptr<core::TraceStore> store_;
};

} // namespace tracebrain::analytics
