#pragma once

#include <optional>

#include "internal/schema/attribute_schema.hpp"
#include "tracebrain/core/v1/trace.pb.h"
#include "tracebrain/query/v1/query.pb.h"

namespace tracebrain::core {

/*
  Predicate evaluation for TraceFilter. Filters read the trace-level
  attribute bag; an unset filter field never constrains.
*/

// Throws util::ValidationError for unknown enum values or inverted ranges.
void ValidateFilter(const tracebrain::query::v1::TraceFilter& filter);

bool Matches(const tracebrain::query::v1::TraceFilter& filter, const tracebrain::core::v1::Trace& trace);

// Rating of the most recently appended feedback that carries one.
std::optional<int> LatestFeedbackRating(const tracebrain::core::v1::Trace& trace);

// Feedback rating first, evaluation rating as fallback.
std::optional<int> EffectiveRating(const tracebrain::core::v1::Trace& trace);

std::optional<schema::Evaluation> EvaluationOf(const tracebrain::core::v1::Trace& trace);

} // namespace tracebrain::core
