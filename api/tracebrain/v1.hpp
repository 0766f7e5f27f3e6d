#pragma once

#include "tracebrain/core/v1/trace.pb.h"

#include "tracebrain/query/v1/query.pb.h"

#include "tracebrain/analytics/v1/analytics.pb.h"

#include "tracebrain/services/v1/trace_service.pb.h"

namespace tracebrain::v1 {
using namespace ::tracebrain::core::v1;
using namespace ::tracebrain::query::v1;
using namespace ::tracebrain::analytics::v1;
using namespace ::tracebrain::services::v1;
}
