#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "tracebrain/core/v1/trace.pb.h"

namespace tracebrain::reconstruction {

/*
  Span forest of a single trace.

  Spans live in an arena in ingestion order; parent and child links are
  arena indices. Children of one parent are kept in ingestion order, which
  is also the order siblings are reported in.

  The forest is immutable once built and never persists anything.
*/
class SpanForest {
 public:
  // Throws util::DanglingParent, util::CycleDetected, or util::ConflictError
  // for a span id that appears twice.
  static SpanForest Build(std::vector<tracebrain::core::v1::Span> spans);

  std::size_t size() const {
    return nodes_.size();
  }

  bool Contains(const std::string& span_id) const {
    return index_.contains(span_id);
  }

  const tracebrain::core::v1::Span* Find(const std::string& span_id) const;

  std::vector<std::string> Roots() const;
  std::vector<std::string> Children(const std::string& span_id) const;
  std::size_t              Depth(const std::string& span_id) const;

  // Span ids from the root down to span_id.
  std::vector<std::string> PathFromRoot(const std::string& span_id) const;

  // Concatenated deltas of the root-to-span chain. Throws util::NotFound.
  std::string Reconstruct(const std::string& span_id) const;

  // Ids with no children.
  std::vector<std::string> Leaves() const;

  // Spans in ingestion order.
  std::vector<tracebrain::core::v1::Span> Spans() const;

 private:
  struct Node {
    tracebrain::core::v1::Span span;
    std::string                delta;
    std::optional<std::size_t> parent;
    std::vector<std::size_t>   children;
  };

  SpanForest() = default;

  std::size_t IndexOf(const std::string& span_id) const;
  void        DetectCycles() const;

  std::vector<Node>                            nodes_;
  std::unordered_map<std::string, std::size_t> index_;
};

// Delta text of one span, empty when it carries none.
std::string DeltaOf(const tracebrain::core::v1::Span& span);

} // namespace tracebrain::reconstruction
