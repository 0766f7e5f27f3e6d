#include "span_forest.hpp"

#include <algorithm>
#include <utility>

#include "internal/schema/attribute_keys.hpp"
#include "internal/util/errors.hpp"

namespace tracebrain::reconstruction {

using tracebrain::core::v1::Span;

std::string DeltaOf(const Span& span) {
  const auto& fields = span.attributes().fields();
  auto        it     = fields.find(schema::keys::LLM_NEW_CONTENT);
  if (it == fields.end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return {};
  }
  return it->second.string_value();
}

SpanForest SpanForest::Build(std::vector<Span> spans) {
  SpanForest forest;
  forest.nodes_.reserve(spans.size());
  forest.index_.reserve(spans.size());

  for (auto& span : spans) {
    if (span.span_id().empty()) {
      throw util::ValidationError("span_id is required");
    }
    if (!forest.index_.emplace(span.span_id(), forest.nodes_.size()).second) {
      throw util::ConflictError("duplicate span_id in trace", span.span_id());
    }
    Node node;
    node.delta = DeltaOf(span);
    node.span  = std::move(span);
    forest.nodes_.push_back(std::move(node));
  }

  for (std::size_t i = 0; i < forest.nodes_.size(); ++i) {
    auto& node = forest.nodes_[i];
    if (node.span.parent_id().empty()) {
      continue;
    }
    auto parent = forest.index_.find(node.span.parent_id());
    if (parent == forest.index_.end()) {
      throw util::DanglingParent(node.span.span_id(), node.span.parent_id());
    }
    node.parent = parent->second;
    forest.nodes_[parent->second].children.push_back(i);
  }

  forest.DetectCycles();
  return forest;
}

void SpanForest::DetectCycles() const {
  enum class Mark : unsigned char { kUnvisited, kOnPath, kDone };
  std::vector<Mark> marks(nodes_.size(), Mark::kUnvisited);

  std::vector<std::size_t> path;
  for (std::size_t start = 0; start < nodes_.size(); ++start) {
    path.clear();
    std::optional<std::size_t> cursor = start;
    while (cursor && marks[*cursor] == Mark::kUnvisited) {
      marks[*cursor] = Mark::kOnPath;
      path.push_back(*cursor);
      cursor = nodes_[*cursor].parent;
    }
    if (cursor && marks[*cursor] == Mark::kOnPath) {
      throw util::CycleDetected(nodes_[*cursor].span.span_id());
    }
    for (auto index : path) {
      marks[index] = Mark::kDone;
    }
  }
}

std::size_t SpanForest::IndexOf(const std::string& span_id) const {
  auto it = index_.find(span_id);
  if (it == index_.end()) {
    throw util::NotFound("span not found: " + span_id);
  }
  return it->second;
}

const Span* SpanForest::Find(const std::string& span_id) const {
  auto it = index_.find(span_id);
  return it == index_.end() ? nullptr : &nodes_[it->second].span;
}

std::vector<std::string> SpanForest::Roots() const {
  std::vector<std::string> out;
  for (const auto& node : nodes_) {
    if (!node.parent) {
      out.push_back(node.span.span_id());
    }
  }
  return out;
}

std::vector<std::string> SpanForest::Children(const std::string& span_id) const {
  std::vector<std::string> out;
  for (auto child : nodes_[IndexOf(span_id)].children) {
    out.push_back(nodes_[child].span.span_id());
  }
  return out;
}

std::size_t SpanForest::Depth(const std::string& span_id) const {
  std::size_t depth  = 0;
  auto        cursor = nodes_[IndexOf(span_id)].parent;
  while (cursor) {
    ++depth;
    cursor = nodes_[*cursor].parent;
  }
  return depth;
}

std::vector<std::string> SpanForest::PathFromRoot(const std::string& span_id) const {
  std::vector<std::string>   path;
  std::optional<std::size_t> cursor = IndexOf(span_id);
  while (cursor) {
    path.push_back(nodes_[*cursor].span.span_id());
    cursor = nodes_[*cursor].parent;
  }
  std::reverse(path.begin(), path.end());
  return path;
}

std::string SpanForest::Reconstruct(const std::string& span_id) const {
  std::vector<const std::string*> chain;
  std::optional<std::size_t>      cursor = IndexOf(span_id);
  std::size_t                     length = 0;
  while (cursor) {
    chain.push_back(&nodes_[*cursor].delta);
    length += nodes_[*cursor].delta.size();
    cursor = nodes_[*cursor].parent;
  }

  std::string content;
  content.reserve(length);
  for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
    content += **it;
  }
  return content;
}

std::vector<std::string> SpanForest::Leaves() const {
  std::vector<std::string> out;
  for (const auto& node : nodes_) {
    if (node.children.empty()) {
      out.push_back(node.span.span_id());
    }
  }
  return out;
}

std::vector<Span> SpanForest::Spans() const {
  std::vector<Span> out;
  out.reserve(nodes_.size());
  for (const auto& node : nodes_) {
    out.push_back(node.span);
  }
  return out;
}

} // namespace tracebrain::reconstruction
