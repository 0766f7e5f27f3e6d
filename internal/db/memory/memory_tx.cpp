#include "memory_tx.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace tracebrain::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_           = repo_.committed_;
  snapshot_versions_ = repo_.trace_versions_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable(const std::string& trace_id) {
  touched_.insert(trace_id);
  return working_;
}

void MemoryTransaction::AppendSignal(const model::ReviewSignalRecord& record) {
  working_.review_signals.push_back(record);
  new_signals_.push_back(record);
}

void MemoryTransaction::Commit() {
  if (rolled_back_) {
    throw std::logic_error("commit after rollback");
  }
  if (committed_) {
    return;
  }

  auto version_of = [](const std::unordered_map<std::string, uint64_t>& versions, const std::string& id) -> uint64_t {
    auto it = versions.find(id);
    return it == versions.end() ? 0 : it->second;
  };

  std::scoped_lock lock(repo_.mutex_);
  for (const auto& id : touched_) {
    if (version_of(repo_.trace_versions_, id) != version_of(snapshot_versions_, id)) {
      throw tracebrain::util::TransactionConflict("trace " + id + " was modified by a concurrent transaction");
    }
  }

  auto& committed = repo_.committed_;
  for (const auto& id : touched_) {
    if (!committed.traces.contains(id)) {
      committed.trace_order.push_back(id);
    }
    committed.traces[id] = working_.traces.at(id);

    if (auto spans = working_.spans.find(id); spans != working_.spans.end()) {
      committed.spans[id] = spans->second;
    }
    if (auto feedback = working_.feedback.find(id); feedback != working_.feedback.end()) {
      committed.feedback[id] = feedback->second;
    }
    ++repo_.trace_versions_[id];
  }
  committed.review_signals.insert(committed.review_signals.end(), new_signals_.begin(), new_signals_.end());
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace tracebrain::db::memory
