#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace tracebrain::db::memory {

/*
  Snapshot of the committed state plus the set of traces written.

  Commit publishes only the touched traces (and appended review signals)
  and fails with util::TransactionConflict if one of those traces was
  committed by someone else after the snapshot. Writers to different
  traces never conflict.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  // Working state for writes to trace_id.
  MemoryRepository::State& Mutable(const std::string& trace_id);

  void AppendSignal(const model::ReviewSignalRecord& record);

  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&                         repo_;
  MemoryRepository::State                   working_;
  std::unordered_map<std::string, uint64_t> snapshot_versions_;
  std::unordered_set<std::string>           touched_;
  std::vector<model::ReviewSignalRecord>    new_signals_;
  bool                                      committed_   = false;
  bool                                      rolled_back_ = false;
};

} // namespace tracebrain::db::memory
