#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

#include "core/model/types.hpp"
#include "core/pool/assignment_table.hpp"
#include "core/pool/pool_remote.hpp"
#include "core/schedule/scheduler.hpp"
#include "core/storage/journal.hpp"
#include "core/storage/ledger.hpp"

namespace keyspan {

// In-process pool backed by the shared ledger. Hands out ranges from the
// scheduler's recommended set and persists assignments plus participant
// contributions to pool_server.json.
class LocalPoolServer final : public IPoolRemote {
public:
  LocalPoolServer(ProgressLedger& ledger, AdaptiveScheduler scheduler);

  Result open(const StorageContext& context);
  // Reaps expired assignments; returns the number reaped in data.
  Result tick(std::chrono::milliseconds timeout);

  Result register_participant(std::string_view client_id, std::chrono::milliseconds timeout) override;
  Result request_assignment(const AssignmentRequest& request, std::chrono::milliseconds timeout,
                            Assignment& out) override;
  Result report_progress(const ProgressReport& report, std::chrono::milliseconds timeout) override;
  Result report_completion(const CompletionReport& report, std::chrono::milliseconds timeout) override;
  Result abandon_assignment(std::string_view assignment_id, std::string_view client_id, std::string_view reason,
                            std::chrono::milliseconds timeout) override;
  Result fetch_stats(std::string_view client_id, std::chrono::milliseconds timeout, PoolStats& out) override;

  void set_target_id(std::string target_id);
  [[nodiscard]] std::vector<AssignmentRecord> assignments() const;

private:
  Result load();
  Result save() const;
  std::size_t reap_expired_locked(std::int64_t now);
  bool eligible(const LedgerEntry& entry, const AssignmentRequest& request,
                const std::vector<LedgerEntry>& entries) const;

  ProgressLedger& ledger_;
  AdaptiveScheduler scheduler_;
  StorageContext context_;
  std::string path_;
  Journal journal_;
  AssignmentTable table_;
  std::string target_id_;

  mutable std::timed_mutex mutex_;
  std::map<std::string, Contribution> participants_;
};

}  // namespace keyspan
