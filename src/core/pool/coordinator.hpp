#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "core/model/types.hpp"
#include "core/pool/pool_remote.hpp"
#include "core/storage/journal.hpp"
#include "core/storage/ledger.hpp"

namespace keyspan {

// Participant side of the pool. Local ledger writes always happen first;
// the remote is told afterwards and its failures only degrade, never undo.
class PoolCoordinator {
public:
  using SnapshotFn = std::function<std::optional<ProgressSnapshot>()>;

  PoolCoordinator(StorageContext context, ProgressLedger& ledger, IPoolRemote& remote,
                  CoordinatorOptions options = {});
  ~PoolCoordinator();

  PoolCoordinator(const PoolCoordinator&) = delete;
  PoolCoordinator& operator=(const PoolCoordinator&) = delete;

  Result initialize(std::optional<CustomRange> custom_range = std::nullopt);

  Result request_assignment(Assignment& out);
  Result report_progress(const BigKey& searched_keys, double search_rate);
  Result report_completion(bool found, std::string_view evidence);
  Result abandon_assignment(std::string_view reason);
  Result get_stats(PoolStats& out);

  Result start_auto_reporting(SnapshotFn snapshot_fn);
  void stop_auto_reporting();
  [[nodiscard]] bool auto_reporting() const;

  [[nodiscard]] std::optional<Assignment> current_assignment() const;
  [[nodiscard]] PoolConfig config() const;
  [[nodiscard]] bool pending_sync() const;

private:
  Result require_initialized() const;
  Result load_or_create_config();
  Result save_config() const;
  Result load_assignment();
  Result save_assignment() const;
  void clear_assignment(std::string_view event, std::string_view detail);
  void append_history(std::string_view event, std::string_view detail) const;
  Result report_progress_locked(const BigKey& searched_keys, double search_rate);
  [[nodiscard]] std::int64_t lease_seconds() const;
  void auto_report_loop();
  void auto_report_once();

  StorageContext context_;
  ProgressLedger& ledger_;
  IPoolRemote& remote_;
  CoordinatorOptions options_;
  Journal journal_;

  mutable std::mutex op_mutex_;
  bool initialized_ = false;
  PoolConfig config_;
  std::optional<Assignment> assignment_;
  std::optional<PoolStats> last_stats_;
  bool pending_sync_ = false;

  mutable std::mutex auto_mutex_;
  std::condition_variable auto_cv_;
  std::thread auto_thread_;
  SnapshotFn snapshot_fn_;
  bool auto_running_ = false;
  bool stop_requested_ = false;
};

}  // namespace keyspan
