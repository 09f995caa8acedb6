#pragma once

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"
#include "core/partition/partitioner.hpp"
#include "core/pool/coordinator.hpp"
#include "core/pool/local_pool_server.hpp"
#include "core/schedule/scheduler.hpp"
#include "core/storage/directory_lock.hpp"
#include "core/storage/journal.hpp"
#include "core/storage/ledger.hpp"

namespace keyspan {

// Wires ledger, scheduler, pool server and coordinator over one storage root.
// Holds the root's lock for its whole lifetime.
class CoreApi {
public:
  CoreApi() = default;
  ~CoreApi();

  CoreApi(const CoreApi&) = delete;
  CoreApi& operator=(const CoreApi&) = delete;

  Result init(const InitConfig& config);

  Result plan(const ProbabilityEstimate& estimate, const KeyspaceConfig& keyspace, Manifest& out);
  Result update(std::string_view range_id, const BigKey& searched_keys, std::optional<double> rate,
                ProgressRecord& out);
  Result split(std::string_view range_id, std::size_t count, std::vector<KeyRange>& out);
  Result strategy(AdaptiveStrategy& out);

  Result pool_init(std::optional<CustomRange> custom_range);
  Result request(Assignment& out);
  Result report(const BigKey& searched_keys, double search_rate);
  Result complete(bool found, std::string_view evidence);
  Result abandon(std::string_view reason);
  Result stats(PoolStats& out);

  [[nodiscard]] std::vector<LedgerEntry> ranges() const;
  [[nodiscard]] CoverageSummary coverage() const;
  [[nodiscard]] std::optional<Manifest> manifest() const;

  ProgressLedger& ledger() { return *ledger_; }
  LocalPoolServer& pool_server() { return *server_; }
  PoolCoordinator& coordinator() { return *coordinator_; }

private:
  Result require_ready() const;
  Result ensure_pool();

  StorageContext context_;
  InitConfig config_;
  DirectoryLock lock_;
  Journal journal_;
  KeyspacePartitioner partitioner_;
  AdaptiveScheduler scheduler_;
  std::unique_ptr<ProgressLedger> ledger_;
  std::unique_ptr<LocalPoolServer> server_;
  std::unique_ptr<PoolCoordinator> coordinator_;
  bool pool_ready_ = false;
};

}  // namespace keyspan
