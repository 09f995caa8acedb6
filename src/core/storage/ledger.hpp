#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/model/types.hpp"
#include "core/storage/journal.hpp"

namespace keyspan {

// Durable per-range progress. The index is guarded by a shared_mutex and each
// entry by its own mutex, so writers on one range never block other ranges.
class ProgressLedger {
public:
  Result open(const StorageContext& context);

  Result register_range(const KeyRange& range);
  Result seed_from_manifest(const Manifest& manifest);
  [[nodiscard]] bool seeded() const;

  // A non-empty holder must match the assignment recorded by activate(),
  // otherwise the write is rejected with InvalidState. An empty holder is an
  // operator or pool-side write and skips the check.
  Result update(std::string_view range_id, const BigKey& searched_keys, std::optional<double> rate,
                ProgressRecord& out, std::string_view holder = {});
  // pending -> active without touching counters; used when a range is claimed.
  Result activate(std::string_view range_id, std::string_view holder = {});
  Result mark_completed(std::string_view range_id, bool exhausted, std::string_view holder = {});
  // With a holder, the holder must still own one of the overlapping ranges.
  Result complete_overlapping(const BigKey& start, const BigKey& end, std::vector<std::string>& completed_ids,
                              std::string_view holder = {});
  Result release(std::string_view range_id, std::string_view holder = {});
  Result apply_split(std::string_view parent_id, const std::vector<KeyRange>& children,
                     std::string_view split_reason);

  [[nodiscard]] std::vector<LedgerEntry> snapshot() const;
  [[nodiscard]] std::optional<LedgerEntry> find(std::string_view range_id) const;
  [[nodiscard]] CoverageSummary aggregate_coverage() const;
  [[nodiscard]] std::size_t size() const;

  Result save() const;

private:
  struct Slot {
    mutable std::mutex mutex;
    LedgerEntry entry;
  };

  Result load();
  Result insert_locked(const KeyRange& range, std::int64_t now);
  [[nodiscard]] Slot* slot_for(std::string_view range_id) const;
  [[nodiscard]] std::vector<LedgerEntry> copy_entries() const;
  Result persist_or_report(std::string_view action) const;
  void recompute(ProgressRecord& record, std::int64_t now) const;

  StorageContext context_;
  std::string path_;
  Journal journal_;

  mutable std::shared_mutex structure_mutex_;
  mutable std::mutex save_mutex_;
  std::vector<std::unique_ptr<Slot>> slots_;
  std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace keyspan
