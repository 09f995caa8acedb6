#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "core/model/types.hpp"
#include "core/storage/ledger.hpp"

namespace keyspan {

// Stateless policy over ledger snapshots: scores ranges, emits operator
// recommendations, chooses what to hand out next and splits ranges.
class AdaptiveScheduler {
public:
  AdaptiveScheduler() = default;
  explicit AdaptiveScheduler(SchedulerConfig config);

  [[nodiscard]] const SchedulerConfig& config() const { return config_; }

  [[nodiscard]] int priority(const ProgressRecord& record) const;

  [[nodiscard]] std::vector<std::string> recommendations(const std::vector<LedgerEntry>& entries,
                                                         std::int64_t now_unix) const;
  [[nodiscard]] std::vector<std::string> stalled_ranges(const std::vector<LedgerEntry>& entries,
                                                        std::int64_t now_unix) const;
  [[nodiscard]] bool high_priority_exhausted(const std::vector<LedgerEntry>& entries) const;
  [[nodiscard]] std::int64_t high_priority_completion(const std::vector<LedgerEntry>& entries) const;

  // Empty until the high-priority band is exhausted.
  [[nodiscard]] std::vector<KeyRange> select_next(const std::vector<LedgerEntry>& entries,
                                                  const std::unordered_set<std::string>& claimed) const;
  // Every assignable range in hand-out order.
  [[nodiscard]] std::vector<KeyRange> recommended_set(const std::vector<LedgerEntry>& entries,
                                                      const std::unordered_set<std::string>& claimed) const;

  Result plan_split(const LedgerEntry& entry, std::size_t count, std::int64_t now_unix,
                    std::vector<KeyRange>& out) const;
  Result split_range(ProgressLedger& ledger, std::string_view range_id, std::size_t count, std::int64_t now_unix,
                     std::vector<KeyRange>& out) const;

  [[nodiscard]] AdaptiveStrategy build_strategy(const std::vector<LedgerEntry>& entries,
                                                std::int64_t now_unix) const;
  Result save_strategy(const StorageContext& context, const AdaptiveStrategy& strategy) const;

private:
  [[nodiscard]] bool in_high_band(const LedgerEntry& entry) const;
  [[nodiscard]] std::vector<KeyRange> lower_band(const std::vector<LedgerEntry>& entries,
                                                 const std::unordered_set<std::string>& claimed) const;

  SchedulerConfig config_;
};

}  // namespace keyspan
