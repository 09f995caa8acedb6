#include "core/schedule/scheduler.hpp"

#include <algorithm>
#include <utility>

#include "core/model/app_meta.hpp"
#include "core/storage/json_codec.hpp"
#include "core/util/common.hpp"

namespace keyspan {
namespace {

bool assignable(const LedgerEntry& entry, const std::unordered_set<std::string>& claimed) {
  return !is_terminal(entry.range.status) && !claimed.contains(entry.range.id);
}

}  // namespace

AdaptiveScheduler::AdaptiveScheduler(SchedulerConfig config) : config_(std::move(config)) {}

int AdaptiveScheduler::priority(const ProgressRecord& record) const {
  int score = 50;
  if (record.search_rate > config_.high_rate_threshold) {
    score += 20;
  }
  if (record.percent_hundredths > 7500) {
    score -= 30;
  } else if (record.percent_hundredths > 5000) {
    score -= 15;
  }
  return std::clamp(score, 0, 100);
}

bool AdaptiveScheduler::in_high_band(const LedgerEntry& entry) const {
  return entry.range.status != RangeStatus::Abandoned && entry.range.priority >= config_.high_priority_floor;
}

bool AdaptiveScheduler::high_priority_exhausted(const std::vector<LedgerEntry>& entries) const {
  return std::ranges::all_of(entries, [this](const LedgerEntry& entry) {
    return !in_high_band(entry) || entry.progress.percent_hundredths >= config_.band_exhausted_hundredths;
  });
}

std::int64_t AdaptiveScheduler::high_priority_completion(const std::vector<LedgerEntry>& entries) const {
  std::int64_t sum = 0;
  std::int64_t count = 0;
  for (const auto& entry : entries) {
    if (in_high_band(entry)) {
      sum += entry.progress.percent_hundredths;
      ++count;
    }
  }
  return count == 0 ? 0 : sum / count;
}

std::vector<std::string> AdaptiveScheduler::stalled_ranges(const std::vector<LedgerEntry>& entries,
                                                           std::int64_t now_unix) const {
  std::vector<std::string> stalled;
  for (const auto& entry : entries) {
    if (entry.range.status != RangeStatus::Active) {
      continue;
    }
    if (now_unix - entry.progress.last_update_unix > config_.stall_window_seconds) {
      stalled.push_back(entry.range.id);
    }
  }
  return stalled;
}

std::vector<std::string> AdaptiveScheduler::recommendations(const std::vector<LedgerEntry>& entries,
                                                            std::int64_t now_unix) const {
  std::vector<std::string> out;

  const bool band_present = std::ranges::any_of(entries, [this](const LedgerEntry& e) { return in_high_band(e); });
  if (band_present && high_priority_exhausted(entries)) {
    out.push_back("High-priority ranges exhausted; activate fallback ranges.");
  }

  std::size_t slow = 0;
  for (const auto& entry : entries) {
    // A zero rate means no rate has been reported yet; stall detection covers that case.
    if (entry.range.status == RangeStatus::Active && entry.progress.search_rate > 0.0 &&
        entry.progress.search_rate < config_.slow_rate_floor) {
      ++slow;
    }
  }
  if (slow > 0) {
    out.push_back(std::to_string(slow) + " range(s) have a slow search rate; check worker throughput.");
  }

  const auto stalled = stalled_ranges(entries, now_unix);
  if (!stalled.empty()) {
    out.push_back(std::to_string(stalled.size()) + " range(s) appear stalled: " + util::join(stalled, ", ") +
                  ". Check worker processes.");
  }

  BigKey total;
  BigKey searched;
  for (const auto& entry : entries) {
    if (entry.range.status != RangeStatus::Abandoned) {
      total += entry.progress.total_keys;
      searched += entry.progress.searched_keys;
    }
  }
  if (!total.is_zero()) {
    const std::int64_t coverage = percent_hundredths(searched, total);
    if (coverage > 9000) {
      out.push_back("Over 90% complete; activate the remaining fallback ranges.");
    } else if (coverage > 5000) {
      out.push_back("Over 50% complete; review coverage and consider reallocating ranges.");
    } else if (coverage < 1000) {
      out.push_back("Search just started; monitor the first 24 hours to establish baseline rates.");
    }
  }
  return out;
}

std::vector<KeyRange> AdaptiveScheduler::lower_band(const std::vector<LedgerEntry>& entries,
                                                    const std::unordered_set<std::string>& claimed) const {
  std::vector<KeyRange> out;
  for (const auto& entry : entries) {
    if (assignable(entry, claimed) && entry.range.priority < config_.high_priority_floor) {
      out.push_back(entry.range);
    }
  }
  std::ranges::stable_sort(out, [](const KeyRange& a, const KeyRange& b) { return a.priority > b.priority; });
  return out;
}

std::vector<KeyRange> AdaptiveScheduler::select_next(const std::vector<LedgerEntry>& entries,
                                                     const std::unordered_set<std::string>& claimed) const {
  if (!high_priority_exhausted(entries)) {
    return {};
  }
  std::vector<KeyRange> out = lower_band(entries, claimed);
  if (out.size() > config_.select_limit) {
    out.resize(config_.select_limit);
  }
  return out;
}

std::vector<KeyRange> AdaptiveScheduler::recommended_set(const std::vector<LedgerEntry>& entries,
                                                         const std::unordered_set<std::string>& claimed) const {
  std::vector<ScoredRange> band;
  for (const auto& entry : entries) {
    if (assignable(entry, claimed) && in_high_band(entry)) {
      band.push_back({entry.range, priority(entry.progress)});
    }
  }
  std::ranges::stable_sort(band, [](const ScoredRange& a, const ScoredRange& b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.range.priority > b.range.priority;
  });

  std::vector<KeyRange> rest = lower_band(entries, claimed);
  std::vector<KeyRange> out;
  out.reserve(band.size() + rest.size());
  if (high_priority_exhausted(entries)) {
    out.insert(out.end(), rest.begin(), rest.end());
    for (auto& scored : band) {
      out.push_back(std::move(scored.range));
    }
  } else {
    for (auto& scored : band) {
      out.push_back(std::move(scored.range));
    }
    out.insert(out.end(), rest.begin(), rest.end());
  }
  return out;
}

Result AdaptiveScheduler::plan_split(const LedgerEntry& entry, std::size_t count, std::int64_t now_unix,
                                     std::vector<KeyRange>& out) const {
  if (count < 1) {
    return Result::failure(ErrorCode::Validation, "Split count must be at least 1.");
  }
  const BigKey total = entry.range.width();
  const BigKey pieces{static_cast<std::uint64_t>(count)};
  if (total < pieces) {
    return Result::failure(ErrorCode::Validation, "Split count exceeds the keys in " + entry.range.id + ".");
  }
  if (is_terminal(entry.range.status)) {
    return Result::failure(ErrorCode::InvalidState,
                           "Range " + entry.range.id + " is " + codec::status_name(entry.range.status) + ".");
  }

  const BigKey chunk = total / pieces;
  const int child_priority = entry.range.status == RangeStatus::Active
                                 ? std::max(entry.range.priority, config_.split_active_priority)
                                 : entry.range.priority;

  std::vector<KeyRange> children;
  children.reserve(count);
  BigKey cursor = entry.range.start;
  for (std::size_t i = 0; i < count; ++i) {
    KeyRange child;
    child.id = entry.range.id + "_split_" + std::to_string(i);
    child.start = cursor;
    child.end = (i + 1 == count) ? entry.range.end : cursor + chunk;
    child.priority = child_priority;
    child.parent_id = entry.range.id;
    child.label = "split " + std::to_string(i + 1) + "/" + std::to_string(count) + " of " + entry.range.id;
    child.created_unix = now_unix;
    cursor = child.end;
    children.push_back(std::move(child));
  }
  out = std::move(children);
  return Result::success();
}

Result AdaptiveScheduler::split_range(ProgressLedger& ledger, std::string_view range_id, std::size_t count,
                                      std::int64_t now_unix, std::vector<KeyRange>& out) const {
  const auto entry = ledger.find(range_id);
  if (!entry.has_value()) {
    return Result::failure(ErrorCode::Validation, "Unknown range id " + std::string{range_id} + ".");
  }

  std::vector<KeyRange> children;
  if (Result planned = plan_split(*entry, count, now_unix, children); !planned.ok) {
    return planned;
  }
  const Result applied = ledger.apply_split(range_id, children, "split_" + std::to_string(count) + "way");
  if (!applied.ok) {
    return applied;
  }
  out = std::move(children);
  return Result::success("Range " + std::string{range_id} + " split into " + std::to_string(count) + " ranges.");
}

AdaptiveStrategy AdaptiveScheduler::build_strategy(const std::vector<LedgerEntry>& entries,
                                                   std::int64_t now_unix) const {
  AdaptiveStrategy strategy;
  strategy.generated_unix = now_unix;
  for (const auto& entry : entries) {
    if (entry.range.status == RangeStatus::Completed) {
      strategy.completed_ranges.push_back(entry.range.id);
    } else if (entry.range.status == RangeStatus::Active) {
      strategy.current_ranges.push_back({entry.range, priority(entry.progress)});
    }
    if (entry.range.status != RangeStatus::Abandoned) {
      strategy.coverage.total_keyspace += entry.progress.total_keys;
      strategy.coverage.searched_keyspace += entry.progress.searched_keys;
    }
  }
  strategy.coverage.percent_hundredths =
      percent_hundredths(strategy.coverage.searched_keyspace, strategy.coverage.total_keyspace);
  strategy.high_priority_complete_hundredths = high_priority_completion(entries);
  strategy.next_recommended = select_next(entries, {});
  strategy.recommendations = recommendations(entries, now_unix);
  return strategy;
}

Result AdaptiveScheduler::save_strategy(const StorageContext& context, const AdaptiveStrategy& strategy) const {
  return codec::write_file_atomic(context.path_for(kStrategyFile), codec::encode_strategy(strategy));
}

}  // namespace keyspan
