#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/model/big_key.hpp"

namespace keyspan {

enum class ErrorCode {
  None,
  Validation,
  InvalidState,
  NotFound,
  Unavailable,
  Corrupt,
  Io,
};

struct Result {
  bool ok = false;
  ErrorCode code = ErrorCode::None;
  std::string message;
  std::string data;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, ErrorCode::None, std::move(msg), std::move(payload)};
  }

  static Result failure(ErrorCode code, std::string msg) {
    return {false, code, std::move(msg), {}};
  }
};

enum class RangeStatus {
  Pending,
  Active,
  Completed,
  Abandoned,
};

[[nodiscard]] inline bool is_terminal(RangeStatus status) {
  return status == RangeStatus::Completed || status == RangeStatus::Abandoned;
}

// Half-open interval [start, end) of the keyspace.
struct KeyRange {
  std::string id;
  BigKey start;
  BigKey end;
  int priority = 50;
  RangeStatus status = RangeStatus::Pending;
  std::string parent_id;
  std::string label;
  std::string split_reason;
  std::int64_t created_unix = 0;

  [[nodiscard]] BigKey width() const { return BigKey::saturating_sub(end, start); }
  [[nodiscard]] bool overlaps(const BigKey& other_start, const BigKey& other_end) const {
    return start < other_end && other_start < end;
  }
};

struct ProgressRecord {
  std::string range_id;
  BigKey total_keys;
  BigKey searched_keys;
  std::int64_t percent_hundredths = 0;
  double search_rate = 0.0;
  std::int64_t started_unix = 0;
  std::int64_t last_update_unix = 0;
  std::optional<std::int64_t> estimated_completion_unix;
  RangeStatus status = RangeStatus::Pending;
  // Assignment id currently holding the range; empty when unclaimed.
  std::string holder;

  [[nodiscard]] double percent_complete() const {
    return static_cast<double>(percent_hundredths) / 100.0;
  }
};

struct LedgerEntry {
  KeyRange range;
  ProgressRecord progress;
};

struct CoverageSummary {
  BigKey total_keyspace;
  BigKey searched_keyspace;
  std::int64_t percent_hundredths = 0;
};

struct ProbabilityEstimate {
  double central = 50.0;
  double ci_lower = 0.0;
  double ci_upper = 100.0;
};

struct KeyspaceConfig {
  BigKey range_min = BigKey::pow2(70);
  BigKey range_max = BigKey::saturating_sub(BigKey::pow2(71), BigKey{1});
  std::string target_id;

  [[nodiscard]] BigKey range_size() const {
    return BigKey::saturating_sub(range_max, range_min) + BigKey{1};
  }
};

struct PartitionConfig {
  double core_lower_pct = 40.0;
  double core_upper_pct = 90.0;
  bool center_on_estimate = false;
  std::vector<double> parallel_split_fractions = {0.30, 0.30, 0.40};
  int core_priority = 90;
  int parallel_priority = 80;
  int fallback_priority = 40;
  int fallback_priority_step = 5;
};

struct Manifest {
  KeyspaceConfig keyspace;
  ProbabilityEstimate estimate;
  KeyRange core;
  std::vector<KeyRange> parallel_splits;
  std::vector<KeyRange> fallback;
  std::int64_t generated_unix = 0;
};

struct SchedulerConfig {
  double high_rate_threshold = 1e9;
  double slow_rate_floor = 5e8;
  std::int64_t stall_window_seconds = 2 * 60 * 60;
  std::int64_t band_exhausted_hundredths = 9500;
  int high_priority_floor = 70;
  int split_active_priority = 70;
  std::size_t select_limit = 3;
};

struct ScoredRange {
  KeyRange range;
  int score = 0;
};

struct AdaptiveStrategy {
  std::vector<ScoredRange> current_ranges;
  std::vector<std::string> completed_ranges;
  std::vector<KeyRange> next_recommended;
  CoverageSummary coverage;
  std::int64_t high_priority_complete_hundredths = 0;
  std::vector<std::string> recommendations;
  std::int64_t generated_unix = 0;
};

enum class ScanType {
  IncludeDefeated,
  ExcludeDefeated,
  CustomRange,
};

struct CustomRange {
  BigKey start;
  BigKey end;
};

struct PoolConfig {
  std::string pool_url = "local://keyspan";
  std::string client_id;
  ScanType scan_type = ScanType::IncludeDefeated;
  std::uint64_t report_interval_seconds = 300;
  std::optional<CustomRange> custom_range;
};

struct Assignment {
  std::string assignment_id;
  std::string range_id;
  std::string client_id;
  BigKey start;
  BigKey end;
  std::string target_id;
  int priority = 50;
  std::int64_t assigned_unix = 0;
  std::optional<std::int64_t> expires_unix;
};

struct Contribution {
  std::string client_id;
  std::size_t ranges_completed = 0;
  BigKey keys_searched;
  std::size_t rank = 0;
};

struct PoolStats {
  std::size_t participant_count = 0;
  std::size_t ranges_completed = 0;
  std::int64_t keyspace_covered_hundredths = 0;
  std::int64_t searched_hundredths = 0;
  std::vector<Contribution> participants;
  std::optional<Contribution> your_contribution;
  bool stale = false;
  std::int64_t as_of_unix = 0;
};

struct ProgressSnapshot {
  BigKey searched_keys;
  double search_rate = 0.0;
};

struct CoordinatorOptions {
  std::chrono::milliseconds tick{1000};
  double grace_factor = 2.0;
  std::chrono::milliseconds remote_timeout{2000};
};

// Storage root and clock shared by every component of one process.
struct StorageContext {
  std::string root;
  std::function<std::int64_t()> now_unix;

  [[nodiscard]] std::int64_t now() const;
  [[nodiscard]] std::string path_for(std::string_view file_name) const;
};

struct InitConfig {
  std::string data_dir;
  std::function<std::int64_t()> clock;
  PartitionConfig partition;
  SchedulerConfig scheduler;
  CoordinatorOptions coordinator;
};

}  // namespace keyspan
