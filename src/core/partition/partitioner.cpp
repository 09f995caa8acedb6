#include "core/partition/partitioner.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>
#include <utility>

namespace keyspan {
namespace {

constexpr std::int64_t kPercentScale = 1000000;
constexpr double kFractionTolerance = 1e-9;

bool in_percent_bounds(double value) {
  return std::isfinite(value) && value >= 0.0 && value <= 100.0;
}

std::string band_label(double lower, double upper) {
  const auto to_hundredths = [](double pct) { return static_cast<std::int64_t>(std::llround(pct * 100.0)); };
  return format_hundredths(to_hundredths(lower)) + "%-" + format_hundredths(to_hundredths(upper)) + "%";
}

// Caller guarantees percent is within [0, 100].
BigKey scaled_offset(double percent, const BigKey& range_min, const BigKey& range_size) {
  const auto scaled = static_cast<std::uint64_t>(std::llround(percent * static_cast<double>(kPercentScale)));
  return range_min + (range_size * BigKey{scaled}) / BigKey{static_cast<std::uint64_t>(100 * kPercentScale)};
}

}  // namespace

KeyspacePartitioner::KeyspacePartitioner(PartitionConfig config) : config_(std::move(config)) {}

Result KeyspacePartitioner::position_to_offset(double percent, const BigKey& range_min, const BigKey& range_size,
                                               BigKey& out) {
  if (!in_percent_bounds(percent)) {
    return Result::failure(ErrorCode::Validation, "position must be a finite percentage in [0, 100].");
  }
  out = scaled_offset(percent, range_min, range_size);
  return Result::success();
}

Result KeyspacePartitioner::validate_estimate(const ProbabilityEstimate& estimate) {
  if (!in_percent_bounds(estimate.central) || !in_percent_bounds(estimate.ci_lower) ||
      !in_percent_bounds(estimate.ci_upper)) {
    return Result::failure(ErrorCode::Validation, "estimate values must lie in [0, 100].");
  }
  if (estimate.ci_lower > estimate.ci_upper) {
    return Result::failure(ErrorCode::Validation, "estimate ci_lower exceeds ci_upper.");
  }
  return Result::success();
}

Result KeyspacePartitioner::validate_keyspace(const KeyspaceConfig& keyspace) {
  if (keyspace.range_max < keyspace.range_min) {
    return Result::failure(ErrorCode::Validation, "keyspace range_max is below range_min.");
  }
  return Result::success();
}

Result KeyspacePartitioner::validate_config() const {
  const double lower = config_.core_lower_pct;
  const double upper = config_.core_upper_pct;
  if (!in_percent_bounds(lower) || !in_percent_bounds(upper) || lower >= upper) {
    return Result::failure(ErrorCode::Validation, "core band must satisfy 0 <= lower < upper <= 100.");
  }
  if (config_.parallel_split_fractions.empty()) {
    return Result::failure(ErrorCode::Validation, "at least one parallel split fraction is required.");
  }
  for (const double fraction : config_.parallel_split_fractions) {
    if (!std::isfinite(fraction) || fraction <= 0.0) {
      return Result::failure(ErrorCode::Validation, "parallel split fractions must be positive.");
    }
  }
  const double sum = std::accumulate(config_.parallel_split_fractions.begin(),
                                     config_.parallel_split_fractions.end(), 0.0);
  if (std::fabs(sum - 1.0) > kFractionTolerance) {
    return Result::failure(ErrorCode::Validation, "parallel split fractions must sum to 1.");
  }
  return Result::success();
}

void KeyspacePartitioner::core_band(const ProbabilityEstimate& estimate, double& lower, double& upper) const {
  lower = config_.core_lower_pct;
  upper = config_.core_upper_pct;
  if (!config_.center_on_estimate) {
    return;
  }
  const double width = upper - lower;
  lower = std::clamp(estimate.central - width / 2.0, 0.0, 100.0 - width);
  upper = lower + width;
}

Result KeyspacePartitioner::generate_manifest(const KeyspaceConfig& keyspace, const ProbabilityEstimate& estimate,
                                              std::int64_t now_unix, Manifest& out) const {
  if (Result valid = validate_estimate(estimate); !valid.ok) {
    return valid;
  }
  if (Result valid = validate_keyspace(keyspace); !valid.ok) {
    return valid;
  }
  if (Result valid = validate_config(); !valid.ok) {
    return valid;
  }

  const BigKey range_size = keyspace.range_size();
  const auto offset = [&](double pct) {
    return scaled_offset(std::clamp(pct, 0.0, 100.0), keyspace.range_min, range_size);
  };

  double lower = 0.0;
  double upper = 0.0;
  core_band(estimate, lower, upper);

  Manifest manifest;
  manifest.keyspace = keyspace;
  manifest.estimate = estimate;
  manifest.generated_unix = now_unix;

  manifest.core.id = "high_priority";
  manifest.core.start = offset(lower);
  manifest.core.end = offset(upper);
  manifest.core.priority = config_.core_priority;
  manifest.core.label = "core " + band_label(lower, upper);
  manifest.core.created_unix = now_unix;

  const double core_width = upper - lower;
  double cursor_pct = lower;
  BigKey cursor = manifest.core.start;
  const std::size_t split_count = config_.parallel_split_fractions.size();
  for (std::size_t i = 0; i < split_count; ++i) {
    const double next_pct = cursor_pct + core_width * config_.parallel_split_fractions[i];
    KeyRange split;
    split.id = "gpu_" + std::to_string(i);
    split.start = cursor;
    split.end = (i + 1 == split_count) ? manifest.core.end : offset(next_pct);
    split.priority = config_.parallel_priority;
    split.parent_id = manifest.core.id;
    split.label = "parallel " + band_label(cursor_pct, (i + 1 == split_count) ? upper : next_pct);
    split.created_unix = now_unix;
    cursor = split.end;
    cursor_pct = next_pct;
    if (split.start < split.end) {
      manifest.parallel_splits.push_back(std::move(split));
    }
  }

  int fallback_index = 0;
  const auto add_fallback = [&](double from_pct, double to_pct) {
    KeyRange range;
    range.start = offset(from_pct);
    range.end = offset(to_pct);
    if (!(range.start < range.end)) {
      return;
    }
    range.id = "fallback_" + std::to_string(fallback_index);
    range.priority = std::max(0, config_.fallback_priority - fallback_index * config_.fallback_priority_step);
    range.label = "fallback " + band_label(from_pct, to_pct);
    range.created_unix = now_unix;
    manifest.fallback.push_back(std::move(range));
    ++fallback_index;
  };
  add_fallback(0.0, lower);
  add_fallback(upper, 100.0);

  if (!(manifest.core.start < manifest.core.end)) {
    return Result::failure(ErrorCode::Validation, "keyspace too small for the configured core band.");
  }

  out = std::move(manifest);
  return Result::success("Manifest generated.");
}

}  // namespace keyspan
