#pragma once

#include <cstdint>

#include "core/model/types.hpp"

namespace keyspan {

// Turns a probability estimate over the keyspace into concrete range bounds.
// Every method is pure; nothing here touches storage.
class KeyspacePartitioner {
public:
  KeyspacePartitioner() = default;
  explicit KeyspacePartitioner(PartitionConfig config);

  [[nodiscard]] const PartitionConfig& config() const { return config_; }

  // range_min + floor(percent / 100 * range_size), exact to 1e-6 percent.
  static Result position_to_offset(double percent, const BigKey& range_min, const BigKey& range_size,
                                   BigKey& out);
  static Result validate_estimate(const ProbabilityEstimate& estimate);
  static Result validate_keyspace(const KeyspaceConfig& keyspace);

  Result generate_manifest(const KeyspaceConfig& keyspace, const ProbabilityEstimate& estimate,
                           std::int64_t now_unix, Manifest& out) const;

private:
  Result validate_config() const;
  void core_band(const ProbabilityEstimate& estimate, double& lower, double& upper) const;

  PartitionConfig config_;
};

}  // namespace keyspan
