#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "core/model/types.hpp"

namespace keyspan {

enum class AssignmentState {
  Assigned,
  Reporting,
  Completed,
  Abandoned,
  Expired,
};

[[nodiscard]] inline bool is_live(AssignmentState state) {
  return state == AssignmentState::Assigned || state == AssignmentState::Reporting;
}

std::string assignment_state_name(AssignmentState state);
bool parse_assignment_state(const std::string& name, AssignmentState& out);

struct AssignmentRecord {
  Assignment assignment;
  AssignmentState state = AssignmentState::Assigned;
  std::int64_t last_heartbeat_unix = 0;
  std::int64_t lease_seconds = 600;
  BigKey reported_keys;
};

// Live assignments keyed by id. try_claim is the single compare-and-swap that
// keeps live assignments disjoint; terminal states never revert.
class AssignmentTable {
public:
  // Closed records kept for stats and lookups; live records are never trimmed.
  static constexpr std::size_t kRetainedClosedRecords = 256;

  Result try_claim(const KeyRange& range, std::string_view client_id, std::string_view target_id,
                   std::int64_t now_unix, std::int64_t lease_seconds, Assignment& out);
  // Records a heartbeat and returns the keys newly credited to the participant.
  Result heartbeat(std::string_view assignment_id, std::string_view client_id, const BigKey& searched_keys,
                   std::int64_t now_unix, BigKey& credited);
  Result close(std::string_view assignment_id, std::string_view client_id, AssignmentState terminal,
               AssignmentRecord& closed);
  std::vector<AssignmentRecord> reap_expired(std::int64_t now_unix);

  [[nodiscard]] std::unordered_set<std::string> claimed_range_ids() const;
  [[nodiscard]] std::optional<AssignmentRecord> find(std::string_view assignment_id) const;
  [[nodiscard]] std::optional<AssignmentRecord> live_for_client(std::string_view client_id) const;
  [[nodiscard]] std::vector<AssignmentRecord> records() const;
  void restore(std::vector<AssignmentRecord> records);

private:
  AssignmentRecord* find_locked(std::string_view assignment_id);
  void trim_closed_locked();

  mutable std::mutex mutex_;
  std::vector<AssignmentRecord> records_;
};

}  // namespace keyspan
