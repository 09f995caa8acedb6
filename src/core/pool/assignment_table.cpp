#include "core/pool/assignment_table.hpp"

#include <algorithm>
#include <utility>

#include "core/util/common.hpp"

namespace keyspan {

std::string assignment_state_name(AssignmentState state) {
  switch (state) {
    case AssignmentState::Assigned:
      return "assigned";
    case AssignmentState::Reporting:
      return "reporting";
    case AssignmentState::Completed:
      return "completed";
    case AssignmentState::Abandoned:
      return "abandoned";
    case AssignmentState::Expired:
      return "expired";
  }
  return "assigned";
}

bool parse_assignment_state(const std::string& name, AssignmentState& out) {
  if (name == "assigned") {
    out = AssignmentState::Assigned;
  } else if (name == "reporting") {
    out = AssignmentState::Reporting;
  } else if (name == "completed") {
    out = AssignmentState::Completed;
  } else if (name == "abandoned") {
    out = AssignmentState::Abandoned;
  } else if (name == "expired") {
    out = AssignmentState::Expired;
  } else {
    return false;
  }
  return true;
}

Result AssignmentTable::try_claim(const KeyRange& range, std::string_view client_id, std::string_view target_id,
                                  std::int64_t now_unix, std::int64_t lease_seconds, Assignment& out) {
  if (client_id.empty()) {
    return Result::failure(ErrorCode::Validation, "Claim requires a client id.");
  }
  if (lease_seconds <= 0) {
    return Result::failure(ErrorCode::Validation, "Claim lease must be positive.");
  }

  std::lock_guard lock(mutex_);
  for (const auto& record : records_) {
    if (!is_live(record.state)) {
      continue;
    }
    if (record.assignment.range_id == range.id || range.overlaps(record.assignment.start, record.assignment.end)) {
      return Result::failure(ErrorCode::InvalidState,
                             "Range " + range.id + " overlaps live assignment " + record.assignment.assignment_id + ".");
    }
  }

  AssignmentRecord record;
  record.assignment.assignment_id = "asg_" + util::random_hex(8);
  record.assignment.range_id = range.id;
  record.assignment.client_id = std::string{client_id};
  record.assignment.start = range.start;
  record.assignment.end = range.end;
  record.assignment.target_id = std::string{target_id};
  record.assignment.priority = range.priority;
  record.assignment.assigned_unix = now_unix;
  record.assignment.expires_unix = now_unix + lease_seconds;
  record.last_heartbeat_unix = now_unix;
  record.lease_seconds = lease_seconds;
  records_.push_back(record);

  out = record.assignment;
  return Result::success("Range " + range.id + " claimed.", out.assignment_id);
}

AssignmentRecord* AssignmentTable::find_locked(std::string_view assignment_id) {
  const auto it = std::ranges::find_if(records_, [assignment_id](const AssignmentRecord& record) {
    return record.assignment.assignment_id == assignment_id;
  });
  return it == records_.end() ? nullptr : &*it;
}

Result AssignmentTable::heartbeat(std::string_view assignment_id, std::string_view client_id,
                                  const BigKey& searched_keys, std::int64_t now_unix, BigKey& credited) {
  std::lock_guard lock(mutex_);
  AssignmentRecord* record = find_locked(assignment_id);
  if (record == nullptr || record->assignment.client_id != client_id) {
    return Result::failure(ErrorCode::InvalidState, "Unknown assignment " + std::string{assignment_id} + ".");
  }
  if (!is_live(record->state)) {
    return Result::failure(ErrorCode::InvalidState, "Assignment " + std::string{assignment_id} + " is " +
                                                        assignment_state_name(record->state) + ".");
  }

  credited = BigKey::saturating_sub(searched_keys, record->reported_keys);
  if (record->reported_keys < searched_keys) {
    record->reported_keys = searched_keys;
  }
  record->state = AssignmentState::Reporting;
  record->last_heartbeat_unix = now_unix;
  record->assignment.expires_unix = now_unix + record->lease_seconds;
  return Result::success("Heartbeat recorded.");
}

Result AssignmentTable::close(std::string_view assignment_id, std::string_view client_id, AssignmentState terminal,
                              AssignmentRecord& closed) {
  if (is_live(terminal)) {
    return Result::failure(ErrorCode::Validation, "close requires a terminal state.");
  }

  std::lock_guard lock(mutex_);
  AssignmentRecord* record = find_locked(assignment_id);
  if (record == nullptr || record->assignment.client_id != client_id) {
    return Result::failure(ErrorCode::InvalidState, "Unknown assignment " + std::string{assignment_id} + ".");
  }
  if (!is_live(record->state)) {
    return Result::failure(ErrorCode::InvalidState, "Assignment " + std::string{assignment_id} + " is " +
                                                        assignment_state_name(record->state) + ".");
  }
  record->state = terminal;
  closed = *record;
  trim_closed_locked();
  return Result::success("Assignment closed.");
}

std::vector<AssignmentRecord> AssignmentTable::reap_expired(std::int64_t now_unix) {
  std::lock_guard lock(mutex_);
  std::vector<AssignmentRecord> expired;
  for (auto& record : records_) {
    if (!is_live(record.state)) {
      continue;
    }
    if (now_unix - record.last_heartbeat_unix > record.lease_seconds) {
      record.state = AssignmentState::Expired;
      expired.push_back(record);
    }
  }
  if (!expired.empty()) {
    trim_closed_locked();
  }
  return expired;
}

void AssignmentTable::trim_closed_locked() {
  // Oldest first; records_ keeps claim order.
  auto closed_count = static_cast<std::size_t>(
      std::ranges::count_if(records_, [](const AssignmentRecord& r) { return !is_live(r.state); }));
  while (closed_count > kRetainedClosedRecords) {
    const auto oldest = std::ranges::find_if(records_, [](const AssignmentRecord& r) { return !is_live(r.state); });
    records_.erase(oldest);
    --closed_count;
  }
}

std::unordered_set<std::string> AssignmentTable::claimed_range_ids() const {
  std::lock_guard lock(mutex_);
  std::unordered_set<std::string> ids;
  for (const auto& record : records_) {
    if (is_live(record.state)) {
      ids.insert(record.assignment.range_id);
    }
  }
  return ids;
}

std::optional<AssignmentRecord> AssignmentTable::find(std::string_view assignment_id) const {
  std::lock_guard lock(mutex_);
  const auto it = std::ranges::find_if(records_, [assignment_id](const AssignmentRecord& record) {
    return record.assignment.assignment_id == assignment_id;
  });
  if (it == records_.end()) {
    return std::nullopt;
  }
  return *it;
}

std::optional<AssignmentRecord> AssignmentTable::live_for_client(std::string_view client_id) const {
  std::lock_guard lock(mutex_);
  const auto it = std::ranges::find_if(records_, [client_id](const AssignmentRecord& record) {
    return is_live(record.state) && record.assignment.client_id == client_id;
  });
  if (it == records_.end()) {
    return std::nullopt;
  }
  return *it;
}

std::vector<AssignmentRecord> AssignmentTable::records() const {
  std::lock_guard lock(mutex_);
  return records_;
}

void AssignmentTable::restore(std::vector<AssignmentRecord> records) {
  std::lock_guard lock(mutex_);
  records_ = std::move(records);
  trim_closed_locked();
}

}  // namespace keyspan
