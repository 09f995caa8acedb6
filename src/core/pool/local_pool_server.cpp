#include "core/pool/local_pool_server.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "core/model/app_meta.hpp"
#include "core/storage/json_codec.hpp"

namespace keyspan {
namespace {

constexpr std::string_view kComponent = "pool-server";

Result busy() {
  return Result::failure(ErrorCode::Unavailable, "Pool server busy; request timed out.");
}

Json::Value encode_record(const AssignmentRecord& record) {
  Json::Value out = codec::encode_assignment(record.assignment);
  out["state"] = assignment_state_name(record.state);
  out["last_heartbeat_unix"] = static_cast<Json::Int64>(record.last_heartbeat_unix);
  out["lease_seconds"] = static_cast<Json::Int64>(record.lease_seconds);
  out["reported_keys"] = codec::encode_key(record.reported_keys);
  return out;
}

bool decode_record(const Json::Value& value, AssignmentRecord& out) {
  AssignmentRecord record;
  if (!codec::decode_assignment(value, record.assignment) || !value["state"].isString() ||
      !parse_assignment_state(value["state"].asString(), record.state) ||
      !value["last_heartbeat_unix"].isIntegral() || !value["lease_seconds"].isIntegral() ||
      !codec::decode_key(value["reported_keys"], record.reported_keys)) {
    return false;
  }
  record.last_heartbeat_unix = value["last_heartbeat_unix"].asInt64();
  record.lease_seconds = value["lease_seconds"].asInt64();
  out = std::move(record);
  return true;
}

}  // namespace

LocalPoolServer::LocalPoolServer(ProgressLedger& ledger, AdaptiveScheduler scheduler)
    : ledger_(ledger), scheduler_(std::move(scheduler)) {}

Result LocalPoolServer::open(const StorageContext& context) {
  context_ = context;
  path_ = context_.path_for(kPoolServerFile);
  journal_.open(context_.path_for(kJournalFile), context_.now_unix);
  std::lock_guard lock(mutex_);
  return load();
}

Result LocalPoolServer::load() {
  Json::Value root;
  const Result read = codec::read_file(path_, root);
  if (!read.ok) {
    if (read.code == ErrorCode::NotFound) {
      return Result::success("Pool server state initialized empty.");
    }
    journal_.record(kComponent, read.message);
    return read;
  }
  if (!root.isObject() || !root["participants"].isArray() || !root["assignments"].isArray()) {
    return Result::failure(ErrorCode::Corrupt, path_ + " has an unexpected layout.");
  }

  std::map<std::string, Contribution> participants;
  for (const auto& item : root["participants"]) {
    Contribution contribution;
    if (!codec::decode_contribution(item, contribution)) {
      return Result::failure(ErrorCode::Corrupt, path_ + " contains an unreadable participant.");
    }
    participants[contribution.client_id] = std::move(contribution);
  }

  std::vector<AssignmentRecord> records;
  for (const auto& item : root["assignments"]) {
    AssignmentRecord record;
    if (!decode_record(item, record)) {
      return Result::failure(ErrorCode::Corrupt, path_ + " contains an unreadable assignment.");
    }
    records.push_back(std::move(record));
  }

  participants_ = std::move(participants);
  table_.restore(std::move(records));
  return Result::success("Pool server state loaded.");
}

Result LocalPoolServer::save() const {
  Json::Value root(Json::objectValue);
  Json::Value participants(Json::arrayValue);
  for (const auto& [client_id, contribution] : participants_) {
    participants.append(codec::encode_contribution(contribution));
  }
  root["participants"] = participants;

  Json::Value assignments(Json::arrayValue);
  for (const auto& record : table_.records()) {
    assignments.append(encode_record(record));
  }
  root["assignments"] = assignments;
  return codec::write_file_atomic(path_, root);
}

std::size_t LocalPoolServer::reap_expired_locked(std::int64_t now) {
  const auto expired = table_.reap_expired(now);
  for (const auto& record : expired) {
    journal_.record(kComponent, "assignment " + record.assignment.assignment_id + " for " +
                                    record.assignment.range_id + " expired; range released.");
    const Result released = ledger_.release(record.assignment.range_id);
    if (!released.ok) {
      journal_.record(kComponent, "release after expiry failed: " + released.message);
    }
  }
  return expired.size();
}

Result LocalPoolServer::tick(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_, std::defer_lock);
  if (!lock.try_lock_for(timeout)) {
    return busy();
  }
  const std::size_t reaped = reap_expired_locked(context_.now());
  if (reaped > 0) {
    if (Result saved = save(); !saved.ok) {
      return saved;
    }
  }
  return Result::success("Pool tick complete.", std::to_string(reaped));
}

Result LocalPoolServer::register_participant(std::string_view client_id, std::chrono::milliseconds timeout) {
  if (client_id.empty()) {
    return Result::failure(ErrorCode::Validation, "Participant id must not be empty.");
  }
  std::unique_lock lock(mutex_, std::defer_lock);
  if (!lock.try_lock_for(timeout)) {
    return busy();
  }
  const std::string id{client_id};
  if (participants_.contains(id)) {
    return Result::success("Participant already registered.", id);
  }
  Contribution contribution;
  contribution.client_id = id;
  participants_.emplace(id, std::move(contribution));
  journal_.record(kComponent, "participant " + id + " registered.");
  if (Result saved = save(); !saved.ok) {
    return saved;
  }
  return Result::success("Participant registered.", id);
}

bool LocalPoolServer::eligible(const LedgerEntry& entry, const AssignmentRequest& request,
                               const std::vector<LedgerEntry>& entries) const {
  if (is_terminal(entry.range.status)) {
    return false;
  }
  if (request.scan_type == ScanType::ExcludeDefeated && !entry.progress.searched_keys.is_zero()) {
    return false;
  }
  return std::ranges::none_of(entries, [&entry](const LedgerEntry& other) {
    return other.range.status == RangeStatus::Completed && entry.range.overlaps(other.range.start, other.range.end);
  });
}

Result LocalPoolServer::request_assignment(const AssignmentRequest& request, std::chrono::milliseconds timeout,
                                           Assignment& out) {
  if (request.client_id.empty()) {
    return Result::failure(ErrorCode::Validation, "Assignment request requires a client id.");
  }
  if (request.scan_type == ScanType::CustomRange && !request.custom_range.has_value()) {
    return Result::failure(ErrorCode::Validation, "customRange scans require custom bounds.");
  }

  std::unique_lock lock(mutex_, std::defer_lock);
  if (!lock.try_lock_for(timeout)) {
    return busy();
  }

  const std::int64_t now = context_.now();
  const bool reaped = reap_expired_locked(now) > 0;

  if (const auto existing = table_.live_for_client(request.client_id); existing.has_value()) {
    out = existing->assignment;
    return Result::success("Existing assignment returned.", out.assignment_id);
  }

  participants_.try_emplace(request.client_id, Contribution{request.client_id, 0, BigKey{}, 0});

  const std::vector<LedgerEntry> entries = ledger_.snapshot();
  std::vector<KeyRange> candidates;
  if (request.scan_type == ScanType::CustomRange) {
    const std::string id = custom_range_id(*request.custom_range);
    const auto it = std::ranges::find_if(entries, [&id](const LedgerEntry& e) { return e.range.id == id; });
    if (it != entries.end()) {
      candidates.push_back(it->range);
    }
  } else {
    candidates = scheduler_.recommended_set(entries, table_.claimed_range_ids());
  }

  for (const auto& candidate : candidates) {
    const auto entry = std::ranges::find_if(entries, [&candidate](const LedgerEntry& e) {
      return e.range.id == candidate.id;
    });
    if (entry == entries.end() || !eligible(*entry, request, entries)) {
      continue;
    }

    Assignment claimed;
    if (!table_.try_claim(candidate, request.client_id, target_id_, now, request.lease_seconds, claimed).ok) {
      continue;
    }
    const Result activated = ledger_.activate(candidate.id, claimed.assignment_id);
    if (!activated.ok) {
      AssignmentRecord dropped;
      const Result closed = table_.close(claimed.assignment_id, request.client_id, AssignmentState::Abandoned, dropped);
      journal_.record(kComponent, "activation of " + candidate.id + " failed: " + activated.message +
                                      (closed.ok ? "" : " (" + closed.message + ")"));
      continue;
    }

    journal_.record(kComponent, "assigned " + candidate.id + " to " + request.client_id + " as " +
                                    claimed.assignment_id + ".");
    if (Result saved = save(); !saved.ok) {
      return saved;
    }
    out = claimed;
    return Result::success("Assignment granted.", out.assignment_id);
  }

  if (reaped) {
    if (Result saved = save(); !saved.ok) {
      return saved;
    }
  }
  journal_.record(kComponent, "no eligible range for " + request.client_id + ".");
  return Result::failure(ErrorCode::NotFound, "No eligible range available.");
}

Result LocalPoolServer::report_progress(const ProgressReport& report, std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_, std::defer_lock);
  if (!lock.try_lock_for(timeout)) {
    return busy();
  }

  const std::int64_t now = context_.now();
  if (reap_expired_locked(now) > 0) {
    if (Result saved = save(); !saved.ok) {
      return saved;
    }
  }

  BigKey credited;
  const Result beat = table_.heartbeat(report.assignment_id, report.client_id, report.searched_keys, now, credited);
  if (!beat.ok) {
    journal_.record(kComponent, "heartbeat rejected: " + beat.message);
    return beat;
  }
  auto& contribution = participants_[report.client_id];
  contribution.client_id = report.client_id;
  contribution.keys_searched += credited;
  if (Result saved = save(); !saved.ok) {
    return saved;
  }
  return Result::success("Progress acknowledged.");
}

Result LocalPoolServer::report_completion(const CompletionReport& report, std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_, std::defer_lock);
  if (!lock.try_lock_for(timeout)) {
    return busy();
  }

  AssignmentRecord closed;
  const Result result = table_.close(report.assignment_id, report.client_id, AssignmentState::Completed, closed);
  if (!result.ok) {
    journal_.record(kComponent, "completion rejected: " + result.message);
    return result;
  }

  auto& contribution = participants_[report.client_id];
  contribution.client_id = report.client_id;
  contribution.ranges_completed += 1;
  if (!report.found) {
    const BigKey width = BigKey::saturating_sub(closed.assignment.end, closed.assignment.start);
    contribution.keys_searched += BigKey::saturating_sub(width, closed.reported_keys);
  }

  // Idempotent when the participant already completed the range locally.
  Result ledger_result;
  if (report.found) {
    std::vector<std::string> completed;
    ledger_result = ledger_.complete_overlapping(closed.assignment.start, closed.assignment.end, completed);
  } else {
    ledger_result = ledger_.mark_completed(closed.assignment.range_id, true);
  }
  if (!ledger_result.ok) {
    journal_.record(kComponent, "ledger completion for " + closed.assignment.range_id + " failed: " +
                                    ledger_result.message);
  }

  journal_.record(kComponent, "assignment " + report.assignment_id + " completed" +
                                  (report.found ? " with a find: " + report.evidence : "") + ".");
  if (Result saved = save(); !saved.ok) {
    return saved;
  }
  return Result::success("Completion acknowledged.");
}

Result LocalPoolServer::abandon_assignment(std::string_view assignment_id, std::string_view client_id,
                                           std::string_view reason, std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_, std::defer_lock);
  if (!lock.try_lock_for(timeout)) {
    return busy();
  }

  AssignmentRecord closed;
  const Result result = table_.close(assignment_id, client_id, AssignmentState::Abandoned, closed);
  if (!result.ok) {
    return result;
  }
  const Result released = ledger_.release(closed.assignment.range_id);
  if (!released.ok) {
    journal_.record(kComponent, "release after abandon failed: " + released.message);
  }
  journal_.record(kComponent, "assignment " + std::string{assignment_id} + " abandoned: " + std::string{reason});
  if (Result saved = save(); !saved.ok) {
    return saved;
  }
  return Result::success("Assignment abandoned.");
}

Result LocalPoolServer::fetch_stats(std::string_view client_id, std::chrono::milliseconds timeout, PoolStats& out) {
  std::unique_lock lock(mutex_, std::defer_lock);
  if (!lock.try_lock_for(timeout)) {
    return busy();
  }

  PoolStats stats;
  stats.as_of_unix = context_.now();

  BigKey total;
  BigKey searched;
  BigKey covered;
  for (const auto& entry : ledger_.snapshot()) {
    if (entry.range.status == RangeStatus::Abandoned) {
      continue;
    }
    total += entry.progress.total_keys;
    searched += entry.progress.searched_keys;
    if (entry.range.status == RangeStatus::Completed) {
      covered += entry.progress.total_keys;
      ++stats.ranges_completed;
    }
  }
  stats.keyspace_covered_hundredths = percent_hundredths(covered, total);
  stats.searched_hundredths = percent_hundredths(searched, total);

  for (const auto& [id, contribution] : participants_) {
    stats.participants.push_back(contribution);
  }
  std::ranges::stable_sort(stats.participants, [](const Contribution& a, const Contribution& b) {
    return a.keys_searched > b.keys_searched;
  });
  for (std::size_t i = 0; i < stats.participants.size(); ++i) {
    stats.participants[i].rank = i + 1;
    if (stats.participants[i].client_id == client_id) {
      stats.your_contribution = stats.participants[i];
    }
  }
  stats.participant_count = stats.participants.size();
  out = std::move(stats);
  return Result::success("Pool statistics fetched.");
}

void LocalPoolServer::set_target_id(std::string target_id) {
  std::lock_guard lock(mutex_);
  target_id_ = std::move(target_id);
}

std::vector<AssignmentRecord> LocalPoolServer::assignments() const {
  return table_.records();
}

}  // namespace keyspan
