#include "core/pool/coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

#include "core/model/app_meta.hpp"
#include "core/storage/json_codec.hpp"
#include "core/util/common.hpp"

namespace keyspan {
namespace {

constexpr std::string_view kComponent = "coordinator";

}  // namespace

PoolCoordinator::PoolCoordinator(StorageContext context, ProgressLedger& ledger, IPoolRemote& remote,
                                 CoordinatorOptions options)
    : context_(std::move(context)), ledger_(ledger), remote_(remote), options_(options) {
  journal_.open(context_.path_for(kJournalFile), context_.now_unix);
}

PoolCoordinator::~PoolCoordinator() {
  stop_auto_reporting();
}

Result PoolCoordinator::require_initialized() const {
  if (!initialized_) {
    return Result::failure(ErrorCode::InvalidState, "Pool coordinator is not initialized; run init first.");
  }
  return Result::success();
}

Result PoolCoordinator::load_or_create_config() {
  Json::Value root;
  const Result read = codec::read_file(context_.path_for(kPoolConfigFile), root);
  if (read.ok) {
    PoolConfig loaded;
    if (!codec::decode_pool_config(root, loaded)) {
      return Result::failure(ErrorCode::Corrupt, "pool_config.json is malformed.");
    }
    config_ = std::move(loaded);
    return Result::success("Pool configuration loaded.");
  }
  if (read.code != ErrorCode::NotFound) {
    return read;
  }

  config_ = PoolConfig{};
  config_.client_id = "client_" + std::to_string(context_.now()) + "_" + util::random_hex(4);
  return Result::success("Pool configuration created.");
}

Result PoolCoordinator::save_config() const {
  return codec::write_file_atomic(context_.path_for(kPoolConfigFile), codec::encode_pool_config(config_));
}

Result PoolCoordinator::load_assignment() {
  Json::Value root;
  const Result read = codec::read_file(context_.path_for(kPoolAssignmentFile), root);
  if (!read.ok) {
    if (read.code == ErrorCode::NotFound) {
      assignment_.reset();
      return Result::success();
    }
    return read;
  }
  Assignment restored;
  if (!codec::decode_assignment(root, restored)) {
    return Result::failure(ErrorCode::Corrupt, "pool_assignment.json is malformed.");
  }
  assignment_ = std::move(restored);
  return Result::success();
}

Result PoolCoordinator::save_assignment() const {
  const std::string path = context_.path_for(kPoolAssignmentFile);
  if (!assignment_.has_value()) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
      return Result::failure(ErrorCode::Io, "Failed to remove " + path + ": " + ec.message());
    }
    return Result::success();
  }
  return codec::write_file_atomic(path, codec::encode_assignment(*assignment_));
}

void PoolCoordinator::append_history(std::string_view event, std::string_view detail) const {
  const std::string path = context_.path_for(kPoolProgressFile);
  Json::Value history(Json::arrayValue);
  Json::Value existing;
  if (codec::read_file(path, existing).ok && existing.isArray()) {
    history = existing;
  }

  Json::Value item(Json::objectValue);
  item["unix"] = static_cast<Json::Int64>(context_.now());
  item["event"] = std::string{event};
  item["detail"] = std::string{detail};
  item["client_id"] = config_.client_id;
  if (assignment_.has_value()) {
    item["assignment_id"] = assignment_->assignment_id;
    item["range_id"] = assignment_->range_id;
  }
  history.append(item);

  Json::Value trimmed(Json::arrayValue);
  const Json::ArrayIndex size = history.size();
  const Json::ArrayIndex first = size > kPoolHistoryLimit ? size - static_cast<Json::ArrayIndex>(kPoolHistoryLimit) : 0;
  for (Json::ArrayIndex i = first; i < size; ++i) {
    trimmed.append(history[i]);
  }

  const Result written = codec::write_file_atomic(path, trimmed);
  if (!written.ok) {
    journal_.record(kComponent, "history write failed: " + written.message);
  }
}

void PoolCoordinator::clear_assignment(std::string_view event, std::string_view detail) {
  append_history(event, detail);
  assignment_.reset();
  const Result saved = save_assignment();
  if (!saved.ok) {
    journal_.record(kComponent, "assignment file update failed: " + saved.message);
  }
}

std::int64_t PoolCoordinator::lease_seconds() const {
  const double lease = static_cast<double>(config_.report_interval_seconds) * options_.grace_factor;
  return std::max<std::int64_t>(1, static_cast<std::int64_t>(std::llround(lease)));
}

Result PoolCoordinator::initialize(std::optional<CustomRange> custom_range) {
  std::lock_guard lock(op_mutex_);

  if (custom_range.has_value() && !(custom_range->start < custom_range->end)) {
    return Result::failure(ErrorCode::Validation, "Custom range must satisfy start < end.");
  }

  if (Result loaded = load_or_create_config(); !loaded.ok) {
    journal_.record(kComponent, "init failed: " + loaded.message);
    return loaded;
  }

  if (custom_range.has_value()) {
    const std::string id = custom_range_id(*custom_range);
    if (!ledger_.find(id).has_value()) {
      KeyRange range;
      range.id = id;
      range.start = custom_range->start;
      range.end = custom_range->end;
      range.label = "custom range for " + config_.client_id;
      range.created_unix = context_.now();
      if (Result registered = ledger_.register_range(range); !registered.ok) {
        return registered;
      }
    }
    config_.custom_range = *custom_range;
    config_.scan_type = ScanType::CustomRange;
  }

  if (Result saved = save_config(); !saved.ok) {
    return saved;
  }
  if (Result restored = load_assignment(); !restored.ok) {
    return restored;
  }

  const Result registered = remote_.register_participant(config_.client_id, options_.remote_timeout);
  if (!registered.ok) {
    pending_sync_ = true;
    journal_.record(kComponent, "participant registration deferred: " + registered.message);
  }

  initialized_ = true;
  append_history("init", codec::scan_type_name(config_.scan_type));
  return Result::success("Pool participant " + config_.client_id + " initialized.", config_.client_id);
}

Result PoolCoordinator::request_assignment(Assignment& out) {
  std::lock_guard lock(op_mutex_);
  if (Result ready = require_initialized(); !ready.ok) {
    return ready;
  }
  if (assignment_.has_value()) {
    out = *assignment_;
    return Result::success("Current assignment retained.", out.assignment_id);
  }

  AssignmentRequest request;
  request.client_id = config_.client_id;
  request.scan_type = config_.scan_type;
  request.custom_range = config_.custom_range;
  request.lease_seconds = lease_seconds();

  Assignment granted;
  const Result result = remote_.request_assignment(request, options_.remote_timeout, granted);
  if (!result.ok) {
    journal_.record(kComponent, "assignment request failed: " + result.message);
    return result;
  }

  assignment_ = granted;
  if (Result saved = save_assignment(); !saved.ok) {
    return saved;
  }
  append_history("assigned", granted.range_id);
  out = granted;
  return Result::success("Assigned range " + granted.range_id + ".", granted.assignment_id);
}

Result PoolCoordinator::report_progress(const BigKey& searched_keys, double search_rate) {
  std::lock_guard lock(op_mutex_);
  return report_progress_locked(searched_keys, search_rate);
}

Result PoolCoordinator::report_progress_locked(const BigKey& searched_keys, double search_rate) {
  if (Result ready = require_initialized(); !ready.ok) {
    return ready;
  }
  if (!assignment_.has_value()) {
    return Result::failure(ErrorCode::InvalidState, "No active assignment.");
  }

  ProgressRecord record;
  const Result local = ledger_.update(assignment_->range_id, searched_keys, search_rate, record,
                                    assignment_->assignment_id);
  if (!local.ok) {
    if (local.code == ErrorCode::InvalidState) {
      clear_assignment("dropped", local.message);
    }
    return local;
  }

  ProgressReport report;
  report.assignment_id = assignment_->assignment_id;
  report.client_id = config_.client_id;
  report.searched_keys = searched_keys;
  report.search_rate = search_rate;
  const Result remote = remote_.report_progress(report, options_.remote_timeout);

  const std::string percent = format_hundredths(record.percent_hundredths);
  if (!remote.ok) {
    if (remote.code == ErrorCode::InvalidState) {
      // The pool released the range when it reaped the lease; it may already be reassigned.
      clear_assignment("expired", remote.message);
      return Result::failure(ErrorCode::InvalidState,
                             "Assignment no longer valid (" + remote.message + "); progress kept at " + percent + "%.");
    }
    pending_sync_ = true;
    journal_.record(kComponent, "progress sync deferred: " + remote.message);
    append_history("progress", percent + "% (pending sync)");
    return Result::success("Progress recorded locally at " + percent + "%; remote sync pending.", percent);
  }

  pending_sync_ = false;
  append_history("progress", percent + "%");
  return Result::success("Progress recorded at " + percent + "%.", percent);
}

Result PoolCoordinator::report_completion(bool found, std::string_view evidence) {
  std::lock_guard lock(op_mutex_);
  if (Result ready = require_initialized(); !ready.ok) {
    return ready;
  }
  if (!assignment_.has_value()) {
    return Result::failure(ErrorCode::InvalidState, "No active assignment.");
  }

  Result local;
  if (found) {
    std::vector<std::string> completed;
    local = ledger_.complete_overlapping(assignment_->start, assignment_->end, completed, assignment_->assignment_id);
  } else {
    local = ledger_.mark_completed(assignment_->range_id, true, assignment_->assignment_id);
  }
  if (!local.ok) {
    if (local.code == ErrorCode::InvalidState) {
      clear_assignment("dropped", local.message);
    }
    return local;
  }

  CompletionReport report;
  report.assignment_id = assignment_->assignment_id;
  report.client_id = config_.client_id;
  report.found = found;
  report.evidence = std::string{evidence};
  const Result remote = remote_.report_completion(report, options_.remote_timeout);

  const std::string range_id = assignment_->range_id;
  clear_assignment(found ? "found" : "completed", evidence);
  if (!remote.ok) {
    if (remote.code == ErrorCode::InvalidState) {
      journal_.record(kComponent, "completion rejected by pool: " + remote.message);
      return remote;
    }
    pending_sync_ = true;
    journal_.record(kComponent, "completion sync failed: " + remote.message);
    return Result::success("Range " + range_id + " completed locally; remote sync pending.", range_id);
  }
  return Result::success("Range " + range_id + (found ? " completed with a find." : " exhausted."), range_id);
}

Result PoolCoordinator::abandon_assignment(std::string_view reason) {
  std::lock_guard lock(op_mutex_);
  if (Result ready = require_initialized(); !ready.ok) {
    return ready;
  }
  if (!assignment_.has_value()) {
    return Result::failure(ErrorCode::InvalidState, "No active assignment.");
  }

  const Assignment abandoned = *assignment_;
  const Result remote =
      remote_.abandon_assignment(abandoned.assignment_id, config_.client_id, reason, options_.remote_timeout);
  if (!remote.ok) {
    journal_.record(kComponent, "abandon sync failed: " + remote.message);
  }
  // A no-op when the pool already released the range; rejected when another holder owns it.
  const Result released = ledger_.release(abandoned.range_id, abandoned.assignment_id);
  clear_assignment("abandoned", reason);
  if (!released.ok) {
    return released;
  }
  return Result::success("Assignment for " + abandoned.range_id + " abandoned.", abandoned.range_id);
}

Result PoolCoordinator::get_stats(PoolStats& out) {
  std::lock_guard lock(op_mutex_);
  if (Result ready = require_initialized(); !ready.ok) {
    return ready;
  }

  const std::string cache_path = context_.path_for(kPoolStatsFile);
  PoolStats fetched;
  const Result remote = remote_.fetch_stats(config_.client_id, options_.remote_timeout, fetched);
  if (remote.ok) {
    last_stats_ = fetched;
    const Result cached = codec::write_file_atomic(cache_path, codec::encode_stats(fetched));
    if (!cached.ok) {
      journal_.record(kComponent, "stats cache write failed: " + cached.message);
    }
    out = std::move(fetched);
    return Result::success("Pool statistics are current.");
  }

  journal_.record(kComponent, "stats fetch failed: " + remote.message);
  if (!last_stats_.has_value()) {
    Json::Value root;
    PoolStats restored;
    if (codec::read_file(cache_path, root).ok && codec::decode_stats(root, restored)) {
      last_stats_ = std::move(restored);
    }
  }
  if (last_stats_.has_value()) {
    out = *last_stats_;
    out.stale = true;
    return Result::success("Pool unreachable; showing last known statistics.");
  }

  PoolStats local;
  local.stale = true;
  local.as_of_unix = context_.now();
  const CoverageSummary coverage = ledger_.aggregate_coverage();
  local.searched_hundredths = coverage.percent_hundredths;
  BigKey covered;
  for (const auto& entry : ledger_.snapshot()) {
    if (entry.range.status == RangeStatus::Completed) {
      covered += entry.progress.total_keys;
      ++local.ranges_completed;
    }
  }
  local.keyspace_covered_hundredths = percent_hundredths(covered, coverage.total_keyspace);
  out = std::move(local);
  return Result::success("Pool unreachable; showing statistics from the local ledger.");
}

Result PoolCoordinator::start_auto_reporting(SnapshotFn snapshot_fn) {
  if (!snapshot_fn) {
    return Result::failure(ErrorCode::Validation, "Auto reporting requires a progress source.");
  }
  {
    std::lock_guard lock(op_mutex_);
    if (Result ready = require_initialized(); !ready.ok) {
      return ready;
    }
  }

  std::lock_guard lock(auto_mutex_);
  if (auto_running_) {
    return Result::success("Auto reporting already running.");
  }
  snapshot_fn_ = std::move(snapshot_fn);
  stop_requested_ = false;
  auto_running_ = true;
  auto_thread_ = std::thread([this] { auto_report_loop(); });
  journal_.record(kComponent, "auto reporting started.");
  return Result::success("Auto reporting started.");
}

void PoolCoordinator::stop_auto_reporting() {
  {
    std::lock_guard lock(auto_mutex_);
    if (!auto_running_) {
      return;
    }
    stop_requested_ = true;
  }
  auto_cv_.notify_all();
  if (auto_thread_.joinable()) {
    auto_thread_.join();
  }
  std::lock_guard lock(auto_mutex_);
  auto_running_ = false;
  snapshot_fn_ = nullptr;
  journal_.record(kComponent, "auto reporting stopped.");
}

bool PoolCoordinator::auto_reporting() const {
  std::lock_guard lock(auto_mutex_);
  return auto_running_;
}

void PoolCoordinator::auto_report_loop() {
  const auto interval = std::chrono::seconds(config().report_interval_seconds);
  auto next_report = std::chrono::steady_clock::now() + interval;
  while (true) {
    {
      std::unique_lock lock(auto_mutex_);
      if (auto_cv_.wait_for(lock, options_.tick, [this] { return stop_requested_; })) {
        break;
      }
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= next_report) {
      auto_report_once();
      next_report = now + interval;
    }
  }
  // Final flush on stop.
  auto_report_once();
}

void PoolCoordinator::auto_report_once() {
  SnapshotFn fn;
  {
    std::lock_guard lock(auto_mutex_);
    fn = snapshot_fn_;
  }
  if (!fn) {
    return;
  }
  const std::optional<ProgressSnapshot> snapshot = fn();
  if (!snapshot.has_value()) {
    return;
  }

  std::lock_guard lock(op_mutex_);
  if (!assignment_.has_value()) {
    return;
  }
  const Result reported = report_progress_locked(snapshot->searched_keys, snapshot->search_rate);
  if (!reported.ok) {
    journal_.record(kComponent, "auto report failed: " + reported.message);
  }
}

std::optional<Assignment> PoolCoordinator::current_assignment() const {
  std::lock_guard lock(op_mutex_);
  return assignment_;
}

PoolConfig PoolCoordinator::config() const {
  std::lock_guard lock(op_mutex_);
  return config_;
}

bool PoolCoordinator::pending_sync() const {
  std::lock_guard lock(op_mutex_);
  return pending_sync_;
}

}  // namespace keyspan
