#include "core/storage/ledger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>
#include <utility>

#include "core/model/app_meta.hpp"
#include "core/storage/json_codec.hpp"

namespace keyspan {
namespace {

constexpr std::string_view kComponent = "ledger";

LedgerEntry fresh_entry(const KeyRange& range, std::int64_t now) {
  LedgerEntry entry;
  entry.range = range;
  entry.range.status = RangeStatus::Pending;
  if (entry.range.created_unix == 0) {
    entry.range.created_unix = now;
  }
  entry.progress.range_id = range.id;
  entry.progress.total_keys = range.width();
  entry.progress.status = RangeStatus::Pending;
  return entry;
}

void set_status(LedgerEntry& entry, RangeStatus status) {
  entry.range.status = status;
  entry.progress.status = status;
  if (status != RangeStatus::Active) {
    entry.progress.holder.clear();
  }
}

bool holder_mismatch(const LedgerEntry& entry, std::string_view holder) {
  return !holder.empty() && entry.progress.holder != holder;
}

Result stale_holder(const LedgerEntry& entry, std::string_view holder) {
  return Result::failure(ErrorCode::InvalidState, "Assignment " + std::string{holder} + " no longer holds range " +
                                                      entry.range.id + ".");
}

Result validate_new_range(const KeyRange& range) {
  if (range.id.empty()) {
    return Result::failure(ErrorCode::Validation, "Range id must not be empty.");
  }
  if (!(range.start < range.end)) {
    return Result::failure(ErrorCode::Validation, "Range " + range.id + " must satisfy start < end.");
  }
  if (range.priority < 0 || range.priority > 100) {
    return Result::failure(ErrorCode::Validation, "Range " + range.id + " priority must be within [0, 100].");
  }
  return Result::success();
}

}  // namespace

Result ProgressLedger::open(const StorageContext& context) {
  context_ = context;
  path_ = context_.path_for(kProgressFile);
  journal_.open(context_.path_for(kJournalFile), context_.now_unix);
  return load();
}

Result ProgressLedger::load() {
  Json::Value root;
  const Result read = codec::read_file(path_, root);
  if (!read.ok) {
    if (read.code == ErrorCode::NotFound) {
      return Result::success("Progress ledger initialized empty.");
    }
    journal_.record(kComponent, read.message);
    return read;
  }

  if (!root.isArray()) {
    journal_.record(kComponent, "search_progress.json is not an array.");
    return Result::failure(ErrorCode::Corrupt, path_ + " must contain an array of records.");
  }

  std::vector<std::unique_ptr<Slot>> slots;
  std::unordered_map<std::string, std::size_t> index;
  for (const auto& item : root) {
    auto slot = std::make_unique<Slot>();
    if (!codec::decode_range(item["range"], slot->entry.range) ||
        !codec::decode_progress(item["progress"], slot->entry.progress)) {
      journal_.record(kComponent, "Unreadable record in search_progress.json.");
      return Result::failure(ErrorCode::Corrupt, path_ + " contains an unreadable record.");
    }
    const LedgerEntry& entry = slot->entry;
    if (entry.progress.range_id != entry.range.id || entry.progress.total_keys != entry.range.width()) {
      journal_.record(kComponent, "Inconsistent record for " + entry.range.id + ".");
      return Result::failure(ErrorCode::Corrupt, path_ + " has inconsistent totals for " + entry.range.id + ".");
    }
    if (!index.emplace(entry.range.id, slots.size()).second) {
      journal_.record(kComponent, "Duplicate record for " + entry.range.id + ".");
      return Result::failure(ErrorCode::Corrupt, path_ + " has duplicate range " + entry.range.id + ".");
    }
    slots.push_back(std::move(slot));
  }

  std::unique_lock lock(structure_mutex_);
  slots_ = std::move(slots);
  index_ = std::move(index);
  return Result::success("Progress ledger loaded.", std::to_string(slots_.size()));
}

ProgressLedger::Slot* ProgressLedger::slot_for(std::string_view range_id) const {
  const auto it = index_.find(std::string{range_id});
  if (it == index_.end()) {
    return nullptr;
  }
  return slots_[it->second].get();
}

Result ProgressLedger::insert_locked(const KeyRange& range, std::int64_t now) {
  if (index_.contains(range.id)) {
    return Result::failure(ErrorCode::Validation, "Range " + range.id + " already exists.");
  }
  auto slot = std::make_unique<Slot>();
  slot->entry = fresh_entry(range, now);
  index_.emplace(range.id, slots_.size());
  slots_.push_back(std::move(slot));
  return Result::success();
}

void ProgressLedger::recompute(ProgressRecord& record, std::int64_t now) const {
  record.percent_hundredths = percent_hundredths(record.searched_keys, record.total_keys);

  const auto whole_rate = static_cast<std::uint64_t>(std::llround(record.search_rate));
  if (record.search_rate <= 0.0 || whole_rate == 0) {
    record.estimated_completion_unix.reset();
    return;
  }
  const BigKey remaining = BigKey::saturating_sub(record.total_keys, record.searched_keys);
  const std::int64_t seconds = (remaining / BigKey{whole_rate}).to_int64_clamped();
  const std::int64_t headroom = std::numeric_limits<std::int64_t>::max() - now;
  record.estimated_completion_unix = now + (seconds > headroom ? headroom : seconds);
}

Result ProgressLedger::register_range(const KeyRange& range) {
  if (Result valid = validate_new_range(range); !valid.ok) {
    journal_.record(kComponent, "register rejected: " + valid.message);
    return valid;
  }
  {
    std::unique_lock lock(structure_mutex_);
    if (Result inserted = insert_locked(range, context_.now()); !inserted.ok) {
      journal_.record(kComponent, "register rejected: " + inserted.message);
      return inserted;
    }
  }
  return persist_or_report("register " + range.id);
}

bool ProgressLedger::seeded() const {
  std::shared_lock lock(structure_mutex_);
  return !slots_.empty();
}

Result ProgressLedger::seed_from_manifest(const Manifest& manifest) {
  std::vector<KeyRange> all;
  all.push_back(manifest.core);
  for (KeyRange split : manifest.parallel_splits) {
    split.parent_id = manifest.core.id;
    all.push_back(std::move(split));
  }
  all.insert(all.end(), manifest.fallback.begin(), manifest.fallback.end());

  std::unordered_set<std::string> ids;
  for (const auto& range : all) {
    if (Result valid = validate_new_range(range); !valid.ok) {
      return valid;
    }
    if (!ids.insert(range.id).second) {
      return Result::failure(ErrorCode::Validation, "Manifest repeats range id " + range.id + ".");
    }
  }

  const std::int64_t now = context_.now();
  {
    std::unique_lock lock(structure_mutex_);
    if (!slots_.empty()) {
      return Result::failure(ErrorCode::InvalidState, "Ledger is already seeded.");
    }

    for (const auto& range : all) {
      if (Result inserted = insert_locked(range, now); !inserted.ok) {
        slots_.clear();
        index_.clear();
        return inserted;
      }
    }

    if (!manifest.parallel_splits.empty()) {
      LedgerEntry& core = slots_[index_.at(manifest.core.id)]->entry;
      set_status(core, RangeStatus::Abandoned);
      core.range.split_reason = "manifest_split_" + std::to_string(manifest.parallel_splits.size()) + "way";
    }
  }

  journal_.record(kComponent, "seeded " + std::to_string(all.size()) + " ranges from manifest.");
  return persist_or_report("seed");
}

Result ProgressLedger::update(std::string_view range_id, const BigKey& searched_keys, std::optional<double> rate,
                              ProgressRecord& out, std::string_view holder) {
  if (rate.has_value() && (!std::isfinite(*rate) || *rate < 0.0)) {
    journal_.record(kComponent, "update rejected: invalid rate for " + std::string{range_id});
    return Result::failure(ErrorCode::Validation, "Search rate must be a finite, non-negative number.");
  }

  {
    std::shared_lock structure(structure_mutex_);
    Slot* slot = slot_for(range_id);
    if (slot == nullptr) {
      journal_.record(kComponent, "update rejected: unknown range " + std::string{range_id});
      return Result::failure(ErrorCode::Validation, "Unknown range id " + std::string{range_id} + ".");
    }

    std::lock_guard guard(slot->mutex);
    LedgerEntry& entry = slot->entry;
    if (is_terminal(entry.range.status)) {
      journal_.record(kComponent, "update rejected: " + entry.range.id + " is " + codec::status_name(entry.range.status));
      return Result::failure(ErrorCode::InvalidState,
                             "Range " + entry.range.id + " is " + codec::status_name(entry.range.status) + ".");
    }
    if (holder_mismatch(entry, holder)) {
      journal_.record(kComponent, "update rejected: stale holder " + std::string{holder} + " on " + entry.range.id);
      return stale_holder(entry, holder);
    }
    if (searched_keys > entry.progress.total_keys) {
      journal_.record(kComponent, "update rejected: searched exceeds total for " + entry.range.id);
      return Result::failure(ErrorCode::Validation, "searched_keys exceeds total_keys for " + entry.range.id + ".");
    }
    if (searched_keys < entry.progress.searched_keys) {
      journal_.record(kComponent, "update rejected: searched decreased for " + entry.range.id);
      return Result::failure(ErrorCode::Validation, "searched_keys must not decrease for " + entry.range.id + ".");
    }

    const std::int64_t now = context_.now();
    ProgressRecord& record = entry.progress;
    record.searched_keys = searched_keys;
    if (rate.has_value()) {
      record.search_rate = *rate;
    }
    if (record.started_unix == 0) {
      record.started_unix = now;
    }
    record.last_update_unix = now;
    if (entry.range.status == RangeStatus::Pending) {
      set_status(entry, RangeStatus::Active);
    }
    recompute(record, now);
    if (record.searched_keys == record.total_keys) {
      set_status(entry, RangeStatus::Completed);
      journal_.record(kComponent, entry.range.id + " completed by exhaustion.");
    }
    out = record;
  }

  return persist_or_report("update " + std::string{range_id});
}

Result ProgressLedger::activate(std::string_view range_id, std::string_view holder) {
  {
    std::shared_lock structure(structure_mutex_);
    Slot* slot = slot_for(range_id);
    if (slot == nullptr) {
      return Result::failure(ErrorCode::NotFound, "Unknown range id " + std::string{range_id} + ".");
    }
    std::lock_guard guard(slot->mutex);
    LedgerEntry& entry = slot->entry;
    if (is_terminal(entry.range.status)) {
      return Result::failure(ErrorCode::InvalidState, "Range " + entry.range.id + " is terminal.");
    }
    const std::int64_t now = context_.now();
    if (entry.range.status != RangeStatus::Active) {
      set_status(entry, RangeStatus::Active);
    }
    entry.progress.holder = std::string{holder};
    if (entry.progress.started_unix == 0) {
      entry.progress.started_unix = now;
    }
    entry.progress.last_update_unix = now;
  }
  return persist_or_report("activate " + std::string{range_id});
}

Result ProgressLedger::mark_completed(std::string_view range_id, bool exhausted, std::string_view holder) {
  {
    std::shared_lock structure(structure_mutex_);
    Slot* slot = slot_for(range_id);
    if (slot == nullptr) {
      return Result::failure(ErrorCode::NotFound, "Unknown range id " + std::string{range_id} + ".");
    }
    std::lock_guard guard(slot->mutex);
    LedgerEntry& entry = slot->entry;
    if (entry.range.status == RangeStatus::Completed) {
      return Result::success("Range already completed.");
    }
    if (entry.range.status == RangeStatus::Abandoned) {
      return Result::failure(ErrorCode::InvalidState, "Range " + entry.range.id + " was abandoned.");
    }
    if (holder_mismatch(entry, holder)) {
      journal_.record(kComponent, "completion rejected: stale holder " + std::string{holder} + " on " + entry.range.id);
      return stale_holder(entry, holder);
    }
    const std::int64_t now = context_.now();
    if (exhausted) {
      entry.progress.searched_keys = entry.progress.total_keys;
    }
    entry.progress.last_update_unix = now;
    recompute(entry.progress, now);
    entry.progress.estimated_completion_unix = now;
    set_status(entry, RangeStatus::Completed);
  }
  journal_.record(kComponent, std::string{range_id} + (exhausted ? " completed (exhausted)." : " completed (found)."));
  return persist_or_report("complete " + std::string{range_id});
}

Result ProgressLedger::complete_overlapping(const BigKey& start, const BigKey& end,
                                            std::vector<std::string>& completed_ids, std::string_view holder) {
  if (!(start < end)) {
    return Result::failure(ErrorCode::Validation, "Overlap bounds must satisfy start < end.");
  }
  completed_ids.clear();
  {
    // Exclusive so the holder check and the transitions are one step.
    std::unique_lock structure(structure_mutex_);
    if (!holder.empty()) {
      const bool held = std::ranges::any_of(slots_, [&](const std::unique_ptr<Slot>& slot) {
        return !holder_mismatch(slot->entry, holder) && slot->entry.range.overlaps(start, end);
      });
      if (!held) {
        journal_.record(kComponent, "find rejected: stale holder " + std::string{holder});
        return Result::failure(ErrorCode::InvalidState,
                               "Assignment " + std::string{holder} + " no longer holds a range in these bounds.");
      }
    }
    const std::int64_t now = context_.now();
    for (const auto& slot : slots_) {
      std::lock_guard guard(slot->mutex);
      LedgerEntry& entry = slot->entry;
      if (is_terminal(entry.range.status) || !entry.range.overlaps(start, end)) {
        continue;
      }
      entry.progress.last_update_unix = now;
      recompute(entry.progress, now);
      entry.progress.estimated_completion_unix = now;
      set_status(entry, RangeStatus::Completed);
      completed_ids.push_back(entry.range.id);
    }
  }
  journal_.record(kComponent, "find completed " + std::to_string(completed_ids.size()) + " overlapping ranges.");
  return persist_or_report("complete overlapping");
}

Result ProgressLedger::release(std::string_view range_id, std::string_view holder) {
  {
    std::shared_lock structure(structure_mutex_);
    Slot* slot = slot_for(range_id);
    if (slot == nullptr) {
      return Result::failure(ErrorCode::NotFound, "Unknown range id " + std::string{range_id} + ".");
    }
    std::lock_guard guard(slot->mutex);
    LedgerEntry& entry = slot->entry;
    if (entry.range.status != RangeStatus::Active) {
      return Result::success("Range not active; nothing to release.");
    }
    if (holder_mismatch(entry, holder)) {
      journal_.record(kComponent, "release rejected: stale holder " + std::string{holder} + " on " + entry.range.id);
      return stale_holder(entry, holder);
    }
    set_status(entry, RangeStatus::Pending);
    entry.progress.search_rate = 0.0;
    entry.progress.estimated_completion_unix.reset();
  }
  journal_.record(kComponent, std::string{range_id} + " released back to pending.");
  return persist_or_report("release " + std::string{range_id});
}

Result ProgressLedger::apply_split(std::string_view parent_id, const std::vector<KeyRange>& children,
                                   std::string_view split_reason) {
  if (children.empty()) {
    return Result::failure(ErrorCode::Validation, "Split requires at least one child.");
  }
  for (const auto& child : children) {
    if (Result valid = validate_new_range(child); !valid.ok) {
      return valid;
    }
  }

  {
    std::unique_lock structure(structure_mutex_);
    Slot* parent_slot = slot_for(parent_id);
    if (parent_slot == nullptr) {
      return Result::failure(ErrorCode::Validation, "Unknown range id " + std::string{parent_id} + ".");
    }
    LedgerEntry& parent = parent_slot->entry;
    if (is_terminal(parent.range.status)) {
      journal_.record(kComponent, "split rejected: " + parent.range.id + " is terminal.");
      return Result::failure(ErrorCode::InvalidState,
                             "Range " + parent.range.id + " is " + codec::status_name(parent.range.status) + ".");
    }

    BigKey cursor = parent.range.start;
    std::unordered_set<std::string> ids;
    for (const auto& child : children) {
      if (child.start != cursor) {
        return Result::failure(ErrorCode::Validation, "Split children must be contiguous.");
      }
      if (index_.contains(child.id) || !ids.insert(child.id).second) {
        return Result::failure(ErrorCode::Validation, "Split child id " + child.id + " already exists.");
      }
      cursor = child.end;
    }
    if (cursor != parent.range.end) {
      return Result::failure(ErrorCode::Validation, "Split children must cover the parent exactly.");
    }

    const std::int64_t now = context_.now();
    for (const auto& child : children) {
      KeyRange copy = child;
      copy.parent_id = parent.range.id;
      if (Result inserted = insert_locked(copy, now); !inserted.ok) {
        return inserted;
      }
    }
    set_status(parent, RangeStatus::Abandoned);
    parent.range.split_reason = std::string{split_reason};
  }

  journal_.record(kComponent, std::string{parent_id} + " split into " + std::to_string(children.size()) + " ranges.");
  return persist_or_report("split " + std::string{parent_id});
}

std::vector<LedgerEntry> ProgressLedger::copy_entries() const {
  std::shared_lock structure(structure_mutex_);
  std::vector<LedgerEntry> out;
  out.reserve(slots_.size());
  for (const auto& slot : slots_) {
    std::lock_guard guard(slot->mutex);
    out.push_back(slot->entry);
  }
  return out;
}

std::vector<LedgerEntry> ProgressLedger::snapshot() const {
  return copy_entries();
}

std::optional<LedgerEntry> ProgressLedger::find(std::string_view range_id) const {
  std::shared_lock structure(structure_mutex_);
  const Slot* slot = slot_for(range_id);
  if (slot == nullptr) {
    return std::nullopt;
  }
  std::lock_guard guard(slot->mutex);
  return slot->entry;
}

CoverageSummary ProgressLedger::aggregate_coverage() const {
  CoverageSummary summary;
  for (const auto& entry : copy_entries()) {
    if (entry.range.status == RangeStatus::Abandoned) {
      continue;
    }
    summary.total_keyspace += entry.progress.total_keys;
    summary.searched_keyspace += entry.progress.searched_keys;
  }
  summary.percent_hundredths = percent_hundredths(summary.searched_keyspace, summary.total_keyspace);
  return summary;
}

std::size_t ProgressLedger::size() const {
  std::shared_lock structure(structure_mutex_);
  return slots_.size();
}

Result ProgressLedger::save() const {
  std::lock_guard lock(save_mutex_);
  Json::Value root(Json::arrayValue);
  for (const auto& entry : copy_entries()) {
    Json::Value item(Json::objectValue);
    item["range"] = codec::encode_range(entry.range);
    item["progress"] = codec::encode_progress(entry.progress);
    root.append(item);
  }
  return codec::write_file_atomic(path_, root);
}

Result ProgressLedger::persist_or_report(std::string_view action) const {
  const Result saved = save();
  if (!saved.ok) {
    journal_.record(kComponent, std::string{action} + " persist failed: " + saved.message);
    return saved;
  }
  return Result::success(std::string{action} + " recorded.");
}

}  // namespace keyspan
