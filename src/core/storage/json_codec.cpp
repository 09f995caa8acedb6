#include "core/storage/json_codec.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <system_error>
#include <utility>

#include "core/util/common.hpp"

namespace keyspan::codec {
namespace {

bool read_string(const Json::Value& value, const char* key, std::string& out) {
  const Json::Value& field = value[key];
  if (field.isNull()) {
    return true;
  }
  if (!field.isString()) {
    return false;
  }
  out = field.asString();
  return true;
}

bool read_int64(const Json::Value& value, const char* key, std::int64_t& out) {
  const Json::Value& field = value[key];
  if (field.isNull()) {
    return true;
  }
  if (!field.isInt64()) {
    return false;
  }
  out = field.asInt64();
  return true;
}

bool read_int(const Json::Value& value, const char* key, int& out) {
  std::int64_t wide = out;
  if (!read_int64(value, key, wide)) {
    return false;
  }
  out = static_cast<int>(wide);
  return true;
}

bool read_double(const Json::Value& value, const char* key, double& out) {
  const Json::Value& field = value[key];
  if (field.isNull()) {
    return true;
  }
  if (!field.isNumeric()) {
    return false;
  }
  out = field.asDouble();
  return true;
}

bool read_required_key(const Json::Value& value, const char* key, BigKey& out) {
  return value.isMember(key) && decode_key(value[key], out);
}

}  // namespace

Json::Value encode_key(const BigKey& key) {
  return Json::Value(key.to_decimal());
}

bool decode_key(const Json::Value& value, BigKey& out) {
  if (value.isString()) {
    auto parsed = BigKey::parse(value.asString());
    if (!parsed.has_value()) {
      return false;
    }
    out = *parsed;
    return true;
  }
  if (value.isUInt64()) {
    out = BigKey{static_cast<std::uint64_t>(value.asUInt64())};
    return true;
  }
  return false;
}

std::string status_name(RangeStatus status) {
  switch (status) {
    case RangeStatus::Pending:
      return "pending";
    case RangeStatus::Active:
      return "active";
    case RangeStatus::Completed:
      return "completed";
    case RangeStatus::Abandoned:
      return "abandoned";
  }
  return "pending";
}

bool parse_status(const std::string& name, RangeStatus& out) {
  if (name == "pending") {
    out = RangeStatus::Pending;
  } else if (name == "active") {
    out = RangeStatus::Active;
  } else if (name == "completed") {
    out = RangeStatus::Completed;
  } else if (name == "abandoned") {
    out = RangeStatus::Abandoned;
  } else {
    return false;
  }
  return true;
}

std::string scan_type_name(ScanType type) {
  switch (type) {
    case ScanType::IncludeDefeated:
      return "includeDefeated";
    case ScanType::ExcludeDefeated:
      return "excludeDefeated";
    case ScanType::CustomRange:
      return "customRange";
  }
  return "includeDefeated";
}

bool parse_scan_type(const std::string& name, ScanType& out) {
  if (name == "includeDefeated") {
    out = ScanType::IncludeDefeated;
  } else if (name == "excludeDefeated") {
    out = ScanType::ExcludeDefeated;
  } else if (name == "customRange") {
    out = ScanType::CustomRange;
  } else {
    return false;
  }
  return true;
}

Json::Value encode_range(const KeyRange& range) {
  Json::Value out(Json::objectValue);
  out["id"] = range.id;
  out["start"] = encode_key(range.start);
  out["end"] = encode_key(range.end);
  out["start_hex"] = "0x" + range.start.to_hex();
  out["end_hex"] = "0x" + range.end.to_hex();
  out["priority"] = range.priority;
  out["status"] = status_name(range.status);
  if (!range.parent_id.empty()) {
    out["parent_id"] = range.parent_id;
  }
  if (!range.label.empty()) {
    out["label"] = range.label;
  }
  if (!range.split_reason.empty()) {
    out["split_reason"] = range.split_reason;
  }
  out["created_unix"] = static_cast<Json::Int64>(range.created_unix);
  return out;
}

bool decode_range(const Json::Value& value, KeyRange& out) {
  if (!value.isObject()) {
    return false;
  }
  KeyRange range;
  std::string status = "pending";
  if (!read_string(value, "id", range.id) || range.id.empty() || !read_required_key(value, "start", range.start) ||
      !read_required_key(value, "end", range.end) || !read_int(value, "priority", range.priority) ||
      !read_string(value, "status", status) || !parse_status(status, range.status) ||
      !read_string(value, "parent_id", range.parent_id) || !read_string(value, "label", range.label) ||
      !read_string(value, "split_reason", range.split_reason) ||
      !read_int64(value, "created_unix", range.created_unix)) {
    return false;
  }
  if (!(range.start < range.end)) {
    return false;
  }
  out = std::move(range);
  return true;
}

Json::Value encode_progress(const ProgressRecord& record) {
  Json::Value out(Json::objectValue);
  out["range_id"] = record.range_id;
  out["total_keys"] = encode_key(record.total_keys);
  out["searched_keys"] = encode_key(record.searched_keys);
  out["percent_complete"] = format_hundredths(record.percent_hundredths);
  out["search_rate"] = record.search_rate;
  out["started_unix"] = static_cast<Json::Int64>(record.started_unix);
  out["last_update_unix"] = static_cast<Json::Int64>(record.last_update_unix);
  if (record.estimated_completion_unix.has_value()) {
    out["estimated_completion_unix"] = static_cast<Json::Int64>(*record.estimated_completion_unix);
  } else {
    out["estimated_completion_unix"] = Json::Value();
  }
  out["status"] = status_name(record.status);
  if (!record.holder.empty()) {
    out["holder"] = record.holder;
  }
  return out;
}

bool decode_progress(const Json::Value& value, ProgressRecord& out) {
  if (!value.isObject()) {
    return false;
  }
  ProgressRecord record;
  std::string status = "pending";
  if (!read_string(value, "range_id", record.range_id) || record.range_id.empty() ||
      !read_required_key(value, "total_keys", record.total_keys) ||
      !read_required_key(value, "searched_keys", record.searched_keys) ||
      !read_double(value, "search_rate", record.search_rate) ||
      !read_int64(value, "started_unix", record.started_unix) ||
      !read_int64(value, "last_update_unix", record.last_update_unix) || !read_string(value, "status", status) ||
      !parse_status(status, record.status) || !read_string(value, "holder", record.holder)) {
    return false;
  }
  if (record.searched_keys > record.total_keys) {
    return false;
  }
  const Json::Value& eta = value["estimated_completion_unix"];
  if (!eta.isNull()) {
    if (!eta.isIntegral()) {
      return false;
    }
    record.estimated_completion_unix = eta.asInt64();
  }
  // Percent is derived, never trusted from disk.
  record.percent_hundredths = percent_hundredths(record.searched_keys, record.total_keys);
  out = std::move(record);
  return true;
}

Json::Value encode_manifest(const Manifest& manifest) {
  Json::Value out(Json::objectValue);
  Json::Value keyspace(Json::objectValue);
  keyspace["range_min"] = encode_key(manifest.keyspace.range_min);
  keyspace["range_max"] = encode_key(manifest.keyspace.range_max);
  keyspace["range_size"] = encode_key(manifest.keyspace.range_size());
  out["keyspace"] = keyspace;

  Json::Value estimate(Json::objectValue);
  estimate["central"] = manifest.estimate.central;
  estimate["ci_lower"] = manifest.estimate.ci_lower;
  estimate["ci_upper"] = manifest.estimate.ci_upper;
  out["estimate"] = estimate;

  out["target_id"] = manifest.keyspace.target_id;
  out["high_priority"] = encode_range(manifest.core);

  Json::Value splits(Json::arrayValue);
  for (const auto& split : manifest.parallel_splits) {
    splits.append(encode_range(split));
  }
  out["multi_gpu_splits"] = splits;

  Json::Value fallback(Json::arrayValue);
  for (const auto& range : manifest.fallback) {
    fallback.append(encode_range(range));
  }
  out["fallback"] = fallback;
  out["generated_unix"] = static_cast<Json::Int64>(manifest.generated_unix);
  return out;
}

bool decode_manifest(const Json::Value& value, Manifest& out) {
  if (!value.isObject() || !value["keyspace"].isObject() || !value["multi_gpu_splits"].isArray() ||
      !value["fallback"].isArray()) {
    return false;
  }
  Manifest manifest;
  const Json::Value& keyspace = value["keyspace"];
  const Json::Value& estimate = value["estimate"];
  if (!read_required_key(keyspace, "range_min", manifest.keyspace.range_min) ||
      !read_required_key(keyspace, "range_max", manifest.keyspace.range_max) ||
      !read_string(value, "target_id", manifest.keyspace.target_id) ||
      !decode_range(value["high_priority"], manifest.core) ||
      !read_int64(value, "generated_unix", manifest.generated_unix)) {
    return false;
  }
  if (estimate.isObject() &&
      (!read_double(estimate, "central", manifest.estimate.central) ||
       !read_double(estimate, "ci_lower", manifest.estimate.ci_lower) ||
       !read_double(estimate, "ci_upper", manifest.estimate.ci_upper))) {
    return false;
  }
  for (const auto& item : value["multi_gpu_splits"]) {
    KeyRange range;
    if (!decode_range(item, range)) {
      return false;
    }
    manifest.parallel_splits.push_back(std::move(range));
  }
  for (const auto& item : value["fallback"]) {
    KeyRange range;
    if (!decode_range(item, range)) {
      return false;
    }
    manifest.fallback.push_back(std::move(range));
  }
  out = std::move(manifest);
  return true;
}

Json::Value encode_strategy(const AdaptiveStrategy& strategy) {
  Json::Value out(Json::objectValue);

  Json::Value current(Json::arrayValue);
  for (const auto& scored : strategy.current_ranges) {
    Json::Value item = encode_range(scored.range);
    item["score"] = scored.score;
    current.append(item);
  }
  out["current_ranges"] = current;

  Json::Value completed(Json::arrayValue);
  for (const auto& id : strategy.completed_ranges) {
    completed.append(id);
  }
  out["completed_ranges"] = completed;

  Json::Value next(Json::arrayValue);
  for (const auto& range : strategy.next_recommended) {
    next.append(encode_range(range));
  }
  out["next_recommended"] = next;

  Json::Value stats(Json::objectValue);
  stats["total_keyspace"] = encode_key(strategy.coverage.total_keyspace);
  stats["searched_keyspace"] = encode_key(strategy.coverage.searched_keyspace);
  stats["percent_complete"] = format_hundredths(strategy.coverage.percent_hundredths);
  stats["high_priority_complete"] = format_hundredths(strategy.high_priority_complete_hundredths);
  out["statistics"] = stats;

  Json::Value recommendations(Json::arrayValue);
  for (const auto& line : strategy.recommendations) {
    recommendations.append(line);
  }
  out["recommendations"] = recommendations;
  out["generated_unix"] = static_cast<Json::Int64>(strategy.generated_unix);
  return out;
}

Json::Value encode_pool_config(const PoolConfig& config) {
  Json::Value out(Json::objectValue);
  out["pool_url"] = config.pool_url;
  out["client_id"] = config.client_id;
  out["scan_type"] = scan_type_name(config.scan_type);
  out["report_interval_seconds"] = static_cast<Json::UInt64>(config.report_interval_seconds);
  if (config.custom_range.has_value()) {
    Json::Value custom(Json::objectValue);
    custom["start"] = encode_key(config.custom_range->start);
    custom["end"] = encode_key(config.custom_range->end);
    out["custom_range"] = custom;
  }
  return out;
}

bool decode_pool_config(const Json::Value& value, PoolConfig& out) {
  if (!value.isObject()) {
    return false;
  }
  PoolConfig config;
  std::string scan_type = scan_type_name(config.scan_type);
  if (!read_string(value, "pool_url", config.pool_url) || !read_string(value, "client_id", config.client_id) ||
      config.client_id.empty() || !read_string(value, "scan_type", scan_type) ||
      !parse_scan_type(scan_type, config.scan_type)) {
    return false;
  }
  const Json::Value& interval = value["report_interval_seconds"];
  if (!interval.isNull()) {
    if (!interval.isUInt64() || interval.asUInt64() == 0) {
      return false;
    }
    config.report_interval_seconds = interval.asUInt64();
  }
  const Json::Value& custom = value["custom_range"];
  if (!custom.isNull()) {
    CustomRange range;
    if (!read_required_key(custom, "start", range.start) || !read_required_key(custom, "end", range.end) ||
        !(range.start < range.end)) {
      return false;
    }
    config.custom_range = range;
  }
  out = std::move(config);
  return true;
}

Json::Value encode_assignment(const Assignment& assignment) {
  Json::Value out(Json::objectValue);
  out["assignment_id"] = assignment.assignment_id;
  out["range_id"] = assignment.range_id;
  out["client_id"] = assignment.client_id;
  out["start"] = encode_key(assignment.start);
  out["end"] = encode_key(assignment.end);
  out["target_id"] = assignment.target_id;
  out["priority"] = assignment.priority;
  out["assigned_unix"] = static_cast<Json::Int64>(assignment.assigned_unix);
  if (assignment.expires_unix.has_value()) {
    out["expires_unix"] = static_cast<Json::Int64>(*assignment.expires_unix);
  }
  return out;
}

bool decode_assignment(const Json::Value& value, Assignment& out) {
  if (!value.isObject()) {
    return false;
  }
  Assignment assignment;
  if (!read_string(value, "assignment_id", assignment.assignment_id) || assignment.assignment_id.empty() ||
      !read_string(value, "range_id", assignment.range_id) || assignment.range_id.empty() ||
      !read_string(value, "client_id", assignment.client_id) ||
      !read_required_key(value, "start", assignment.start) || !read_required_key(value, "end", assignment.end) ||
      !read_string(value, "target_id", assignment.target_id) || !read_int(value, "priority", assignment.priority) ||
      !read_int64(value, "assigned_unix", assignment.assigned_unix)) {
    return false;
  }
  const Json::Value& expires = value["expires_unix"];
  if (!expires.isNull()) {
    if (!expires.isIntegral()) {
      return false;
    }
    assignment.expires_unix = expires.asInt64();
  }
  out = std::move(assignment);
  return true;
}

Json::Value encode_contribution(const Contribution& contribution) {
  Json::Value out(Json::objectValue);
  out["client_id"] = contribution.client_id;
  out["ranges_completed"] = static_cast<Json::UInt64>(contribution.ranges_completed);
  out["keys_searched"] = encode_key(contribution.keys_searched);
  out["rank"] = static_cast<Json::UInt64>(contribution.rank);
  return out;
}

bool decode_contribution(const Json::Value& value, Contribution& out) {
  if (!value.isObject()) {
    return false;
  }
  Contribution contribution;
  if (!read_string(value, "client_id", contribution.client_id) || contribution.client_id.empty() ||
      !read_required_key(value, "keys_searched", contribution.keys_searched)) {
    return false;
  }
  if (value["ranges_completed"].isUInt64()) {
    contribution.ranges_completed = static_cast<std::size_t>(value["ranges_completed"].asUInt64());
  }
  if (value["rank"].isUInt64()) {
    contribution.rank = static_cast<std::size_t>(value["rank"].asUInt64());
  }
  out = std::move(contribution);
  return true;
}

Json::Value encode_stats(const PoolStats& stats) {
  Json::Value out(Json::objectValue);
  out["participant_count"] = static_cast<Json::UInt64>(stats.participant_count);
  out["ranges_completed"] = static_cast<Json::UInt64>(stats.ranges_completed);
  out["keyspace_covered"] = format_hundredths(stats.keyspace_covered_hundredths);
  out["keyspace_covered_hundredths"] = static_cast<Json::Int64>(stats.keyspace_covered_hundredths);
  out["searched_hundredths"] = static_cast<Json::Int64>(stats.searched_hundredths);
  Json::Value participants(Json::arrayValue);
  for (const auto& contribution : stats.participants) {
    participants.append(encode_contribution(contribution));
  }
  out["participants"] = participants;
  if (stats.your_contribution.has_value()) {
    out["your_contribution"] = encode_contribution(*stats.your_contribution);
  }
  out["stale"] = stats.stale;
  out["as_of_unix"] = static_cast<Json::Int64>(stats.as_of_unix);
  return out;
}

bool decode_stats(const Json::Value& value, PoolStats& out) {
  if (!value.isObject() || !value["participants"].isArray()) {
    return false;
  }
  PoolStats stats;
  if (!read_int64(value, "keyspace_covered_hundredths", stats.keyspace_covered_hundredths) ||
      !read_int64(value, "searched_hundredths", stats.searched_hundredths) ||
      !read_int64(value, "as_of_unix", stats.as_of_unix)) {
    return false;
  }
  if (value["participant_count"].isUInt64()) {
    stats.participant_count = static_cast<std::size_t>(value["participant_count"].asUInt64());
  }
  if (value["ranges_completed"].isUInt64()) {
    stats.ranges_completed = static_cast<std::size_t>(value["ranges_completed"].asUInt64());
  }
  for (const auto& item : value["participants"]) {
    Contribution contribution;
    if (!decode_contribution(item, contribution)) {
      return false;
    }
    stats.participants.push_back(std::move(contribution));
  }
  if (value.isMember("your_contribution")) {
    Contribution mine;
    if (!decode_contribution(value["your_contribution"], mine)) {
      return false;
    }
    stats.your_contribution = std::move(mine);
  }
  const Json::Value& stale = value["stale"];
  if (!stale.isNull()) {
    if (!stale.isBool()) {
      return false;
    }
    stats.stale = stale.asBool();
  }
  out = std::move(stats);
  return true;
}

Result read_file(const std::string& path, Json::Value& out) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return Result::failure(ErrorCode::NotFound, path + " does not exist.");
  }

  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    return Result::failure(ErrorCode::Io, "Failed to open " + path + ".");
  }

  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  std::string errors;
  Json::Value parsed;
  if (!Json::parseFromStream(builder, in, &parsed, &errors)) {
    return Result::failure(ErrorCode::Corrupt, path + " is not valid JSON: " + errors);
  }
  out = std::move(parsed);
  return Result::success();
}

Result write_file_atomic(const std::string& path, const Json::Value& value) {
  const std::filesystem::path target{path};
  std::error_code ec;
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
      return Result::failure(ErrorCode::Io, "Failed to create " + target.parent_path().string() + ".");
    }
  }

  const std::filesystem::path temp = target.string() + ".tmp." + util::random_hex(4);
  {
    std::ofstream out(temp, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out) {
      return Result::failure(ErrorCode::Io, "Failed to write " + temp.string() + ".");
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    const std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(value, &out);
    out << "\n";
    out.flush();
    if (!out.good()) {
      return Result::failure(ErrorCode::Io, "Failed to flush " + temp.string() + ".");
    }
  }

  std::filesystem::rename(temp, target, ec);
  if (ec) {
    std::error_code cleanup;
    std::filesystem::remove(temp, cleanup);
    return Result::failure(ErrorCode::Io, "Failed to replace " + path + ": " + ec.message());
  }
  return Result::success();
}

}  // namespace keyspan::codec
