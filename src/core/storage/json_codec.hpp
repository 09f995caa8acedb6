#pragma once

#include <string>

#include <json/json.h>

#include "core/model/types.hpp"

namespace keyspan::codec {

// Big integers are always written as decimal strings; readers also accept
// "0x"-prefixed hex so hand-edited files stay loadable.
Json::Value encode_key(const BigKey& key);
bool decode_key(const Json::Value& value, BigKey& out);

std::string status_name(RangeStatus status);
bool parse_status(const std::string& name, RangeStatus& out);
std::string scan_type_name(ScanType type);
bool parse_scan_type(const std::string& name, ScanType& out);

Json::Value encode_range(const KeyRange& range);
bool decode_range(const Json::Value& value, KeyRange& out);

Json::Value encode_progress(const ProgressRecord& record);
bool decode_progress(const Json::Value& value, ProgressRecord& out);

Json::Value encode_manifest(const Manifest& manifest);
bool decode_manifest(const Json::Value& value, Manifest& out);

Json::Value encode_strategy(const AdaptiveStrategy& strategy);

Json::Value encode_pool_config(const PoolConfig& config);
bool decode_pool_config(const Json::Value& value, PoolConfig& out);

Json::Value encode_assignment(const Assignment& assignment);
bool decode_assignment(const Json::Value& value, Assignment& out);

Json::Value encode_contribution(const Contribution& contribution);
bool decode_contribution(const Json::Value& value, Contribution& out);

Json::Value encode_stats(const PoolStats& stats);
bool decode_stats(const Json::Value& value, PoolStats& out);

// NotFound when the file is absent, Corrupt when it does not parse.
Result read_file(const std::string& path, Json::Value& out);
// Writes to a sibling temp file and renames it over the target.
Result write_file_atomic(const std::string& path, const Json::Value& value);

}  // namespace keyspan::codec
