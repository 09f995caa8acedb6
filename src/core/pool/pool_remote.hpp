#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace keyspan {

// Ledger id under which a participant's custom bounds are registered.
inline std::string custom_range_id(const CustomRange& range) {
  return "custom_" + range.start.to_hex() + "_" + range.end.to_hex();
}

struct AssignmentRequest {
  std::string client_id;
  ScanType scan_type = ScanType::IncludeDefeated;
  std::optional<CustomRange> custom_range;
  // Seconds without a heartbeat before the assignment expires.
  std::int64_t lease_seconds = 600;
};

struct ProgressReport {
  std::string assignment_id;
  std::string client_id;
  BigKey searched_keys;
  double search_rate = 0.0;
};

struct CompletionReport {
  std::string assignment_id;
  std::string client_id;
  bool found = false;
  std::string evidence;
};

// Request/response contract between a participant and the pool. Every call is
// bounded by the caller's timeout; an implementation that cannot answer in
// time returns ErrorCode::Unavailable. Expired or unknown assignments are
// reported as ErrorCode::InvalidState.
class IPoolRemote {
public:
  virtual ~IPoolRemote() = default;

  virtual Result register_participant(std::string_view client_id, std::chrono::milliseconds timeout) = 0;
  virtual Result request_assignment(const AssignmentRequest& request, std::chrono::milliseconds timeout,
                                    Assignment& out) = 0;
  virtual Result report_progress(const ProgressReport& report, std::chrono::milliseconds timeout) = 0;
  virtual Result report_completion(const CompletionReport& report, std::chrono::milliseconds timeout) = 0;
  virtual Result abandon_assignment(std::string_view assignment_id, std::string_view client_id,
                                    std::string_view reason, std::chrono::milliseconds timeout) = 0;
  virtual Result fetch_stats(std::string_view client_id, std::chrono::milliseconds timeout, PoolStats& out) = 0;
};

}  // namespace keyspan
