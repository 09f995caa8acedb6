#include "app/cli.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/model/app_meta.hpp"
#include "core/storage/json_codec.hpp"
#include "core/util/common.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitRejected = 1;
constexpr int kExitUsage = 2;

void print_usage(std::ostream& out) {
  out << keyspan::kAppDisplayName << " " << keyspan::kAppVersion << " (" << keyspan::kBuildRelease << ")\n\n"
      << "Usage: keyspan [--data-dir DIR] <command> [args]\n\n"
      << "Range planning:\n"
      << "  plan <central> <ci_lower> <ci_upper> [range_min range_max [target_id]]\n"
      << "  status\n"
      << "  update <range_id> <searched_keys> [rate]\n"
      << "  split <range_id> [count]\n\n"
      << "Pool participation:\n"
      << "  init [start end]\n"
      << "  request\n"
      << "  report <searched_keys> <rate>\n"
      << "  complete <found> [evidence]\n"
      << "  abandon [reason]\n"
      << "  stats\n\n"
      << "Numbers accept decimal or 0x-prefixed hex. The data directory defaults to $"
      << keyspan::kDataDirEnv << " or ./" << keyspan::kDefaultDataDir << ".\n";
}

int usage_error(std::string_view message) {
  std::cerr << "keyspan: " << message << "\n\n";
  print_usage(std::cerr);
  return kExitUsage;
}

int report(const keyspan::Result& result) {
  if (!result.ok) {
    std::cerr << "Error: " << result.message << '\n';
    return kExitRejected;
  }
  std::cout << result.message << '\n';
  return kExitOk;
}

std::string describe_range(const keyspan::KeyRange& range) {
  std::string line = range.id + "  [0x" + range.start.to_hex() + ", 0x" + range.end.to_hex() + ")";
  line += "  priority=" + std::to_string(range.priority);
  line += "  " + keyspan::codec::status_name(range.status);
  if (!range.parent_id.empty()) {
    line += "  parent=" + range.parent_id;
  }
  return line;
}

int cmd_plan(keyspan::CoreApi& api, const std::vector<std::string>& args) {
  if (args.size() != 3 && args.size() != 5 && args.size() != 6) {
    return usage_error("plan expects <central> <ci_lower> <ci_upper> [range_min range_max [target_id]]");
  }
  const auto central = keyspan::util::parse_double(args[0]);
  const auto lower = keyspan::util::parse_double(args[1]);
  const auto upper = keyspan::util::parse_double(args[2]);
  if (!central || !lower || !upper) {
    return usage_error("plan percentages must be numbers");
  }

  keyspan::KeyspaceConfig keyspace;
  if (args.size() >= 5) {
    const auto range_min = keyspan::BigKey::parse(args[3]);
    const auto range_max = keyspan::BigKey::parse(args[4]);
    if (!range_min || !range_max) {
      return usage_error("plan bounds must be decimal or 0x hex integers");
    }
    keyspace.range_min = *range_min;
    keyspace.range_max = *range_max;
  }
  if (args.size() == 6) {
    keyspace.target_id = args[5];
  }

  keyspan::Manifest manifest;
  const keyspan::Result result =
      api.plan({.central = *central, .ci_lower = *lower, .ci_upper = *upper}, keyspace, manifest);
  if (!result.ok) {
    return report(result);
  }
  std::cout << result.message << '\n';
  std::cout << "core:     " << describe_range(manifest.core) << '\n';
  for (const auto& split : manifest.parallel_splits) {
    std::cout << "parallel: " << describe_range(split) << '\n';
  }
  for (const auto& fallback : manifest.fallback) {
    std::cout << "fallback: " << describe_range(fallback) << '\n';
  }
  return kExitOk;
}

int cmd_status(keyspan::CoreApi& api) {
  keyspan::AdaptiveStrategy strategy;
  const keyspan::Result result = api.strategy(strategy);
  if (!result.ok) {
    return report(result);
  }

  const auto entries = api.ranges();
  if (entries.empty()) {
    std::cout << "No ranges tracked yet. Run plan or init first.\n";
    return kExitOk;
  }
  for (const auto& entry : entries) {
    std::cout << describe_range(entry.range) << "  " << keyspan::format_hundredths(entry.progress.percent_hundredths)
              << "%";
    if (entry.progress.search_rate > 0.0) {
      std::cout << "  rate=" << entry.progress.search_rate;
    }
    if (entry.progress.estimated_completion_unix.has_value()) {
      std::cout << "  eta=" << keyspan::util::format_unix_utc(*entry.progress.estimated_completion_unix);
    }
    std::cout << '\n';
  }

  std::cout << "\nCoverage: " << strategy.coverage.searched_keyspace.to_decimal() << " / "
            << strategy.coverage.total_keyspace.to_decimal() << " keys ("
            << keyspan::format_hundredths(strategy.coverage.percent_hundredths) << "%)\n";
  std::cout << "High-priority complete: " << keyspan::format_hundredths(strategy.high_priority_complete_hundredths)
            << "%\n";
  if (!strategy.next_recommended.empty()) {
    std::cout << "\nNext recommended:\n";
    for (const auto& range : strategy.next_recommended) {
      std::cout << "  " << describe_range(range) << '\n';
    }
  }
  std::cout << "\nRecommendations:\n";
  if (strategy.recommendations.empty()) {
    std::cout << "  none\n";
  }
  for (const auto& line : strategy.recommendations) {
    std::cout << "  - " << line << '\n';
  }

  const keyspan::Result reaped = api.pool_server().tick(std::chrono::milliseconds(2000));
  if (!reaped.ok) {
    std::cerr << "Warning: " << reaped.message << '\n';
  } else if (reaped.data != "0") {
    std::cout << "\nExpired leases released: " << reaped.data << '\n';
  }
  bool header = false;
  for (const auto& record : api.pool_server().assignments()) {
    if (!keyspan::is_live(record.state)) {
      continue;
    }
    if (!header) {
      std::cout << "\nLive assignments:\n";
      header = true;
    }
    std::cout << "  " << record.assignment.assignment_id << "  " << record.assignment.range_id << "  "
              << record.assignment.client_id << "  " << keyspan::assignment_state_name(record.state)
              << "  heartbeat=" << keyspan::util::format_unix_utc(record.last_heartbeat_unix) << '\n';
  }
  return kExitOk;
}

int cmd_update(keyspan::CoreApi& api, const std::vector<std::string>& args) {
  if (args.size() != 2 && args.size() != 3) {
    return usage_error("update expects <range_id> <searched_keys> [rate]");
  }
  const auto searched = keyspan::BigKey::parse(args[1]);
  if (!searched) {
    return usage_error("searched_keys must be a decimal or 0x hex integer");
  }
  std::optional<double> rate;
  if (args.size() == 3) {
    rate = keyspan::util::parse_double(args[2]);
    if (!rate) {
      return usage_error("rate must be a number");
    }
  }

  keyspan::ProgressRecord record;
  const keyspan::Result result = api.update(args[0], *searched, rate, record);
  if (!result.ok) {
    return report(result);
  }
  std::cout << record.range_id << ": " << keyspan::format_hundredths(record.percent_hundredths) << "% ("
            << record.searched_keys.to_decimal() << " / " << record.total_keys.to_decimal() << ") "
            << keyspan::codec::status_name(record.status) << '\n';
  return kExitOk;
}

int cmd_split(keyspan::CoreApi& api, const std::vector<std::string>& args) {
  if (args.empty() || args.size() > 2) {
    return usage_error("split expects <range_id> [count]");
  }
  std::int64_t count = 2;
  if (args.size() == 2) {
    const auto parsed = keyspan::util::parse_int64(args[1]);
    if (!parsed) {
      return usage_error("count must be an integer");
    }
    count = *parsed;
  }
  if (count < 1) {
    return report(keyspan::Result::failure(keyspan::ErrorCode::Validation, "Split count must be at least 1."));
  }

  std::vector<keyspan::KeyRange> children;
  const keyspan::Result result = api.split(args[0], static_cast<std::size_t>(count), children);
  if (!result.ok) {
    return report(result);
  }
  std::cout << result.message << '\n';
  for (const auto& child : children) {
    std::cout << "  " << describe_range(child) << '\n';
  }
  return kExitOk;
}

int cmd_init(keyspan::CoreApi& api, const std::vector<std::string>& args) {
  if (args.size() != 0 && args.size() != 2) {
    return usage_error("init expects no arguments or <start> <end>");
  }
  std::optional<keyspan::CustomRange> custom;
  if (args.size() == 2) {
    const auto start = keyspan::BigKey::parse(args[0]);
    const auto end = keyspan::BigKey::parse(args[1]);
    if (!start || !end) {
      return usage_error("init bounds must be decimal or 0x hex integers");
    }
    custom = keyspan::CustomRange{*start, *end};
  }
  return report(api.pool_init(custom));
}

int cmd_request(keyspan::CoreApi& api) {
  keyspan::Assignment assignment;
  const keyspan::Result result = api.request(assignment);
  if (!result.ok) {
    return report(result);
  }
  std::cout << result.message << '\n'
            << "assignment: " << assignment.assignment_id << '\n'
            << "range:      " << assignment.range_id << '\n'
            << "start:      0x" << assignment.start.to_hex() << '\n'
            << "end:        0x" << assignment.end.to_hex() << '\n';
  if (assignment.expires_unix.has_value()) {
    std::cout << "expires:    " << keyspan::util::format_unix_utc(*assignment.expires_unix) << '\n';
  }
  return kExitOk;
}

int cmd_report(keyspan::CoreApi& api, const std::vector<std::string>& args) {
  if (args.size() != 2) {
    return usage_error("report expects <searched_keys> <rate>");
  }
  const auto searched = keyspan::BigKey::parse(args[0]);
  const auto rate = keyspan::util::parse_double(args[1]);
  if (!searched || !rate) {
    return usage_error("report expects an integer key count and a numeric rate");
  }
  return report(api.report(*searched, *rate));
}

int cmd_complete(keyspan::CoreApi& api, const std::vector<std::string>& args) {
  if (args.empty() || args.size() > 2) {
    return usage_error("complete expects <found> [evidence]");
  }
  const auto found = keyspan::util::parse_boolish(args[0]);
  if (!found) {
    return usage_error("found must be true or false (got '" + args[0] + "')");
  }
  return report(api.complete(*found, args.size() == 2 ? args[1] : std::string{}));
}

int cmd_abandon(keyspan::CoreApi& api, const std::vector<std::string>& args) {
  if (args.size() > 1) {
    return usage_error("abandon expects at most one reason");
  }
  return report(api.abandon(args.empty() ? "user_requested" : args[0]));
}

int cmd_stats(keyspan::CoreApi& api) {
  keyspan::PoolStats stats;
  const keyspan::Result result = api.stats(stats);
  if (!result.ok) {
    return report(result);
  }
  std::cout << result.message << '\n'
            << "participants:     " << stats.participant_count << '\n'
            << "ranges completed: " << stats.ranges_completed << '\n'
            << "keyspace covered: " << keyspan::format_hundredths(stats.keyspace_covered_hundredths) << "%\n"
            << "keys searched:    " << keyspan::format_hundredths(stats.searched_hundredths) << "%\n"
            << "as of:            " << keyspan::util::format_unix_utc(stats.as_of_unix)
            << (stats.stale ? " (stale)" : "") << '\n';
  for (const auto& contribution : stats.participants) {
    std::cout << "  #" << contribution.rank << " " << contribution.client_id << "  ranges="
              << contribution.ranges_completed << "  keys=" << contribution.keys_searched.to_decimal() << '\n';
  }
  if (stats.your_contribution.has_value()) {
    std::cout << "your rank: #" << stats.your_contribution->rank << '\n';
  }
  return kExitOk;
}

}  // namespace

namespace keyspan::app {

int run_cli(std::vector<std::string> args) {
  std::string data_dir;
  if (const char* env = std::getenv(std::string{keyspan::kDataDirEnv}.c_str()); env != nullptr && *env != '\0') {
    data_dir = env;
  } else {
    data_dir = std::string{keyspan::kDefaultDataDir};
  }

  while (!args.empty() && args.front().starts_with("--")) {
    if (args.front() == "--help") {
      print_usage(std::cout);
      return kExitOk;
    }
    if (args.front() == "--version") {
      std::cout << keyspan::kAppDisplayName << " " << keyspan::kAppVersion << '\n';
      return kExitOk;
    }
    if (args.front() == "--data-dir") {
      if (args.size() < 2) {
        return usage_error("--data-dir requires a directory");
      }
      data_dir = args[1];
      args.erase(args.begin(), args.begin() + 2);
      continue;
    }
    return usage_error("unknown option " + args.front());
  }

  if (args.empty()) {
    return usage_error("missing command");
  }
  const std::string command = args.front();
  args.erase(args.begin());

  static const std::vector<std::string_view> kCommands = {"plan",    "status", "update",   "split",   "init",
                                                         "request", "report", "complete", "abandon", "stats"};
  if (std::ranges::find(kCommands, command) == kCommands.end()) {
    return usage_error("unknown command " + command);
  }

  keyspan::CoreApi api;
  const keyspan::Result init = api.init({.data_dir = data_dir});
  if (!init.ok) {
    std::cerr << "keyspan init failed: " << init.message << '\n';
    return kExitRejected;
  }

  if (command == "plan") {
    return cmd_plan(api, args);
  }
  if (command == "status") {
    return cmd_status(api);
  }
  if (command == "update") {
    return cmd_update(api, args);
  }
  if (command == "split") {
    return cmd_split(api, args);
  }
  if (command == "init") {
    return cmd_init(api, args);
  }
  if (command == "request") {
    return cmd_request(api);
  }
  if (command == "report") {
    return cmd_report(api, args);
  }
  if (command == "complete") {
    return cmd_complete(api, args);
  }
  if (command == "abandon") {
    return cmd_abandon(api, args);
  }
  return cmd_stats(api);
}

}  // namespace keyspan::app
