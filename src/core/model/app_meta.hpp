#pragma once

#include <cstddef>
#include <string_view>

#ifndef KEYSPAN_APP_VERSION
#define KEYSPAN_APP_VERSION "0.3.0"
#endif

#ifndef KEYSPAN_BUILD_RELEASE
#define KEYSPAN_BUILD_RELEASE "Pool Coordination Phase 1"
#endif

namespace keyspan {

inline constexpr std::string_view kAppDisplayName = "keyspan";
inline constexpr std::string_view kAppVersion = KEYSPAN_APP_VERSION;
inline constexpr std::string_view kBuildRelease = KEYSPAN_BUILD_RELEASE;

inline constexpr std::string_view kDefaultDataDir = "keyspan-data";
inline constexpr std::string_view kDataDirEnv = "KEYSPAN_DATA_DIR";

inline constexpr std::string_view kManifestFile = "range_manifest.json";
inline constexpr std::string_view kProgressFile = "search_progress.json";
inline constexpr std::string_view kStrategyFile = "adaptive_strategy.json";
inline constexpr std::string_view kPoolConfigFile = "pool_config.json";
inline constexpr std::string_view kPoolAssignmentFile = "pool_assignment.json";
inline constexpr std::string_view kPoolServerFile = "pool_server.json";
inline constexpr std::string_view kPoolProgressFile = "pool_progress.json";
inline constexpr std::string_view kPoolStatsFile = "pool_stats.json";
inline constexpr std::string_view kJournalFile = "keyspan.log";
inline constexpr std::string_view kLockFile = ".keyspan.lock";

inline constexpr std::size_t kPoolHistoryLimit = 100;

}  // namespace keyspan
