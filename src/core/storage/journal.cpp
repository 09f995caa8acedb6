#include "core/storage/journal.hpp"

#include <fstream>
#include <utility>

#include "core/util/common.hpp"

namespace keyspan {

void Journal::open(std::string path, std::function<std::int64_t()> clock) {
  std::lock_guard lock(mutex_);
  path_ = std::move(path);
  clock_ = std::move(clock);
}

void Journal::record(std::string_view component, std::string_view message) const {
  std::lock_guard lock(mutex_);
  if (path_.empty()) {
    return;
  }
  std::ofstream out(path_, std::ios::out | std::ios::app);
  if (!out) {
    return;
  }
  const std::int64_t now = clock_ ? clock_() : util::unix_timestamp_now();
  out << now << "\t" << component << "\t" << message << "\n";
}

}  // namespace keyspan
