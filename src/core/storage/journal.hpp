#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace keyspan {

// Append-only operational log: one "unix<TAB>component<TAB>message" line per event.
class Journal {
public:
  void open(std::string path, std::function<std::int64_t()> clock);

  void record(std::string_view component, std::string_view message) const;
  [[nodiscard]] const std::string& path() const { return path_; }

private:
  std::string path_;
  std::function<std::int64_t()> clock_;
  mutable std::mutex mutex_;
};

}  // namespace keyspan
