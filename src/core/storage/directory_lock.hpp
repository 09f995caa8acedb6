#pragma once

#include <string>

#include "core/model/types.hpp"

namespace keyspan {

// Advisory flock() on the storage root's lock file. Serialises read-modify-write
// cycles between processes sharing one storage root; released on destruction.
// Never blocks: a lock held elsewhere fails with Unavailable.
class DirectoryLock {
public:
  DirectoryLock() = default;
  ~DirectoryLock();

  DirectoryLock(const DirectoryLock&) = delete;
  DirectoryLock& operator=(const DirectoryLock&) = delete;

  Result acquire(const std::string& lock_path, bool exclusive);
  void release();
  [[nodiscard]] bool held() const { return fd_ >= 0; }

private:
  int fd_ = -1;
};

}  // namespace keyspan
