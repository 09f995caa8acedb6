#include "core/storage/directory_lock.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace keyspan {

DirectoryLock::~DirectoryLock() {
  release();
}

Result DirectoryLock::acquire(const std::string& lock_path, bool exclusive) {
  release();

  const int fd = ::open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
  if (fd < 0) {
    return Result::failure(ErrorCode::Io, "Cannot open lock file " + lock_path + ": " + std::strerror(errno));
  }

  int rc = 0;
  do {
    rc = ::flock(fd, (exclusive ? LOCK_EX : LOCK_SH) | LOCK_NB);
  } while (rc != 0 && errno == EINTR);

  if (rc != 0) {
    const int error = errno;
    ::close(fd);
    if (error == EWOULDBLOCK) {
      return Result::failure(ErrorCode::Unavailable, "Storage root is in use by another process (" + lock_path + ").");
    }
    return Result::failure(ErrorCode::Io, "Cannot lock " + lock_path + ": " + std::strerror(error));
  }

  fd_ = fd;
  return Result::success();
}

void DirectoryLock::release() {
  if (fd_ < 0) {
    return;
  }
  ::flock(fd_, LOCK_UN);
  ::close(fd_);
  fd_ = -1;
}

}  // namespace keyspan
