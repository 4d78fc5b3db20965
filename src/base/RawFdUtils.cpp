#include "RawFdUtils.hpp"

namespace archtui {
void RawFdUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        // This is fine, just keep retrying
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      LOG(ERROR) << "Cannot write to fd " << fd << ": " << strerror(localErrno);
      throw std::runtime_error(string("Cannot write to fd: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to fd: descriptor closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

bool RawFdUtils::waitOnData(int fd, int timeoutMs) {
  fd_set rfd;
  timeval tv;
  FD_ZERO(&rfd);
  FD_SET(fd, &rfd);
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  int rc = select(fd + 1, &rfd, NULL, NULL, &tv);
  if (rc < 0) {
    if (GetErrno() == EINTR) {
      return false;
    }
    // EBADF here means the descriptor was torn down under us; report it as
    // readable so the caller's read() surfaces the error
    VLOG(1) << "select on fd " << fd << " failed: " << strerror(GetErrno());
    return true;
  }
  return FD_ISSET(fd, &rfd);
}

void RawFdUtils::closeIfOpen(int* fd) {
  if (*fd >= 0) {
    ::close(*fd);
    *fd = -1;
  }
}
}  // namespace archtui
