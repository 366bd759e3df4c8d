#include "FdUtils.hpp"

namespace tether {
void FdUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    int rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        // This is fine, just keep retrying
        waitForWritable(fd, 1);
        continue;
      }
      STERROR << "Cannot write to fd: " << strerror(localErrno);
      throw std::runtime_error("Cannot write to fd");
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to fd: closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

namespace {
bool waitFor(int fd, int64_t timeoutMs, bool forWrite) {
  fd_set fds;
  timeval tv;
  FD_ZERO(&fds);
  FD_SET(fd, &fds);
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  int rc = forWrite ? select(fd + 1, NULL, &fds, NULL, &tv)
                    : select(fd + 1, &fds, NULL, NULL, &tv);
  if (rc < 0) {
    if (GetErrno() == EINTR) {
      return false;
    }
    throw std::runtime_error(string("select failed: ") + strerror(GetErrno()));
  }
  return rc > 0 && FD_ISSET(fd, &fds);
}
}  // namespace

bool FdUtils::waitForData(int fd, int64_t timeoutMs) {
  return waitFor(fd, timeoutMs, false);
}

bool FdUtils::waitForWritable(int fd, int64_t timeoutMs) {
  return waitFor(fd, timeoutMs, true);
}

void FdUtils::setNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
    throw std::runtime_error(string("Cannot make fd non-blocking: ") +
                             strerror(GetErrno()));
  }
}

void FdUtils::closeIfOpen(int* fd) {
  if (*fd >= 0) {
    ::close(*fd);
    *fd = -1;
  }
}
}  // namespace tether
