#include "RawFdUtils.hpp"

namespace tsm {
void RawFdUtils::writeAll(int fd, const char* buf, size_t count) {
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
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        // This is fine, just keep retrying
        std::this_thread::sleep_for(std::chrono::microseconds(100 * 1000));
        continue;
      }
      LOG(ERROR) << "Cannot write to fd " << fd << ": "
                 << strerror(localErrno);
      throw std::runtime_error(string("Cannot write to fd: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to fd: fd closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

bool RawFdUtils::waitOnFdData(int fd, std::chrono::microseconds timeout) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for waitOnFdData");
  }
  if (timeout.count() < 0) {
    timeout = std::chrono::microseconds(0);
  }
  pollfd pfd;
  pfd.fd = fd;
  pfd.events = POLLIN;
  pfd.revents = 0;
  int64_t roundedMs =
      timeout.count() / 1000 + (timeout.count() % 1000 != 0 ? 1 : 0);
  int timeoutMs = int(
      std::min<int64_t>(roundedMs, std::numeric_limits<int>::max()));
  VLOG(4) << "Before polling fd " << fd;
  int rc = ::poll(&pfd, 1, timeoutMs);
  if (rc < 0) {
    auto localErrno = GetErrno();
    if (localErrno == EINTR) {
      return false;
    }
    STERROR << "poll failed on fd " << fd << ": " << strerror(localErrno);
    throw std::runtime_error(string("Cannot wait on fd: ") +
                             strerror(localErrno));
  }
  if (pfd.revents & POLLNVAL) {
    throw std::runtime_error("Cannot wait on fd: " + std::to_string(fd) +
                             " is not open");
  }
  // POLLHUP and POLLERR are readable too: the read reports EOF or the error.
  return rc > 0;
}

void RawFdUtils::setCloseOnExec(int fd) {
  int flags = fcntl(fd, F_GETFD);
  if (flags == -1 || fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == -1) {
    throw std::runtime_error(string("Cannot set close-on-exec: ") +
                             strerror(GetErrno()));
  }
}
}  // namespace tsm
