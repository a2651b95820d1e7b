#ifndef __TSM_RAW_FD_UTILS__
#define __TSM_RAW_FD_UTILS__

#include "Headers.hpp"

namespace tsm {
/**
 * @brief Blocking and bounded wrappers around POSIX read/write on a raw fd.
 */
class RawFdUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on
   * EAGAIN and EINTR.  Throws std::runtime_error on any other failure.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Waits at most `timeout` for the descriptor to become readable.
   * @return true if a read will not block.  An interrupted wait returns false.
   */
  static bool waitOnFdData(int fd, std::chrono::microseconds timeout);

  /** @brief Marks the descriptor close-on-exec so spawned shells skip it. */
  static void setCloseOnExec(int fd);
};
}  // namespace tsm
#endif  // __TSM_RAW_FD_UTILS__
