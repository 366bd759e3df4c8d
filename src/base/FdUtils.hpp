#ifndef __TETHER_FD_UTILS__
#define __TETHER_FD_UTILS__

#include "Headers.hpp"

namespace tether {
/**
 * @brief Blocking helpers around POSIX descriptor read/write loops.
 */
class FdUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on
   * EAGAIN and EINTR.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Waits up to `timeoutMs` for the descriptor to become readable.
   * @return true if a read will not block.
   */
  static bool waitForData(int fd, int64_t timeoutMs);

  /**
   * @brief Waits up to `timeoutMs` for the descriptor to accept a write.
   * @return true if a write will not block.
   */
  static bool waitForWritable(int fd, int64_t timeoutMs);

  /** @brief Switches a descriptor to non-blocking mode. */
  static void setNonBlocking(int fd);

  /** @brief Closes a descriptor if it is open and marks it closed. */
  static void closeIfOpen(int* fd);
};
}  // namespace tether
#endif  // __TETHER_FD_UTILS__
