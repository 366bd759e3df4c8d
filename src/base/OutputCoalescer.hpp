#ifndef __TETHER_OUTPUT_COALESCER__
#define __TETHER_OUTPUT_COALESCER__

#include "Headers.hpp"

namespace tether {
/**
 * @brief Bounded buffer that batches terminal output into larger chunks.
 *
 * The pump thread appends whatever the pty hands it and asks the coalescer
 * when a chunk is worth posting.  When the buffer is full the pump stops
 * reading, so the kernel pty buffer fills up and throttles the child.
 */
class OutputCoalescer {
 public:
  /** @brief Flush as soon as this many bytes are waiting. */
  static constexpr size_t FLUSH_BYTES = 16 * 1024;  // 16KB
  /** @brief Flush pending bytes at least this often. */
  static constexpr int64_t FLUSH_INTERVAL_MS = 16;
  /** @brief Maximum bytes to buffer before applying backpressure. */
  static constexpr size_t MAX_BUFFER_SIZE = 256 * 1024;  // 256KB

  OutputCoalescer() : firstPendingMs(0) {}

  /**
   * @brief Returns true if the buffer has room for more data.
   * When false, the caller should stop reading from the pty.
   */
  bool canAcceptMore() const { return pending.size() < MAX_BUFFER_SIZE; }

  bool hasPendingData() const { return !pending.empty(); }

  size_t size() const { return pending.size(); }

  /**
   * @brief Appends data, remembering when the oldest pending byte arrived.
   */
  void append(const string &data, int64_t nowMs) {
    if (data.empty()) return;
    if (pending.empty()) {
      firstPendingMs = nowMs;
    }
    pending.append(data);
  }

  /**
   * @brief Returns true once a full chunk is ready or the oldest pending
   * byte has waited for a whole flush interval.
   */
  bool shouldFlush(int64_t nowMs) const {
    if (pending.empty()) return false;
    return pending.size() >= FLUSH_BYTES ||
           nowMs - firstPendingMs >= FLUSH_INTERVAL_MS;
  }

  /**
   * @brief Removes and returns at most one chunk of `FLUSH_BYTES`.
   */
  string take(int64_t nowMs) {
    string chunk;
    if (pending.size() <= FLUSH_BYTES) {
      chunk.swap(pending);
    } else {
      chunk = pending.substr(0, FLUSH_BYTES);
      pending.erase(0, FLUSH_BYTES);
      // The remainder has already waited, so it is due on the next check.
      firstPendingMs = nowMs - FLUSH_INTERVAL_MS;
    }
    return chunk;
  }

  void clear() {
    pending.clear();
    firstPendingMs = 0;
  }

 private:
  string pending;
  int64_t firstPendingMs;
};
}  // namespace tether

#endif  // __TETHER_OUTPUT_COALESCER__
