#ifndef __TETHER_BROADCASTER__
#define __TETHER_BROADCASTER__

#include "Headers.hpp"

namespace tether {
/**
 * @brief Fans committed snapshots out to subscribers.
 *
 * Callbacks run synchronously on the thread that broadcasts, in
 * subscription order.  A subscriber may unsubscribe itself (or others)
 * from inside its callback.
 */
class Broadcaster {
 public:
  typedef std::function<void(const string &snapshot, int64_t version)>
      Subscriber;

  Broadcaster() : nextId(1) {}

  int64_t subscribe(Subscriber subscriber);
  void unsubscribe(int64_t id);
  void broadcast(const string &snapshot, int64_t version);
  size_t size() const;

 protected:
  int64_t nextId;
  map<int64_t, shared_ptr<Subscriber>> subscribers;
  mutable mutex subscriberMutex;
};
}  // namespace tether

#endif  // __TETHER_BROADCASTER__
