#include "Broadcaster.hpp"

namespace tether {
int64_t Broadcaster::subscribe(Subscriber subscriber) {
  lock_guard<mutex> guard(subscriberMutex);
  int64_t id = nextId++;
  subscribers[id] = make_shared<Subscriber>(std::move(subscriber));
  return id;
}

void Broadcaster::unsubscribe(int64_t id) {
  lock_guard<mutex> guard(subscriberMutex);
  subscribers.erase(id);
}

void Broadcaster::broadcast(const string &snapshot, int64_t version) {
  vector<pair<int64_t, shared_ptr<Subscriber>>> current;
  {
    lock_guard<mutex> guard(subscriberMutex);
    current.assign(subscribers.begin(), subscribers.end());
  }
  for (auto &it : current) {
    {
      // Skip anyone who unsubscribed during this round.
      lock_guard<mutex> guard(subscriberMutex);
      if (subscribers.find(it.first) == subscribers.end()) {
        continue;
      }
    }
    try {
      (*it.second)(snapshot, version);
    } catch (const std::exception &ex) {
      STERROR << "Subscriber " << it.first << " threw: " << ex.what();
    }
  }
}

size_t Broadcaster::size() const {
  lock_guard<mutex> guard(subscriberMutex);
  return subscribers.size();
}
}  // namespace tether
