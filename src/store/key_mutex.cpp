#include "store/key_mutex.hpp"

namespace chatstore {

KeyMutex::Guard::Guard(KeyMutex &owner, std::string key) : owner_(owner), key_(std::move(key)) {
  mutex_ = owner_.acquire(key_);
  mutex_->lock();
}

KeyMutex::Guard::~Guard() {
  mutex_->unlock();
  owner_.release(key_);
}

std::shared_ptr<std::mutex> KeyMutex::acquire(const std::string &key) {
  std::lock_guard lock(mutex_);
  auto &entry = entries_[key];
  ++entry.users;
  return entry.mutex;
}

void KeyMutex::release(const std::string &key) {
  std::lock_guard lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) return;

  // Drop idle entries so the map tracks only live conversations
  if (--it->second.users == 0) {
    entries_.erase(it);
  }
}

size_t KeyMutex::active_keys() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

}  // namespace chatstore
