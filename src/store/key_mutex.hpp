#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace chatstore {

// One mutex per key (conversation id). Every read-modify-write of a branch
// document holds the guard for its conversation, so full-document overwrites
// on the same key are strictly ordered while different keys never contend.
class KeyMutex {
 public:
  class Guard {
   public:
    Guard(KeyMutex &owner, std::string key);
    ~Guard();

    Guard(const Guard &) = delete;
    Guard &operator=(const Guard &) = delete;

   private:
    KeyMutex &owner_;
    std::string key_;
    std::shared_ptr<std::mutex> mutex_;
  };

  Guard lock(const std::string &key) {
    return Guard(*this, key);
  }

  // Entries currently held or waited on (for tests and diagnostics)
  size_t active_keys() const;

 private:
  struct Entry {
    std::shared_ptr<std::mutex> mutex = std::make_shared<std::mutex>();
    size_t users = 0;
  };

  std::shared_ptr<std::mutex> acquire(const std::string &key);
  void release(const std::string &key);

  mutable std::mutex mutex_;  // Guards entries_ only, never held during I/O
  std::map<std::string, Entry> entries_;
};

}  // namespace chatstore
