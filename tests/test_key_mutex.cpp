#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "store/key_mutex.hpp"

using namespace chatstore;

TEST(KeyMutexTest, SerializesSameKey) {
  KeyMutex locks;
  int counter = 0;
  std::atomic<int> inside{0};
  std::atomic<bool> overlapped{false};

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 200; ++i) {
        auto guard = locks.lock("conv");
        if (inside.fetch_add(1) != 0) overlapped = true;
        ++counter;
        inside.fetch_sub(1);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(counter, 8 * 200);
  EXPECT_FALSE(overlapped.load());
}

TEST(KeyMutexTest, DifferentKeysDoNotBlock) {
  KeyMutex locks;
  auto held = locks.lock("a");

  std::atomic<bool> acquired{false};
  std::thread other([&]() {
    auto guard = locks.lock("b");
    acquired = true;
  });
  other.join();

  EXPECT_TRUE(acquired.load());
}

TEST(KeyMutexTest, IdleEntriesAreDropped) {
  KeyMutex locks;
  {
    auto a = locks.lock("a");
    auto b = locks.lock("b");
    EXPECT_EQ(locks.active_keys(), 2);
  }
  EXPECT_EQ(locks.active_keys(), 0);
}
