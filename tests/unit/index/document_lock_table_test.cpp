#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "askdoc_core/index/document_lock_table.hpp"

namespace askdoc_core {

class DocumentLockTableTest : public ::testing::Test {
 protected:
  DocumentLockTable table_;
};

TEST_F(DocumentLockTableTest, Slot_IsDroppedWhenGuardReleases) {
  {
    auto guard = table_.lock(1);
    EXPECT_EQ(table_.active_slots(), 1u);
  }
  EXPECT_EQ(table_.active_slots(), 0u);
}

TEST_F(DocumentLockTableTest, DifferentDocuments_DoNotBlockEachOther) {
  auto first = table_.lock(1);
  std::atomic<bool> acquired{false};

  std::thread other([this, &acquired]() {
    auto second = table_.lock(2);
    acquired = true;
  });
  other.join();

  EXPECT_TRUE(acquired);
}

TEST_F(DocumentLockTableTest, SameDocument_IsSerialized) {
  std::atomic<int> inside{0};
  std::atomic<int> max_inside{0};
  std::vector<std::thread> threads;

  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([this, &inside, &max_inside]() {
      for (int j = 0; j < 50; ++j) {
        auto guard = table_.lock(5);
        int now = ++inside;
        int seen = max_inside.load();
        while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::yield();
        --inside;
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  EXPECT_EQ(max_inside.load(), 1);
  EXPECT_EQ(table_.active_slots(), 0u);
}

TEST_F(DocumentLockTableTest, MovedGuard_ReleasesOnce) {
  {
    auto guard = table_.lock(3);
    DocumentLockTable::Guard moved(std::move(guard));
    EXPECT_EQ(table_.active_slots(), 1u);
  }
  EXPECT_EQ(table_.active_slots(), 0u);

  // Lock is free again
  auto again = table_.lock(3);
  EXPECT_EQ(table_.active_slots(), 1u);
}

}  // namespace askdoc_core
