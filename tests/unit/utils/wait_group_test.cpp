/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/wait_group.hpp"

#include <gtest/gtest.h>

#include <thread>

using kairos::utils::WaitGroup;

namespace {
  bool isReady(const std::shared_future<void> &future) {
    return future.wait_for(std::chrono::seconds(0))
        == std::future_status::ready;
  }
}  // namespace

TEST(WaitGroupTest, IdleFromStart) {
  WaitGroup group;
  EXPECT_TRUE(isReady(group.whenIdle()));
  EXPECT_EQ(group.outstanding(), 0);
}

/**
 * @given group with two units of work
 * @when they are released one by one
 * @then future becomes ready only after the last one
 */
TEST(WaitGroupTest, ReadyAfterLastDone) {
  WaitGroup group;
  group.add(2);
  auto idle = group.whenIdle();
  EXPECT_FALSE(isReady(idle));

  group.done();
  EXPECT_FALSE(isReady(idle));
  EXPECT_EQ(group.outstanding(), 1);

  group.done();
  EXPECT_TRUE(isReady(idle));
  EXPECT_EQ(group.outstanding(), 0);
}

#ifndef NDEBUG
TEST(WaitGroupDeathTest, UnpairedDoneAsserts) {
  WaitGroup group;
  EXPECT_DEATH(group.done(), "without matching add");
}
#else
TEST(WaitGroupTest, UnpairedDoneKeepsCounter) {
  WaitGroup group;
  group.done();
  EXPECT_EQ(group.outstanding(), 0);

  group.add();
  auto idle = group.whenIdle();
  EXPECT_FALSE(isReady(idle));
  group.done();
  EXPECT_TRUE(isReady(idle));
}
#endif

TEST(WaitGroupTest, ReleasedFromOtherThreads) {
  WaitGroup group;
  constexpr size_t kWorkers = 8;
  group.add(kWorkers);
  auto idle = group.whenIdle();

  std::vector<std::thread> workers;
  for (size_t i = 0; i < kWorkers; ++i) {
    workers.emplace_back([&] { group.done(); });
  }
  EXPECT_EQ(idle.wait_for(std::chrono::seconds(5)),
            std::future_status::ready);
  for (auto &worker : workers) {
    worker.join();
  }
}
