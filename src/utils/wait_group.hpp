/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <future>
#include <mutex>
#include <vector>

#include <boost/assert.hpp>

namespace kairos::utils {

  /**
   * @brief Counter of outstanding work
   *
   * Each unit of work is registered with `add` before it starts and released
   * with `done` when it finishes. Futures obtained with `whenIdle` become
   * ready once the counter drops to zero.
   */
  class WaitGroup final {
   public:
    WaitGroup() = default;
    WaitGroup(const WaitGroup &) = delete;
    WaitGroup &operator=(const WaitGroup &) = delete;

    void add(size_t count = 1) {
      std::lock_guard lock(mutex_);
      counter_ += count;
    }

    /**
     * Releases one unit of work. Must be paired with a preceding `add`.
     */
    void done() {
      std::vector<std::promise<void>> waiters;
      {
        std::lock_guard lock(mutex_);
        BOOST_ASSERT_MSG(counter_ != 0, "done() without matching add()");
        if (counter_ == 0) {
          return;
        }
        if (--counter_ == 0) {
          waiters.swap(waiters_);
        }
      }
      for (auto &waiter : waiters) {
        waiter.set_value();
      }
    }

    /**
     * @return future that is ready when no work is outstanding; it is ready
     * immediately if the counter is zero already
     */
    std::shared_future<void> whenIdle() {
      std::promise<void> promise;
      auto future = promise.get_future().share();
      {
        std::lock_guard lock(mutex_);
        if (counter_ != 0) {
          waiters_.emplace_back(std::move(promise));
          return future;
        }
      }
      promise.set_value();
      return future;
    }

    size_t outstanding() const {
      std::lock_guard lock(mutex_);
      return counter_;
    }

   private:
    mutable std::mutex mutex_;
    size_t counter_ = 0;
    std::vector<std::promise<void>> waiters_;
  };

}  // namespace kairos::utils
