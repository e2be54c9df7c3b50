/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <memory>

#include "schedule/schedule.hpp"

namespace kairos {

  /**
   * Runs a job every `delay` after the moment it was last considered.
   * Delays shorter than one millisecond are raised to one millisecond.
   */
  class DelaySchedule final : public Schedule {
   public:
    static constexpr std::chrono::microseconds kMinDelay =
        std::chrono::milliseconds(1);

    explicit DelaySchedule(std::chrono::microseconds delay);

    Time next(const Time &time) const override;

    std::chrono::microseconds delay() const {
      return delay_;
    }

   private:
    std::chrono::microseconds delay_;
  };

  /// every(std::chrono::minutes(5)) runs a job each five minutes
  std::shared_ptr<DelaySchedule> every(std::chrono::microseconds delay);

}  // namespace kairos
