/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "schedule/delay_schedule.hpp"

#include <algorithm>

namespace kairos {

  DelaySchedule::DelaySchedule(std::chrono::microseconds delay)
      : delay_(std::max(delay, kMinDelay)) {}

  Time DelaySchedule::next(const Time &time) const {
    return time + toTimeDuration(delay_);
  }

  std::shared_ptr<DelaySchedule> every(std::chrono::microseconds delay) {
    return std::make_shared<DelaySchedule>(delay);
  }

}  // namespace kairos
