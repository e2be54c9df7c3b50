/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>

#include <qtils/outcome.hpp>

#include "scheduler/event_logger.hpp"
#include "time/time.hpp"

namespace kairos {

  struct SchedulerOptions {
    TimeZone time_zone = localZone();
    std::shared_ptr<EventLogger> logger =
        std::make_shared<DiscardEventLogger>();
  };

  /// Adjusts scheduler options; options are applied in the given order
  using Option = std::function<outcome::result<void>(SchedulerOptions &)>;

  /// Zone in which "now" is taken and handed to schedules
  Option withTimeZone(TimeZone zone);

  Option withLogger(std::shared_ptr<EventLogger> logger);

}  // namespace kairos
