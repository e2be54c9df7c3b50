/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace kairos {

  enum class ScheduleError : uint8_t {
    InvalidTimeOfDay = 1,  ///< hour or minute is out of range
    InvalidWeekday,        ///< weekday is not in [0, 6]
  };

}  // namespace kairos

OUTCOME_HPP_DECLARE_ERROR(kairos, ScheduleError);
