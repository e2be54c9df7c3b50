/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace kairos {

  enum class SchedulerError : uint8_t {
    NullTimeZone = 1,
    NullLogger,
    NullSchedule,
    NullJob,
  };

}  // namespace kairos

OUTCOME_HPP_DECLARE_ERROR(kairos, SchedulerError);
