/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "schedule/schedule.hpp"

namespace kairos {

  class ScheduleMock : public Schedule {
   public:
    MOCK_METHOD(Time, next, (const Time &time), (const, override));
  };

}  // namespace kairos
