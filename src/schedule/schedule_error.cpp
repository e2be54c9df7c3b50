/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "schedule/schedule_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(kairos, ScheduleError, e) {
  using E = kairos::ScheduleError;
  switch (e) {
    case E::InvalidTimeOfDay:
      return "Time of day is out of range";
    case E::InvalidWeekday:
      return "Weekday must be in range 0 (Sunday) to 6 (Saturday)";
  }
  return "Unknown ScheduleError";
}
