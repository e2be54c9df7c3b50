/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/scheduler_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(kairos, SchedulerError, e) {
  using E = kairos::SchedulerError;
  switch (e) {
    case E::NullTimeZone:
      return "time zone cannot be null";
    case E::NullLogger:
      return "logger cannot be null";
    case E::NullSchedule:
      return "schedule cannot be null";
    case E::NullJob:
      return "job cannot be null";
  }
  return "Unknown SchedulerError";
}
