/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "schedule/daily_schedule.hpp"

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

using kairos::DailySchedule;
using kairos::Time;

namespace pt = boost::posix_time;
namespace gr = boost::gregorian;

namespace {
  Time utcAt(gr::date day, pt::time_duration time_of_day) {
    return Time(pt::ptime(day, time_of_day), kairos::utcZone());
  }

  pt::ptime wallClock(gr::date day, int hour, int minute) {
    return pt::ptime(day, pt::hours(hour) + pt::minutes(minute));
  }
}  // namespace

TEST(DailyScheduleTest, LaterToday) {
  DailySchedule schedule(10, 30);
  auto next = schedule.next(utcAt(gr::date(2024, 1, 15), pt::hours(10)));
  EXPECT_EQ(next.local_time(), wallClock(gr::date(2024, 1, 15), 10, 30));
}

TEST(DailyScheduleTest, AlreadyPassedToday) {
  DailySchedule schedule(9, 30);
  auto next = schedule.next(utcAt(gr::date(2024, 1, 15), pt::hours(10)));
  EXPECT_EQ(next.local_time(), wallClock(gr::date(2024, 1, 16), 9, 30));
}

/**
 * @given time exactly at scheduled wall-clock time
 * @when compute next run
 * @then next run is the next day
 */
TEST(DailyScheduleTest, StrictlyAfter) {
  DailySchedule schedule(10, 0);
  auto next = schedule.next(utcAt(gr::date(2024, 1, 15), pt::hours(10)));
  EXPECT_EQ(next.local_time(), wallClock(gr::date(2024, 1, 16), 10, 0));
}

TEST(DailyScheduleTest, CrossesYearBoundary) {
  DailySchedule schedule(0, 0);
  auto next = schedule.next(
      utcAt(gr::date(2024, 12, 31), pt::hours(23) + pt::minutes(59)));
  EXPECT_EQ(next.local_time(), wallClock(gr::date(2025, 1, 1), 0, 0));
}

/**
 * @given zone with DST and time right before the day when 02:30 is skipped
 * @when compute next 02:30
 * @then the skipped day is passed over
 */
TEST(DailyScheduleTest, SkipsNonexistentWallClock) {
  ASSERT_OUTCOME_SUCCESS(
      zone, kairos::parseTimeZone("EST-05EDT,M3.2.0/02:00,M11.1.0/02:00"));
  Time time(gr::date(2024, 3, 9), pt::hours(12), zone, Time::EXCEPTION_ON_ERROR);

  DailySchedule schedule(2, 30);
  auto next = schedule.next(time);
  EXPECT_EQ(next.local_time(), wallClock(gr::date(2024, 3, 11), 2, 30));
  EXPECT_EQ(next.zone(), zone);
}

TEST(DailyScheduleTest, UsesZoneOfGivenTime) {
  ASSERT_OUTCOME_SUCCESS(zone, kairos::parseTimeZone("CET+01"));
  // 08:30 UTC is 09:30 CET
  Time time(pt::ptime(gr::date(2024, 1, 15), pt::hours(8) + pt::minutes(30)),
            zone);

  DailySchedule schedule(9, 0);
  auto next = schedule.next(time);
  EXPECT_EQ(next.local_time(), wallClock(gr::date(2024, 1, 16), 9, 0));
  EXPECT_EQ(next.utc_time(), wallClock(gr::date(2024, 1, 16), 8, 0));
}

TEST(DailyScheduleTest, RejectsInvalidTimeOfDay) {
  EXPECT_THROW(DailySchedule(24, 0), std::runtime_error);
  EXPECT_THROW(DailySchedule(-1, 0), std::runtime_error);
  EXPECT_THROW(DailySchedule(0, 60), std::runtime_error);
  EXPECT_NO_THROW(DailySchedule(23, 59));
}
