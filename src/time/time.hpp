/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string_view>

#include <boost/date_time/local_time/local_time.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace kairos {

  /**
   * An instant bound to a time zone. The not-a-date-time special value
   * stands for "no time at all" and is used for entries that were never
   * scheduled.
   */
  using Time = boost::local_time::local_date_time;

  using TimeZone = boost::local_time::time_zone_ptr;

  enum class TimeError : uint8_t {
    InvalidTimeZone = 1,
  };

  /// Coordinated Universal Time, no daylight saving
  TimeZone utcZone();

  /**
   * Zone of the current process with its DST rules. They are taken from
   * the TZ variable, either a rule like "CET-1CEST,M3.5.0,M10.5.0/3" or a
   * zoneinfo file, or from /etc/localtime when TZ is unset. If no rule can
   * be read, the UTC offset and abbreviation in effect at the moment of the
   * call are used.
   */
  TimeZone localZone();

  /**
   * Parses POSIX-like zone description, e.g. "EST-05EDT,M3.2.0,M11.1.0".
   * Offset sign follows Boost.DateTime: "-05" is five hours behind UTC.
   */
  outcome::result<TimeZone> parseTimeZone(std::string_view spec);

  /// Current instant with microsecond resolution, viewed in `zone`
  Time now(const TimeZone &zone);

  Time absentTime(const TimeZone &zone = {});

  /**
   * Instant at which the wall clock of `zone` reads `time_of_day` on `day`.
   * A wall-clock time repeated when DST ends resolves to its first
   * occurrence; one skipped when DST starts gives absent time.
   */
  Time atLocalTime(boost::gregorian::date day,
                   boost::posix_time::time_duration time_of_day,
                   const TimeZone &zone);

  inline bool isAbsent(const Time &time) {
    return time.is_special();
  }

  /**
   * Time left from `from` until `to`.
   * @return zero if `to` is not after `from`
   */
  std::chrono::microseconds toDuration(const Time &from, const Time &to);

  boost::posix_time::time_duration toTimeDuration(
      std::chrono::microseconds duration);

}  // namespace kairos

OUTCOME_HPP_DECLARE_ERROR(kairos, TimeError);
