/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "time/time.hpp"

#include <cctype>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>

#include <boost/make_shared.hpp>
#include <fmt/format.h>

OUTCOME_CPP_DEFINE_CATEGORY(kairos, TimeError, e) {
  using E = kairos::TimeError;
  switch (e) {
    case E::InvalidTimeZone:
      return "Invalid time zone description";
  }
  return "Unknown TimeError";
}

namespace kairos {

  namespace {
    namespace lt = boost::local_time;
    namespace pt = boost::posix_time;

    TimeZone fixedZone(const std::string &name,
                       const std::string &abbrev,
                       pt::time_duration utc_offset) {
      lt::time_zone_names names(name, abbrev, "", "");
      lt::dst_adjustment_offsets no_dst(
          pt::hours(0), pt::hours(0), pt::hours(0));
      return boost::make_shared<lt::custom_time_zone>(
          names, utc_offset, no_dst, boost::shared_ptr<lt::dst_calc_rule>());
    }

    // Boost throws on most malformed input, but silently accepts some
    // strings without any offset, so the leading part is checked here.
    bool looksLikePosixZone(std::string_view spec) {
      size_t pos = 0;
      while (pos < spec.size()
             and std::isalpha(static_cast<unsigned char>(spec[pos]))) {
        ++pos;
      }
      if (pos < 3 or pos >= spec.size()) {
        return false;
      }
      auto c = spec[pos];
      return c == '+' or c == '-'
          or std::isdigit(static_cast<unsigned char>(c));
    }

    // "[+-]hh[:mm[:ss]]" of a TZ rule, in seconds
    std::optional<int> parseRuleOffset(std::string_view rule, size_t &pos) {
      int sign = 1;
      if (pos < rule.size() and (rule[pos] == '+' or rule[pos] == '-')) {
        sign = rule[pos] == '-' ? -1 : 1;
        ++pos;
      }
      int seconds = 0;
      int unit = 3600;
      for (int part = 0; part < 3; ++part) {
        if (part != 0) {
          if (pos >= rule.size() or rule[pos] != ':') {
            break;
          }
          ++pos;
        }
        auto begin = pos;
        int value = 0;
        while (pos < rule.size() and pos - begin < 3
               and std::isdigit(static_cast<unsigned char>(rule[pos]))) {
          value = value * 10 + (rule[pos] - '0');
          ++pos;
        }
        if (pos == begin) {
          return std::nullopt;
        }
        seconds += value * unit;
        unit /= 60;
      }
      return sign * seconds;
    }

    size_t skipAlpha(std::string_view rule, size_t pos) {
      while (pos < rule.size()
             and std::isalpha(static_cast<unsigned char>(rule[pos]))) {
        ++pos;
      }
      return pos;
    }

    std::string boostOffset(int seconds) {
      auto sign = seconds < 0 ? "-" : "";
      seconds = std::abs(seconds);
      return fmt::format("{}{:02}:{:02}:{:02}",
                         sign,
                         seconds / 3600,
                         seconds / 60 % 60,
                         seconds % 60);
    }

    /**
     * Rewrites TZ rule as libc reads it ("EST5EDT,M3.2.0,M11.1.0") into
     * Boost notation ("EST-05:00:00EDT01:00:00,M3.2.0,M11.1.0"). In TZ
     * rules offsets are west of Greenwich and the DST offset is absolute,
     * while Boost counts east and takes the DST shift.
     * Quoted names like "<+03>" are not supported.
     */
    std::optional<std::string> tzRuleToBoost(std::string_view rule) {
      auto std_end = skipAlpha(rule, 0);
      if (std_end < 3) {
        return std::nullopt;
      }
      size_t pos = std_end;
      auto std_offset = parseRuleOffset(rule, pos);
      if (not std_offset) {
        return std::nullopt;
      }
      auto converted = fmt::format(
          "{}{}", rule.substr(0, std_end), boostOffset(-*std_offset));
      if (pos == rule.size()) {
        return converted;
      }

      auto dst_begin = pos;
      pos = skipAlpha(rule, pos);
      if (pos - dst_begin < 3) {
        return std::nullopt;
      }
      auto dst_name = rule.substr(dst_begin, pos - dst_begin);
      int dst_offset = *std_offset - 3600;
      if (pos < rule.size() and rule[pos] != ',') {
        auto offset = parseRuleOffset(rule, pos);
        if (not offset) {
          return std::nullopt;
        }
        dst_offset = *offset;
      }
      // Transition rules are implementation defined when omitted
      if (pos == rule.size() or rule[pos] != ',') {
        return std::nullopt;
      }
      return fmt::format("{}{}{}{}",
                         converted,
                         dst_name,
                         boostOffset(*std_offset - dst_offset),
                         rule.substr(pos));
    }

    std::optional<TimeZone> zoneFromTzRule(std::string_view rule) {
      auto converted = tzRuleToBoost(rule);
      if (not converted) {
        return std::nullopt;
      }
      try {
        return TimeZone{boost::make_shared<lt::posix_time_zone>(*converted)};
      } catch (const std::exception &) {
        return std::nullopt;
      }
    }

    /// TZ rule stored in the footer of TZif version 2+ file
    std::optional<std::string> tzifFooter(const std::string &path) {
      std::ifstream file(path, std::ios::binary);
      if (not file) {
        return std::nullopt;
      }
      std::string data{std::istreambuf_iterator<char>(file),
                       std::istreambuf_iterator<char>()};
      if (data.size() < 6 or data.compare(0, 4, "TZif") != 0
          or data[4] == '\0' or data.back() != '\n') {
        return std::nullopt;
      }
      auto begin = data.rfind('\n', data.size() - 2);
      if (begin == std::string::npos) {
        return std::nullopt;
      }
      return data.substr(begin + 1, data.size() - begin - 2);
    }

    std::optional<TimeZone> systemZone() {
      const char *tz = std::getenv("TZ");
      if (tz == nullptr) {
        if (auto rule = tzifFooter("/etc/localtime")) {
          return zoneFromTzRule(*rule);
        }
        return std::nullopt;
      }

      std::string_view name(tz);
      if (name.empty()) {
        return utcZone();
      }
      if (name.front() == ':') {
        name.remove_prefix(1);
      } else if (auto zone = zoneFromTzRule(name)) {
        return zone;
      }
      if (name.empty()) {
        return std::nullopt;
      }

      std::string path(name);
      if (path.front() != '/') {
        const char *dir = std::getenv("TZDIR");
        path = fmt::format(
            "{}/{}", dir != nullptr ? dir : "/usr/share/zoneinfo", path);
      }
      if (auto rule = tzifFooter(path)) {
        return zoneFromTzRule(*rule);
      }
      return std::nullopt;
    }
  }  // namespace

  TimeZone utcZone() {
    static const TimeZone utc =
        fixedZone("Coordinated Universal Time", "UTC", pt::hours(0));
    return utc;
  }

  TimeZone localZone() {
    if (auto zone = systemZone()) {
      return *zone;
    }

    ::tzset();
    std::time_t now = std::time(nullptr);
    std::tm local{};
    if (localtime_r(&now, &local) == nullptr) {
      return utcZone();
    }
    std::string abbrev =
        local.tm_zone != nullptr ? std::string(local.tm_zone) : "LOC";
    return fixedZone("Local", abbrev, pt::seconds(local.tm_gmtoff));
  }

  outcome::result<TimeZone> parseTimeZone(std::string_view spec) {
    if (not looksLikePosixZone(spec)) {
      return TimeError::InvalidTimeZone;
    }
    try {
      return TimeZone{
          boost::make_shared<lt::posix_time_zone>(std::string(spec))};
    } catch (const std::exception &) {
      return TimeError::InvalidTimeZone;
    }
  }

  Time now(const TimeZone &zone) {
    return Time(pt::microsec_clock::universal_time(), zone);
  }

  Time absentTime(const TimeZone &zone) {
    return Time(boost::date_time::not_a_date_time, zone);
  }

  Time atLocalTime(boost::gregorian::date day,
                   pt::time_duration time_of_day,
                   const TimeZone &zone) {
    switch (Time::check_dst(day, time_of_day, zone)) {
      case lt::ambiguous:
        return Time(day, time_of_day, zone, true);
      case lt::invalid_time_label:
        return absentTime(zone);
      default:
        break;
    }
    return Time(day, time_of_day, zone, Time::NOT_DATE_TIME_ON_ERROR);
  }

  std::chrono::microseconds toDuration(const Time &from, const Time &to) {
    auto diff = to.utc_time() - from.utc_time();
    if (diff.is_special() or diff.is_negative()) {
      return std::chrono::microseconds::zero();
    }
    return std::chrono::microseconds(diff.total_microseconds());
  }

  pt::time_duration toTimeDuration(std::chrono::microseconds duration) {
    return pt::microseconds(duration.count());
  }

}  // namespace kairos
