/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <fmt/core.h>

#include "time/time.hpp"

template <>
struct fmt::formatter<kairos::Time> : fmt::formatter<std::string_view> {
  auto format(const kairos::Time &time, format_context &ctx) const {
    if (kairos::isAbsent(time)) {
      return fmt::formatter<std::string_view>::format("never", ctx);
    }
    return fmt::formatter<std::string_view>::format(time.to_string(), ctx);
  }
};
