/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#ifndef KAIROS_VERSION
#define KAIROS_VERSION "unknown"
#endif

namespace kairos::app {

  inline const std::string &buildVersion() {
    static const std::string version{KAIROS_VERSION};
    return version;
  }

}  // namespace kairos::app
