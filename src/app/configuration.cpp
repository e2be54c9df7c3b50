/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace kairos::app {

  Configuration::Configuration()
      : version_("undefined"), time_zone_(localZone()) {}

  const std::string &Configuration::version() const {
    return version_;
  }

  const TimeZone &Configuration::timeZone() const {
    return time_zone_;
  }

  const std::vector<Configuration::JobConfig> &Configuration::jobs() const {
    return jobs_;
  }

}  // namespace kairos::app
