/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/entry.hpp"

#include <algorithm>

namespace kairos {

  bool firesBefore(const Entry &lhs, const Entry &rhs) {
    if (isAbsent(lhs.next)) {
      return false;
    }
    if (isAbsent(rhs.next)) {
      return true;
    }
    return lhs.next < rhs.next;
  }

  void sortByNextTime(std::vector<Entry> &entries) {
    std::sort(entries.begin(), entries.end(), firesBefore);
  }

}  // namespace kairos
