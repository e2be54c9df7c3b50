/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/entry.hpp"

#include <gtest/gtest.h>

using kairos::Entry;
using kairos::Time;

namespace pt = boost::posix_time;
namespace gr = boost::gregorian;

namespace {
  Entry entryAt(kairos::EntryId id, Time next) {
    Entry entry;
    entry.id = id;
    entry.next = next;
    return entry;
  }
}  // namespace

/**
 * @given entries with concrete and absent next times in arbitrary order
 * @when sort them
 * @then concrete ones go first by time, absent ones go last
 */
TEST(EntryTest, SortByNextTime) {
  Time base(pt::ptime(gr::date(2024, 1, 15), pt::hours(10)), kairos::utcZone());

  std::vector<Entry> entries{
      entryAt(1, kairos::absentTime()),
      entryAt(2, base + pt::seconds(2)),
      entryAt(3, base + pt::seconds(1)),
      entryAt(4, kairos::absentTime()),
      entryAt(5, base),
  };
  kairos::sortByNextTime(entries);

  ASSERT_EQ(entries.size(), 5);
  EXPECT_EQ(entries[0].id, 5);
  EXPECT_EQ(entries[1].id, 3);
  EXPECT_EQ(entries[2].id, 2);
  EXPECT_TRUE(kairos::isAbsent(entries[3].next));
  EXPECT_TRUE(kairos::isAbsent(entries[4].next));
}

TEST(EntryTest, AbsentNeverFiresBefore) {
  Time base(pt::ptime(gr::date(2024, 1, 15), pt::hours(10)), kairos::utcZone());
  auto concrete = entryAt(1, base);
  auto absent = entryAt(2, kairos::absentTime());

  EXPECT_TRUE(kairos::firesBefore(concrete, absent));
  EXPECT_FALSE(kairos::firesBefore(absent, concrete));
  EXPECT_FALSE(kairos::firesBefore(absent, absent));
  EXPECT_FALSE(kairos::firesBefore(concrete, concrete));
}

TEST(EntryTest, NewEntryIsUnscheduled) {
  Entry entry;
  EXPECT_TRUE(kairos::isAbsent(entry.next));
  EXPECT_TRUE(kairos::isAbsent(entry.prev));
}
