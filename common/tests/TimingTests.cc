// ----------------------------------------------------------------------
// File: TimingTests.cc
// ----------------------------------------------------------------------

/************************************************************************
 * scidb - scientific dataset registry                                  *
 * Copyright (C) 2011 CERN/Switzerland                                  *
 *                                                                      *
 * This program is free software: you can redistribute it and/or modify *
 * it under the terms of the GNU General Public License as published by *
 * the Free Software Foundation, either version 3 of the License, or    *
 * (at your option) any later version.                                  *
 *                                                                      *
 * This program is distributed in the hope that it will be useful,      *
 * but WITHOUT ANY WARRANTY; without even the implied warranty of       *
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the        *
 * GNU General Public License for more details.                         *
 *                                                                      *
 * You should have received a copy of the GNU General Public License    *
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.*
 ************************************************************************/

#include "gtest/gtest.h"
#include "common/Timing.hh"

using scidb::common::Timing;

TEST(Timing, ParseIso8601)
{
  int64_t micros = 0;
  ASSERT_TRUE(Timing::ParseTimestamp("2023-01-01T10:00:00+01:00", micros));
  ASSERT_EQ(1672563600LL * 1000000, micros);
  ASSERT_TRUE(Timing::ParseTimestamp("2023-01-01T10:00:00Z", micros));
  ASSERT_EQ(1672567200LL * 1000000, micros);
  ASSERT_TRUE(Timing::ParseTimestamp("2023-01-01T10:00:00.250000", micros));
  ASSERT_EQ(1672567200LL * 1000000 + 250000, micros);
}

TEST(Timing, ParseFallbackFormats)
{
  int64_t micros = 0;
  // explicit offset after a plus sign is dropped and treated as UTC
  ASSERT_TRUE(Timing::ParseTimestamp("2023-01-01T10:00:00++0100", micros));
  ASSERT_EQ(1672567200LL * 1000000, micros);
  ASSERT_TRUE(Timing::ParseTimestamp("2023-01-01 10:00:00 UTC", micros));
  ASSERT_EQ(1672567200LL * 1000000, micros);
}

TEST(Timing, ParseInvalid)
{
  int64_t micros = 42;
  ASSERT_FALSE(Timing::ParseTimestamp("", micros));
  ASSERT_FALSE(Timing::ParseTimestamp("yesterday", micros));
  ASSERT_FALSE(Timing::ParseTimestamp("2023-13-45T99:00:00", micros));
}

TEST(Timing, FormatIso8601)
{
  std::string out = Timing::Micros_to_ISO8601(1672567200LL * 1000000);
  ASSERT_EQ(0u, out.find("2023-01-01T10:00:00"));
  int64_t micros = 0;
  ASSERT_TRUE(Timing::ParseTimestamp(out, micros));
  ASSERT_EQ(1672567200LL * 1000000, micros);
}
