// ----------------------------------------------------------------------
// File: GroupResolverTests.cc
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
#include "registry/CachedGroupResolver.hh"
#include "registry/GroupResolver.hh"
#include "common/Config.hh"
#include "namespace/MDException.hh"
#include <pwd.h>
#include <unistd.h>

using namespace scidb;

namespace
{
//------------------------------------------------------------------------------
//! Backend counting its queries, can be switched to fail
//------------------------------------------------------------------------------
class CountingResolver: public registry::IGroupResolver
{
public:
  CountingResolver(registry::StaticGroupResolver& table, int& calls,
                   bool& fail):
    mTable(table), mCalls(calls), mFail(fail) {}

  std::set<std::string> groupsOf(const std::string& user) override
  {
    ++mCalls;

    if (mFail) {
      throw_nsexception(ns::StoreError, "group backend unavailable");
    }

    return mTable.groupsOf(user);
  }

private:
  registry::StaticGroupResolver& mTable;
  int& mCalls;
  bool& mFail;
};
}

TEST(StaticGroupResolver, FromConfig)
{
  common::Config cfg;
  ASSERT_TRUE(cfg.Parse("[groups]\nphysics = carol, dave\nchemistry=dave\n"));
  registry::StaticGroupResolver resolver =
    registry::StaticGroupResolver::FromConfig(cfg);
  ASSERT_EQ(std::set<std::string> {"physics"}, resolver.groupsOf("carol"));
  ASSERT_EQ((std::set<std::string> {"chemistry", "physics"}),
            resolver.groupsOf("dave"));
  ASSERT_TRUE(resolver.groupsOf("erin").empty());
}

TEST(UnixGroupResolver, CurrentUser)
{
  registry::UnixGroupResolver resolver;
  struct passwd* pw = getpwuid(geteuid());
  ASSERT_NE(nullptr, pw);
  // every user is at least member of its primary group
  ASSERT_FALSE(resolver.groupsOf(pw->pw_name).empty());
  ASSERT_TRUE(resolver.groupsOf("no-such-user-scidb-test").empty());
}

TEST(CachedGroupResolver, Lifetime)
{
  common::SystemClock clock(true);
  registry::StaticGroupResolver table;
  table.addMember("physics", "carol");
  int calls = 0;
  bool fail = false;
  registry::CachedGroupResolver cache(std::unique_ptr<registry::IGroupResolver>
                                      (new CountingResolver(table, calls, fail)),
                                      std::chrono::seconds(60), &clock);
  ASSERT_EQ(std::set<std::string> {"physics"}, cache.groupsOf("carol"));
  ASSERT_EQ(1, calls);
  table.addMember("chemistry", "carol");
  clock.advance(std::chrono::seconds(30));
  // cached answer within the lifetime
  ASSERT_EQ(std::set<std::string> {"physics"}, cache.groupsOf("carol"));
  ASSERT_EQ(1, calls);
  clock.advance(std::chrono::seconds(31));
  ASSERT_EQ((std::set<std::string> {"chemistry", "physics"}),
            cache.groupsOf("carol"));
  ASSERT_EQ(2, calls);
  registry::CachedGroupResolver::CachedEntry entry;
  ASSERT_TRUE(cache.fetchCached("carol", entry));
  ASSERT_EQ(clock.GetTime(), entry.timestamp);
  ASSERT_NE(std::string::npos, cache.DumpMembers().find("user=carol "
            "groups=chemistry,physics"));
  cache.Reset();
  ASSERT_FALSE(cache.fetchCached("carol", entry));
}

TEST(CachedGroupResolver, BackendFailure)
{
  common::SystemClock clock(true);
  registry::StaticGroupResolver table;
  table.addMember("physics", "carol");
  int calls = 0;
  bool fail = false;
  registry::CachedGroupResolver cache(std::unique_ptr<registry::IGroupResolver>
                                      (new CountingResolver(table, calls, fail)),
                                      std::chrono::seconds(60), &clock);
  ASSERT_EQ(std::set<std::string> {"physics"}, cache.groupsOf("carol"));
  fail = true;
  clock.advance(std::chrono::seconds(120));
  // a stale entry is served while the backend is down
  ASSERT_EQ(std::set<std::string> {"physics"}, cache.groupsOf("carol"));
  ASSERT_EQ(2, calls);
  // nothing to fall back to for an unknown user
  ASSERT_THROW(cache.groupsOf("dave"), ns::StoreError);
  ASSERT_THROW(cache.refresh("carol"), ns::StoreError);
}
