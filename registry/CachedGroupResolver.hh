// ----------------------------------------------------------------------
// File: CachedGroupResolver.hh
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

#ifndef __SCIDBREGISTRY_CACHEDGROUPRESOLVER_HH__
#define __SCIDBREGISTRY_CACHEDGROUPRESOLVER_HH__

#include "registry/GroupResolver.hh"
#include "common/RWMutex.hh"
#include "common/SystemClock.hh"
#include <chrono>
#include <map>
#include <memory>
#include <set>
#include <string>

SCIDBREGISTRYNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Time bounded membership cache in front of another resolver.
//!
//! A cache miss queries the backend synchronously. A stale entry is refreshed
//! on the next query. If the backend fails during such a refresh the stale
//! membership keeps being served, a miss with a failing backend propagates
//! the error.
//------------------------------------------------------------------------------
class CachedGroupResolver: public IGroupResolver
{
public:
  struct CachedEntry {
    std::set<std::string> groups;
    std::chrono::system_clock::time_point timestamp;

    CachedEntry(const std::set<std::string>& grps,
                std::chrono::system_clock::time_point ts)
      : groups(grps), timestamp(ts) {}

    CachedEntry() = default;
  };

  //----------------------------------------------------------------------------
  //! Constructor
  //!
  //! @param backend resolver queried on cache misses
  //! @param lifetime cache entry lifetime
  //! @param clock fakeable clock, nullptr for system time
  //----------------------------------------------------------------------------
  CachedGroupResolver(std::unique_ptr<IGroupResolver> backend,
                      std::chrono::seconds lifetime = std::chrono::seconds(1800),
                      common::SystemClock* clock = nullptr);

  std::set<std::string> groupsOf(const std::string& user) override
  {
    return query(user).groups;
  }

  //----------------------------------------------------------------------------
  //! Major query method - uses cache
  //----------------------------------------------------------------------------
  CachedEntry query(const std::string& user);

  //----------------------------------------------------------------------------
  //! Synchronous backend query replacing any cached entry
  //----------------------------------------------------------------------------
  CachedEntry refresh(const std::string& user);

  //----------------------------------------------------------------------------
  //! Fetch cached value, return false if the user is not cached
  //----------------------------------------------------------------------------
  bool fetchCached(const std::string& user, CachedEntry& out);

  //----------------------------------------------------------------------------
  //! Display all cached information
  //----------------------------------------------------------------------------
  std::string DumpMembers();

  //----------------------------------------------------------------------------
  //! Drop all cached information
  //----------------------------------------------------------------------------
  void Reset();

private:
  std::unique_ptr<IGroupResolver> mBackend;
  const std::chrono::seconds kCacheDuration;
  common::SystemClock* mClock = nullptr;
  common::RWMutex mMutex;
  std::map<std::string, CachedEntry> mCache;

  void storeIntoCache(const std::string& user,
                      const std::set<std::string>& groups,
                      std::chrono::system_clock::time_point timestamp);

  bool isStale(const CachedEntry& entry) const;
};

SCIDBREGISTRYNAMESPACE_END

#endif
