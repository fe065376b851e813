// ----------------------------------------------------------------------
// File: CachedGroupResolver.cc
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

#include "registry/CachedGroupResolver.hh"
#include "common/Logging.hh"
#include "common/Timing.hh"
#include "namespace/MDException.hh"
#include <sstream>

SCIDBREGISTRYNAMESPACE_BEGIN

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
CachedGroupResolver::CachedGroupResolver(std::unique_ptr<IGroupResolver>
    backend, std::chrono::seconds lifetime, common::SystemClock* clock):
  mBackend(std::move(backend)), kCacheDuration(lifetime), mClock(clock)
{
  mMutex.SetName("CachedGroupResolver");
}

//------------------------------------------------------------------------------
// Store entry into the cache
//------------------------------------------------------------------------------
void
CachedGroupResolver::storeIntoCache(const std::string& user,
                                    const std::set<std::string>& groups,
                                    std::chrono::system_clock::time_point timestamp)
{
  common::RWMutexWriteLock wr_lock(mMutex);
  mCache[user] = CachedEntry(groups, timestamp);
}

//------------------------------------------------------------------------------
// Fetch cached value
//------------------------------------------------------------------------------
bool
CachedGroupResolver::fetchCached(const std::string& user, CachedEntry& out)
{
  common::RWMutexReadLock rd_lock(mMutex);
  auto it = mCache.find(user);

  if (it == mCache.end()) {
    return false;
  }

  out = it->second;
  return true;
}

//------------------------------------------------------------------------------
// Check if cache entry is stale
//------------------------------------------------------------------------------
bool
CachedGroupResolver::isStale(const CachedEntry& entry) const
{
  return (entry.timestamp + kCacheDuration < common::SystemClock::now(mClock));
}

//------------------------------------------------------------------------------
// Major query method - uses cache
//------------------------------------------------------------------------------
CachedGroupResolver::CachedEntry
CachedGroupResolver::query(const std::string& user)
{
  CachedEntry entry;

  if (fetchCached(user, entry)) {
    if (!isStale(entry)) {
      return entry;
    }

    try {
      return refresh(user);
    } catch (const ns::StoreError& e) {
      scidb_static_warning("msg=\"serving stale group membership\" user=%s "
                           "err=\"%s\"", user.c_str(), e.what());
      return entry;
    }
  }

  return refresh(user);
}

//------------------------------------------------------------------------------
// Synchronous backend query
//------------------------------------------------------------------------------
CachedGroupResolver::CachedEntry
CachedGroupResolver::refresh(const std::string& user)
{
  std::set<std::string> groups = mBackend->groupsOf(user);
  std::chrono::system_clock::time_point now = common::SystemClock::now(mClock);
  scidb_static_debug("msg=\"group membership refreshed\" user=%s ngroups=%lu "
                     "expiration=%lld", user.c_str(), groups.size(),
                     (long long) std::chrono::duration_cast<std::chrono::seconds>
                     ((now + kCacheDuration).time_since_epoch()).count());
  storeIntoCache(user, groups, now);
  return CachedEntry(groups, now);
}

//------------------------------------------------------------------------------
// Display all cached information
//------------------------------------------------------------------------------
std::string
CachedGroupResolver::DumpMembers()
{
  common::RWMutexReadLock rd_lock(mMutex);
  std::ostringstream out;

  for (const auto& it : mCache) {
    out << "user=" << it.first << " groups=";
    bool first = true;

    for (const auto& grp : it.second.groups) {
      out << (first ? "" : ",") << grp;
      first = false;
    }

    out << " lifetime=" << std::chrono::duration_cast<std::chrono::seconds>
        (it.second.timestamp + kCacheDuration - common::SystemClock::now(mClock)).count()
        << " fetched=" << common::Timing::Micros_to_ISO8601(
          common::SystemClock::MicrosSinceEpoch(it.second.timestamp))
        << std::endl;
  }

  return out.str();
}

//------------------------------------------------------------------------------
// Reset all stored information
//------------------------------------------------------------------------------
void
CachedGroupResolver::Reset()
{
  common::RWMutexWriteLock wr_lock(mMutex);
  mCache.clear();
}

SCIDBREGISTRYNAMESPACE_END
