// ----------------------------------------------------------------------
// File: GroupResolver.cc
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

#include "registry/GroupResolver.hh"
#include "common/Config.hh"
#include "common/Logging.hh"
#include "common/StringConversion.hh"
#include "namespace/MDException.hh"
#include <grp.h>
#include <pwd.h>
#include <unistd.h>

SCIDBREGISTRYNAMESPACE_BEGIN

//------------------------------------------------------------------------------
// Build a static table from a configuration chapter
//------------------------------------------------------------------------------
StaticGroupResolver
StaticGroupResolver::FromConfig(const common::Config& cfg, const char* chapter)
{
  StaticGroupResolver resolver;

  for (const auto& kv : cfg.AsMap(chapter)) {
    std::vector<std::string> users;
    common::StringConversion::Tokenize(kv.second, users, ",");

    for (const auto& user : users) {
      std::string name = common::StringConversion::Trim(user);

      if (!name.empty()) {
        resolver.addMember(kv.first, name);
      }
    }
  }

  scidb_static_info("msg=\"loaded static group table\" chapter=%s users=%lu",
                    chapter, resolver.mMembers.size());
  return resolver;
}

//------------------------------------------------------------------------------
// Add member
//------------------------------------------------------------------------------
void
StaticGroupResolver::addMember(const std::string& group,
                               const std::string& user)
{
  mMembers[user].insert(group);
}

//------------------------------------------------------------------------------
// Remove member
//------------------------------------------------------------------------------
void
StaticGroupResolver::removeMember(const std::string& group,
                                  const std::string& user)
{
  auto it = mMembers.find(user);

  if (it != mMembers.end()) {
    it->second.erase(group);

    if (it->second.empty()) {
      mMembers.erase(it);
    }
  }
}

//------------------------------------------------------------------------------
// Groups of a user from the static table
//------------------------------------------------------------------------------
std::set<std::string>
StaticGroupResolver::groupsOf(const std::string& user)
{
  auto it = mMembers.find(user);

  if (it == mMembers.end()) {
    return {};
  }

  return it->second;
}

//------------------------------------------------------------------------------
// Fetch gid list of a user
//------------------------------------------------------------------------------
std::vector<gid_t>
UnixGroupResolver::getGroups(const std::string& user, gid_t gid)
{
  std::vector<gid_t> groups(kDefaultMaxGroupSize);
  int ngroups = kDefaultMaxGroupSize;

  if (getgrouplist(user.c_str(), gid, groups.data(), &ngroups) == -1) {
    groups.resize(ngroups);

    if (getgrouplist(user.c_str(), gid, groups.data(), &ngroups) == -1) {
      scidb_static_err("msg=\"groups resized while fetching group info\" "
                       "user=%s ngroups=%d", user.c_str(), ngroups);
      return groups;
    }
  }

  groups.resize(ngroups);
  return groups;
}

//------------------------------------------------------------------------------
// Groups of a user from the system group database
//------------------------------------------------------------------------------
std::set<std::string>
UnixGroupResolver::groupsOf(const std::string& user)
{
  std::set<std::string> names;
  struct passwd pwbuf;
  struct passwd* pw = nullptr;
  long buflen = sysconf(_SC_GETPW_R_SIZE_MAX);
  std::vector<char> buffer((buflen > 0) ? buflen : 16384);
  int rc = getpwnam_r(user.c_str(), &pwbuf, buffer.data(), buffer.size(), &pw);

  if (pw == nullptr) {
    if (rc && (rc != ENOENT) && (rc != ESRCH)) {
      throw_nsexception(ns::StoreError, "failed to resolve user " << user
                        << " errno=" << rc);
    }

    scidb_static_debug("msg=\"unknown user\" user=%s", user.c_str());
    return names;
  }

  std::vector<char> grbuffer(16384);

  for (gid_t gid : getGroups(user, pw->pw_gid)) {
    struct group grbuf;
    struct group* gr = nullptr;

    if ((getgrgid_r(gid, &grbuf, grbuffer.data(), grbuffer.size(), &gr) == 0) &&
        gr) {
      names.insert(gr->gr_name);
    } else {
      names.insert(std::to_string(gid));
    }
  }

  return names;
}

SCIDBREGISTRYNAMESPACE_END
