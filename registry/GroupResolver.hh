// ----------------------------------------------------------------------
// File: GroupResolver.hh
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

#ifndef __SCIDBREGISTRY_GROUPRESOLVER_HH__
#define __SCIDBREGISTRY_GROUPRESOLVER_HH__

#include "registry/Namespace.hh"
#include <sys/types.h>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace scidb
{
namespace common
{
class Config;
}
}

SCIDBREGISTRYNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Group membership resolver interface. Implementations throw ns::StoreError
//! if the membership backend can not be queried.
//------------------------------------------------------------------------------
class IGroupResolver
{
public:
  virtual ~IGroupResolver() = default;

  //----------------------------------------------------------------------------
  //! Return the set of groups a user belongs to, empty for unknown users
  //----------------------------------------------------------------------------
  virtual std::set<std::string> groupsOf(const std::string& user) = 0;
};

//------------------------------------------------------------------------------
//! Resolver serving a fixed group table, e.g. taken from the [groups]
//! configuration chapter with lines <group>=<user>,<user>
//------------------------------------------------------------------------------
class StaticGroupResolver: public IGroupResolver
{
public:
  StaticGroupResolver() = default;

  //----------------------------------------------------------------------------
  //! Build the table from a configuration chapter
  //!
  //! @param cfg parsed configuration
  //! @param chapter chapter holding the group definitions
  //----------------------------------------------------------------------------
  static StaticGroupResolver FromConfig(const common::Config& cfg,
                                        const char* chapter = "groups");

  //----------------------------------------------------------------------------
  //! Add a member to a group
  //----------------------------------------------------------------------------
  void addMember(const std::string& group, const std::string& user);

  //----------------------------------------------------------------------------
  //! Remove a member from a group
  //----------------------------------------------------------------------------
  void removeMember(const std::string& group, const std::string& user);

  std::set<std::string> groupsOf(const std::string& user) override;

private:
  std::map<std::string, std::set<std::string>> mMembers; ///< user -> groups
};

//------------------------------------------------------------------------------
//! Resolver using the system group database via getgrouplist
//------------------------------------------------------------------------------
class UnixGroupResolver: public IGroupResolver
{
public:
  static constexpr int kDefaultMaxGroupSize = 64;

  std::set<std::string> groupsOf(const std::string& user) override;

private:
  //----------------------------------------------------------------------------
  //! Fetch the gid list of a user with primary gid
  //----------------------------------------------------------------------------
  std::vector<gid_t> getGroups(const std::string& user, gid_t gid);
};

SCIDBREGISTRYNAMESPACE_END

#endif
