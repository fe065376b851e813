// ----------------------------------------------------------------------
// File: PermissionMatrix.cc
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

#include "registry/PermissionMatrix.hh"
#include "registry/GroupResolver.hh"
#include "common/Logging.hh"
#include "common/StringConversion.hh"
#include "namespace/MDException.hh"
#include <regex.h>

SCIDBREGISTRYNAMESPACE_BEGIN

const char* PermissionMatrix::sRegexRules =
  "^([ug]:[A-Za-z0-9._@-]+:(rw|wr|r|w))(,[ug]:[A-Za-z0-9._@-]+:(rw|wr|r|w))*$";

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
PermissionMatrix::PermissionMatrix(IGroupResolver* resolver):
  mResolver(resolver)
{
  mMutex.SetName("PermissionMatrix");
}

//------------------------------------------------------------------------------
// Register dataset
//------------------------------------------------------------------------------
void
PermissionMatrix::registerDataset(const std::string& id,
                                  const std::string& owner)
{
  common::RWMutexWriteLock wr_lock(mMutex);
  mAcls[id].owner = owner;
}

//------------------------------------------------------------------------------
// Forget dataset
//------------------------------------------------------------------------------
void
PermissionMatrix::forgetDataset(const std::string& id)
{
  common::RWMutexWriteLock wr_lock(mMutex);
  mAcls.erase(id);
}

//------------------------------------------------------------------------------
// Check if dataset is known
//------------------------------------------------------------------------------
bool
PermissionMatrix::hasDataset(const std::string& id) const
{
  common::RWMutexReadLock rd_lock(mMutex);
  return mAcls.count(id) != 0;
}

//------------------------------------------------------------------------------
// Get acl of a dataset, caller holds the mutex
//------------------------------------------------------------------------------
const PermissionMatrix::DatasetAcl&
PermissionMatrix::getAcl(const std::string& id) const
{
  auto it = mAcls.find(id);

  if (it == mAcls.end()) {
    throw_nsexception(ns::NotFoundError, "no permissions for dataset " << id);
  }

  return it->second;
}

PermissionMatrix::DatasetAcl&
PermissionMatrix::getAcl(const std::string& id)
{
  auto it = mAcls.find(id);

  if (it == mAcls.end()) {
    throw_nsexception(ns::NotFoundError, "no permissions for dataset " << id);
  }

  return it->second;
}

//------------------------------------------------------------------------------
// Grant
//------------------------------------------------------------------------------
bool
PermissionMatrix::grant(const std::string& id, const Principal& principal,
                        Operation op)
{
  common::RWMutexWriteLock wr_lock(mMutex);
  DatasetAcl& acl = getAcl(id);

  if (principal.isUser() && (principal.name == acl.owner)) {
    return false;
  }

  return acl.grants.insert(Grant{principal, op}).second;
}

//------------------------------------------------------------------------------
// Revoke
//------------------------------------------------------------------------------
bool
PermissionMatrix::revoke(const std::string& id, const Principal& principal,
                         Operation op)
{
  common::RWMutexWriteLock wr_lock(mMutex);
  DatasetAcl& acl = getAcl(id);
  return acl.grants.erase(Grant{principal, op}) != 0;
}

//------------------------------------------------------------------------------
// Check ownership
//------------------------------------------------------------------------------
bool
PermissionMatrix::isOwner(const std::string& id, const std::string& user) const
{
  common::RWMutexReadLock rd_lock(mMutex);
  return getAcl(id).owner == user;
}

//------------------------------------------------------------------------------
// Check permission
//------------------------------------------------------------------------------
bool
PermissionMatrix::check(const std::string& id, const Principal& principal,
                        Operation op) const
{
  std::set<std::string> granted_groups;
  {
    common::RWMutexReadLock rd_lock(mMutex);
    const DatasetAcl& acl = getAcl(id);

    if (principal.isUser() && (principal.name == acl.owner)) {
      return true;
    }

    if (acl.grants.count(Grant{principal, op})) {
      return true;
    }

    if (principal.isGroup()) {
      return false;
    }

    for (const auto& grant : acl.grants) {
      if (grant.principal.isGroup() && (grant.op == op)) {
        granted_groups.insert(grant.principal.name);
      }
    }
  }

  // Membership is resolved without holding the matrix lock
  if (granted_groups.empty() || (mResolver == nullptr)) {
    return false;
  }

  for (const auto& grp : mResolver->groupsOf(principal.name)) {
    if (granted_groups.count(grp)) {
      scidb_static_debug("msg=\"access through group\" id=%s user=%s group=%s "
                         "op=%s", id.c_str(), principal.name.c_str(),
                         grp.c_str(), OperationToString(op));
      return true;
    }
  }

  return false;
}

//------------------------------------------------------------------------------
// List permissions
//------------------------------------------------------------------------------
PermissionListing
PermissionMatrix::list(const std::string& id) const
{
  common::RWMutexReadLock rd_lock(mMutex);
  const DatasetAcl& acl = getAcl(id);
  PermissionListing listing;
  listing.owner = acl.owner;

  for (const auto& grant : acl.grants) {
    const std::string& name = grant.principal.name;

    if (grant.op == Operation::kRead) {
      (grant.principal.isUser() ? listing.read_users : listing.read_groups)
      .insert(name);
    } else {
      (grant.principal.isUser() ? listing.write_users : listing.write_groups)
      .insert(name);
    }
  }

  return listing;
}

//------------------------------------------------------------------------------
// Stored entries of a dataset
//------------------------------------------------------------------------------
std::vector<Grant>
PermissionMatrix::grantsOf(const std::string& id) const
{
  common::RWMutexReadLock rd_lock(mMutex);
  const DatasetAcl& acl = getAcl(id);
  return std::vector<Grant>(acl.grants.begin(), acl.grants.end());
}

//------------------------------------------------------------------------------
// Check rule string syntax
//------------------------------------------------------------------------------
bool
PermissionMatrix::IsValidRules(const std::string& rules, std::string& err)
{
  regex_t regex;
  int rc = regcomp(&regex, sRegexRules, REG_EXTENDED | REG_NOSUB);

  if (rc) {
    scidb_static_debug("regcomp regexErrorCode=%d regex '%s'", rc, sRegexRules);
    err = "failed to compile regex";
    regfree(&regex);
    return false;
  }

  rc = regexec(&regex, rules.c_str(), 0, NULL, 0);
  regfree(&regex);

  if (rc == 0) {
    return true;
  } else if (rc == REG_NOMATCH) {
    err = "invalid rule syntax";
  } else {
    err = "invalid regex or out of memory";
  }

  return false;
}

//------------------------------------------------------------------------------
// Parse rule string
//------------------------------------------------------------------------------
std::vector<Grant>
PermissionMatrix::ParseRules(const std::string& rules)
{
  std::string err;

  if (!IsValidRules(rules, err)) {
    throw_nsexception(ns::ValidationError, err << " rules=\"" << rules << "\"");
  }

  std::vector<Grant> grants;
  std::vector<std::string> tokens;
  common::StringConversion::Tokenize(rules, tokens, ",");

  for (const auto& token : tokens) {
    std::vector<std::string> fields;
    common::StringConversion::Tokenize(token, fields, ":");
    Principal principal = (fields[0] == "u") ? Principal::User(fields[1]) :
                          Principal::Group(fields[1]);

    if (fields[2].find('r') != std::string::npos) {
      grants.push_back(Grant{principal, Operation::kRead});
    }

    if (fields[2].find('w') != std::string::npos) {
      grants.push_back(Grant{principal, Operation::kWrite});
    }
  }

  return grants;
}

//------------------------------------------------------------------------------
// Serialize grants into a rule string
//------------------------------------------------------------------------------
std::string
PermissionMatrix::SerializeRules(const std::vector<Grant>& grants)
{
  std::map<Principal, std::string> flags;

  for (const auto& grant : grants) {
    std::string& f = flags[grant.principal];

    if ((grant.op == Operation::kRead) && (f.find('r') == std::string::npos)) {
      f.insert(0, "r");
    }

    if ((grant.op == Operation::kWrite) && (f.find('w') == std::string::npos)) {
      f += "w";
    }
  }

  std::string rules;

  for (const auto& it : flags) {
    if (!rules.empty()) {
      rules += ",";
    }

    rules += it.first.ToString();
    rules += ":";
    rules += it.second;
  }

  return rules;
}

SCIDBREGISTRYNAMESPACE_END
