// ----------------------------------------------------------------------
// File: PermissionMatrix.hh
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

#ifndef __SCIDBREGISTRY_PERMISSIONMATRIX_HH__
#define __SCIDBREGISTRY_PERMISSIONMATRIX_HH__

#include "registry/Namespace.hh"
#include "registry/Principal.hh"
#include "common/RWMutex.hh"
#include <map>
#include <set>
#include <string>
#include <vector>

SCIDBREGISTRYNAMESPACE_BEGIN

class IGroupResolver;

//------------------------------------------------------------------------------
//! Permissions of a dataset grouped by operation and principal kind
//------------------------------------------------------------------------------
struct PermissionListing {
  std::string owner;
  std::set<std::string> read_users;
  std::set<std::string> read_groups;
  std::set<std::string> write_users;
  std::set<std::string> write_groups;
};

//------------------------------------------------------------------------------
//! Class holding the explicit permission entries of all datasets.
//!
//! The dataset owner implicitly holds read and write. Owner rights are never
//! stored and can not be revoked. A user passes a check if it is the owner,
//! holds the grant directly, or belongs to a group holding the grant.
//------------------------------------------------------------------------------
class PermissionMatrix
{
public:
  //----------------------------------------------------------------------------
  //! Rule string syntax: u:<name>:<flags> or g:<name>:<flags>, flags out of
  //! 'r' and 'w', several rules separated by ','
  //----------------------------------------------------------------------------
  static const char* sRegexRules;

  //----------------------------------------------------------------------------
  //! Constructor
  //!
  //! @param resolver group membership resolver, may be nullptr in which case
  //!        group grants never apply to users
  //----------------------------------------------------------------------------
  explicit PermissionMatrix(IGroupResolver* resolver = nullptr);

  //----------------------------------------------------------------------------
  //! Make a dataset known to the matrix
  //----------------------------------------------------------------------------
  void registerDataset(const std::string& id, const std::string& owner);

  //----------------------------------------------------------------------------
  //! Drop a dataset and all its entries
  //----------------------------------------------------------------------------
  void forgetDataset(const std::string& id);

  bool hasDataset(const std::string& id) const;

  //----------------------------------------------------------------------------
  //! Idempotent grant. Granting to the owner is a no-op.
  //!
  //! @return true if the entry was added
  //! @throws ns::NotFoundError for unknown datasets
  //----------------------------------------------------------------------------
  bool grant(const std::string& id, const Principal& principal, Operation op);

  //----------------------------------------------------------------------------
  //! Idempotent revoke. Revoking a missing entry is a no-op.
  //!
  //! @return true if an entry was removed
  //! @throws ns::NotFoundError for unknown datasets
  //----------------------------------------------------------------------------
  bool revoke(const std::string& id, const Principal& principal, Operation op);

  //----------------------------------------------------------------------------
  //! Check a permission
  //!
  //! @throws ns::NotFoundError for unknown datasets
  //----------------------------------------------------------------------------
  bool check(const std::string& id, const Principal& principal,
             Operation op) const;

  //----------------------------------------------------------------------------
  //! Check if a user is the owner of a dataset
  //----------------------------------------------------------------------------
  bool isOwner(const std::string& id, const std::string& user) const;

  //----------------------------------------------------------------------------
  //! List the permissions of a dataset
  //----------------------------------------------------------------------------
  PermissionListing list(const std::string& id) const;

  //----------------------------------------------------------------------------
  //! Stored entries of a dataset, owner rights excluded
  //----------------------------------------------------------------------------
  std::vector<Grant> grantsOf(const std::string& id) const;

  //----------------------------------------------------------------------------
  //! Check the syntax of a rule string
  //!
  //! @param rules rule string
  //! @param err error description if the syntax is invalid
  //!
  //! @return true if valid, otherwise false
  //----------------------------------------------------------------------------
  static bool IsValidRules(const std::string& rules, std::string& err);

  //----------------------------------------------------------------------------
  //! Parse a rule string into grants
  //!
  //! @throws ns::ValidationError on syntax errors
  //----------------------------------------------------------------------------
  static std::vector<Grant> ParseRules(const std::string& rules);

  //----------------------------------------------------------------------------
  //! Serialize grants into a rule string, one rule per principal
  //----------------------------------------------------------------------------
  static std::string SerializeRules(const std::vector<Grant>& grants);

private:
  struct DatasetAcl {
    std::string owner;
    std::set<Grant> grants;
  };

  IGroupResolver* mResolver;
  mutable common::RWMutex mMutex;
  std::map<std::string, DatasetAcl> mAcls;

  const DatasetAcl& getAcl(const std::string& id) const;
  DatasetAcl& getAcl(const std::string& id);
};

SCIDBREGISTRYNAMESPACE_END

#endif
