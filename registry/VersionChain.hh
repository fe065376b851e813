// ----------------------------------------------------------------------
// File: VersionChain.hh
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

#ifndef __SCIDBREGISTRY_VERSIONCHAIN_HH__
#define __SCIDBREGISTRY_VERSIONCHAIN_HH__

#include "registry/Namespace.hh"
#include "common/RWMutex.hh"
#include <map>
#include <set>
#include <string>
#include <vector>

SCIDBREGISTRYNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Class maintaining the 'replaces' relation between datasets. Every dataset
//! has at most one direct predecessor and at most one direct successor and
//! the relation is acyclic.
//------------------------------------------------------------------------------
class VersionChain
{
public:
  VersionChain()
  {
    mMutex.SetName("VersionChain");
  }

  //----------------------------------------------------------------------------
  //! Make a dataset known to the chain
  //----------------------------------------------------------------------------
  void registerDataset(const std::string& id);

  //----------------------------------------------------------------------------
  //! Drop a dataset which takes part in no link
  //----------------------------------------------------------------------------
  void forgetDataset(const std::string& id);

  bool hasDataset(const std::string& id) const;

  //----------------------------------------------------------------------------
  //! Check if new_id can be declared the successor of predecessor_id
  //!
  //! @throws ns::ChainConflictError describing the conflict
  //----------------------------------------------------------------------------
  void canLink(const std::string& new_id,
               const std::string& predecessor_id) const;

  //----------------------------------------------------------------------------
  //! Declare new_id the direct successor of predecessor_id
  //!
  //! @throws ns::ChainConflictError if the predecessor already has a
  //!         successor, a dataset is unknown or the link closes a cycle
  //----------------------------------------------------------------------------
  void link(const std::string& new_id, const std::string& predecessor_id);

  //----------------------------------------------------------------------------
  //! Remove the link from new_id to its predecessor
  //!
  //! @return true if a link was removed
  //----------------------------------------------------------------------------
  bool unlink(const std::string& new_id);

  //----------------------------------------------------------------------------
  //! Direct successor, empty if none
  //----------------------------------------------------------------------------
  std::string successorOf(const std::string& id) const;

  //----------------------------------------------------------------------------
  //! Direct predecessor, empty if none
  //----------------------------------------------------------------------------
  std::string predecessorOf(const std::string& id) const;

  //----------------------------------------------------------------------------
  //! Complete chain containing id, ordered from root to tip. The walk is
  //! bounded by the number of links.
  //----------------------------------------------------------------------------
  std::vector<std::string> chainOf(const std::string& id) const;

  size_t numLinks() const;

private:
  mutable common::RWMutex mMutex;
  std::set<std::string> mKnown;
  std::map<std::string, std::string> mPredecessor; ///< successor -> predecessor
  std::map<std::string, std::string> mSuccessor; ///< predecessor -> successor

  void checkLink(const std::string& new_id,
                 const std::string& predecessor_id) const;
};

SCIDBREGISTRYNAMESPACE_END

#endif
