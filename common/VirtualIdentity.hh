// ----------------------------------------------------------------------
// File: VirtualIdentity.hh
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

#ifndef __SCIDBCOMMON_VIRTUALIDENTITY_HH__
#define __SCIDBCOMMON_VIRTUALIDENTITY_HH__

#include "common/Namespace.hh"
#include <sys/types.h>
#include <string>

SCIDBCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Identity of the principal on whose behalf a registry call is executed.
//! The authenticator fills it in before any registry call. The registry
//! decides on the name, the numeric ids and the protocol end up in log lines.
//------------------------------------------------------------------------------
struct VirtualIdentity {
  uid_t uid;
  gid_t gid;
  std::string name;
  std::string prot;

  //----------------------------------------------------------------------------
  //! Constructor - assign to "nobody" by default
  //----------------------------------------------------------------------------
  VirtualIdentity();

  //----------------------------------------------------------------------------
  //! "Constructor" - return Nobody identity
  //----------------------------------------------------------------------------
  static VirtualIdentity Nobody();

  //----------------------------------------------------------------------------
  //! "Constructor" - identity of a named user authenticated by protocol prot
  //!
  //! @param user principal name
  //! @param prot authentication protocol tag used in traces
  //----------------------------------------------------------------------------
  static VirtualIdentity User(const std::string& user,
                              const std::string& prot = "local");

  //----------------------------------------------------------------------------
  //! Check if this is the unauthenticated identity
  //----------------------------------------------------------------------------
  bool isNobody() const
  {
    return name.empty() || (name == "nobody");
  }
};

SCIDBCOMMONNAMESPACE_END

#endif
