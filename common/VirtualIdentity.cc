// ----------------------------------------------------------------------
// File: VirtualIdentity.cc
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

#include "common/VirtualIdentity.hh"
#include <unistd.h>

SCIDBCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
// Constructor - assign to "nobody" by default
//------------------------------------------------------------------------------
VirtualIdentity::VirtualIdentity():
  uid(99), gid(99), name("nobody"), prot("")
{}

//------------------------------------------------------------------------------
// "Constructor" - return Nobody identity
//------------------------------------------------------------------------------
VirtualIdentity VirtualIdentity::Nobody()
{
  return VirtualIdentity();
}

//------------------------------------------------------------------------------
// "Constructor" - named user
//------------------------------------------------------------------------------
VirtualIdentity VirtualIdentity::User(const std::string& user,
                                      const std::string& prot)
{
  VirtualIdentity vid;
  vid.uid = getuid();
  vid.gid = getgid();
  vid.name = user;
  vid.prot = prot;
  return vid;
}

SCIDBCOMMONNAMESPACE_END
