// ----------------------------------------------------------------------
// File: Principal.hh
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

#ifndef __SCIDBREGISTRY_PRINCIPAL_HH__
#define __SCIDBREGISTRY_PRINCIPAL_HH__

#include "registry/Namespace.hh"
#include <string>
#include <tuple>

SCIDBREGISTRYNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Operations governed by the permission matrix. Write does not imply read.
//------------------------------------------------------------------------------
enum class Operation {
  kRead,
  kWrite
};

inline const char* OperationToString(Operation op)
{
  return (op == Operation::kRead) ? "read" : "write";
}

//------------------------------------------------------------------------------
//! A user or a group which can hold permissions
//------------------------------------------------------------------------------
struct Principal {
  enum class Kind {
    kUser,
    kGroup
  };

  Kind kind {Kind::kUser};
  std::string name;

  static Principal User(const std::string& name)
  {
    return Principal{Kind::kUser, name};
  }

  static Principal Group(const std::string& name)
  {
    return Principal{Kind::kGroup, name};
  }

  bool isUser() const
  {
    return kind == Kind::kUser;
  }

  bool isGroup() const
  {
    return kind == Kind::kGroup;
  }

  //----------------------------------------------------------------------------
  //! Tag used in rule strings and catalog rows, 'u' or 'g'
  //----------------------------------------------------------------------------
  const char* tag() const
  {
    return isUser() ? "u" : "g";
  }

  std::string ToString() const
  {
    return std::string(tag()) + ":" + name;
  }

  bool operator<(const Principal& other) const
  {
    return std::tie(kind, name) < std::tie(other.kind, other.name);
  }

  bool operator==(const Principal& other) const
  {
    return (kind == other.kind) && (name == other.name);
  }
};

//------------------------------------------------------------------------------
//! One permission entry of a dataset
//------------------------------------------------------------------------------
struct Grant {
  Principal principal;
  Operation op {Operation::kRead};

  bool operator<(const Grant& other) const
  {
    return std::tie(principal, op) < std::tie(other.principal, other.op);
  }

  bool operator==(const Grant& other) const
  {
    return (principal == other.principal) && (op == other.op);
  }
};

SCIDBREGISTRYNAMESPACE_END

#endif
