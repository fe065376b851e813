// ----------------------------------------------------------------------
// File: IContentStore.hh
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

#ifndef __SCIDBSTORE_ICONTENTSTORE_HH__
#define __SCIDBSTORE_ICONTENTSTORE_HH__

#include "store/Namespace.hh"
#include <cstdint>
#include <string>

SCIDBSTORENAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Abstract interface to the byte storage holding dataset file payloads.
//! References are opaque to callers. Implementations throw
//! ns::NotFoundError for unknown references and ns::StoreError for I/O
//! failures.
//------------------------------------------------------------------------------
class IContentStore
{
public:
  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  virtual ~IContentStore() = default;

  //----------------------------------------------------------------------------
  //! Store bytes, durable before returning
  //!
  //! @param bytes payload
  //!
  //! @return reference to the stored payload
  //----------------------------------------------------------------------------
  virtual std::string put(const std::string& bytes) = 0;

  //----------------------------------------------------------------------------
  //! Fetch bytes of a reference
  //----------------------------------------------------------------------------
  virtual std::string get(const std::string& reference) = 0;

  //----------------------------------------------------------------------------
  //! Size in bytes of a reference
  //----------------------------------------------------------------------------
  virtual uint64_t size(const std::string& reference) = 0;

  //----------------------------------------------------------------------------
  //! Check if a reference exists
  //----------------------------------------------------------------------------
  virtual bool exists(const std::string& reference) = 0;

  //----------------------------------------------------------------------------
  //! Store type name used in log messages
  //----------------------------------------------------------------------------
  virtual const char* type() const = 0;
};

SCIDBSTORENAMESPACE_END

#endif
