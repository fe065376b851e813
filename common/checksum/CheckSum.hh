// ----------------------------------------------------------------------
// File: CheckSum.hh
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

#ifndef __SCIDBCOMMON_CHECKSUM_HH__
#define __SCIDBCOMMON_CHECKSUM_HH__

#include "common/Namespace.hh"
#include "XrdOuc/XrdOucString.hh"
#include <strings.h>
#include <sys/types.h>
#include <string>

SCIDBCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Streaming checksum interface. Data has to be added in sequence, an Add
//! call with an offset different from the last one marks the object as
//! needing recalculation.
//------------------------------------------------------------------------------
class CheckSum
{
protected:
  XrdOucString Name;
  XrdOucString Checksum;
  bool needsRecalculation;
  bool finalized;

public:
  CheckSum(const char* name):
    Name(name), needsRecalculation(false), finalized(false) {}

  virtual ~CheckSum() = default;

  virtual bool Add(const char* buffer, size_t length, off_t offset) = 0;
  virtual void Finalize() = 0;
  virtual void Reset() = 0;
  virtual const char* GetHexChecksum() = 0;
  virtual const char* GetBinChecksum(int& len) = 0;
  virtual off_t GetLastOffset() = 0;
  virtual int GetCheckSumLen() = 0;

  //----------------------------------------------------------------------------
  //! Compare with a reference hex checksum, case insensitive
  //----------------------------------------------------------------------------
  virtual bool Compare(const char* refchecksum)
  {
    Finalize();
    return (refchecksum != nullptr) &&
           (strcasecmp(GetHexChecksum(), refchecksum) == 0);
  }

  //----------------------------------------------------------------------------
  //! Append a complete string at the current offset
  //----------------------------------------------------------------------------
  bool Append(const std::string& data)
  {
    return Add(data.data(), data.length(), GetLastOffset());
  }

  const char* GetName()
  {
    return Name.c_str();
  }

  bool NeedsRecalculation()
  {
    return needsRecalculation;
  }
};

SCIDBCOMMONNAMESPACE_END

#endif
