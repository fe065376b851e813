// ----------------------------------------------------------------------
// File: Timing.hh
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

#ifndef __SCIDBCOMMON_TIMING_HH__
#define __SCIDBCOMMON_TIMING_HH__

#include "common/Namespace.hh"
#include <cstdint>
#include <string>
#include <time.h>

SCIDBCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Static time conversion helpers. Timestamps are carried as microseconds
//! since the epoch (UTC) throughout the registry.
//------------------------------------------------------------------------------
class Timing
{
public:
  //----------------------------------------------------------------------------
  //! Time conversion function for ISO8601 time strings, UTC with 'Z' suffix
  //----------------------------------------------------------------------------
  static std::string
  UnixTimestamp_to_ISO8601(time_t now)
  {
    struct tm utc;
    char str[32];

    if (!gmtime_r(&now, &utc)) {
      now = 0;
      gmtime_r(&now, &utc);
    }

    strftime(str, sizeof(str), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return str;
  }

  //----------------------------------------------------------------------------
  //! Render microseconds since epoch as ISO8601 with microsecond fraction
  //----------------------------------------------------------------------------
  static std::string Micros_to_ISO8601(int64_t micros);

  //----------------------------------------------------------------------------
  //! Parse a timestamp string into microseconds since the epoch.
  //!
  //! Accepted forms:
  //!   2023-01-01, 2023-01-01T10:00:00, 2023-01-01 10:00:00 (taken as UTC)
  //!   2023-01-01T10:00:00.123456 with optional Z, +01:00, +0100 offset
  //!   2023-01-01T10:00:00++0100 (offset ignored, wall time taken as UTC)
  //!   2023-01-01 10:00:00 UTC
  //!
  //! @param in input string
  //! @param micros parsed value
  //!
  //! @return true if parsing succeeded, otherwise false
  //----------------------------------------------------------------------------
  static bool ParseTimestamp(const std::string& in, int64_t& micros);
};

SCIDBCOMMONNAMESPACE_END

#endif
