// ----------------------------------------------------------------------
// File: SystemClock.hh
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

#ifndef __SCIDBCOMMON_SYSTEMCLOCK_HH__
#define __SCIDBCOMMON_SYSTEMCLOCK_HH__

#include "common/Namespace.hh"
#include <chrono>
#include <cstdint>
#include <mutex>

SCIDBCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Wall clock for upload stamps and cache lifetimes. A fake clock starts at
//! the epoch and only moves when advanced.
//------------------------------------------------------------------------------
class SystemClock
{
public:
  typedef std::chrono::system_clock::time_point TimePoint;

  explicit SystemClock(bool fake = false) : mFake(fake) {}

  //----------------------------------------------------------------------------
  //! Current time of the given clock, the real time for a null clock
  //----------------------------------------------------------------------------
  static TimePoint now(const SystemClock* clock)
  {
    return clock ? clock->GetTime() : std::chrono::system_clock::now();
  }

  TimePoint GetTime() const
  {
    if (!mFake) {
      return std::chrono::system_clock::now();
    }

    std::lock_guard<std::mutex> lock(mMutex);
    return mFakeNow;
  }

  //----------------------------------------------------------------------------
  //! Move a fake clock forward, no effect on a real one
  //----------------------------------------------------------------------------
  template<typename Duration>
  void advance(Duration step)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mFakeNow += step;
  }

  static int64_t MicrosSinceEpoch(TimePoint point)
  {
    return std::chrono::duration_cast<std::chrono::microseconds>(
             point.time_since_epoch()).count();
  }

private:
  const bool mFake;
  mutable std::mutex mMutex;
  TimePoint mFakeNow;
};

SCIDBCOMMONNAMESPACE_END

#endif
