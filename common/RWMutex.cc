// ----------------------------------------------------------------------
// File: RWMutex.cc
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

#include "common/RWMutex.hh"
#include "common/Logging.hh"
#include <stdexcept>

SCIDBCOMMONNAMESPACE_BEGIN

namespace
{
//------------------------------------------------------------------------------
// Report a lock which was held longer than the mutex interval
//------------------------------------------------------------------------------
void
ReportLongHold(const RWMutex& mutex, const char* kind,
               std::chrono::steady_clock::time_point acquired,
               const char* function, const char* file, int line)
{
  int64_t interval = mutex.BlockedForMsInterval();

  if (interval <= 0) {
    return;
  }

  std::chrono::milliseconds heldFor =
    std::chrono::duration_cast<std::chrono::milliseconds>
    (std::chrono::steady_clock::now() - acquired);

  if (heldFor.count() > interval) {
    scidb_static_warning("msg=\"%s lock held too long\" mutex=%s held_ms=%lld "
                         "caller=%s source=%s:%d", kind, mutex.getName().c_str(),
                         (long long) heldFor.count(), function, file, line);
  }
}
}

//------------------------------------------------------------------------------
//                      ***** Class RWMutexWriteLock *****
//------------------------------------------------------------------------------

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
RWMutexWriteLock::RWMutexWriteLock(RWMutex& mutex, const char* function,
                                   const char* file, int line)
{
  Grab(mutex, function, file, line);
}

//------------------------------------------------------------------------------
// Grab mutex and write lock it
//------------------------------------------------------------------------------
void
RWMutexWriteLock::Grab(RWMutex& mutex, const char* function, const char* file,
                       int line)
{
  if (mWrMutex) {
    throw std::runtime_error("already holding a mutex");
  }

  mFunction = function;
  mFile = file;
  mLine = line;
  mWrMutex = &mutex;
  mWrMutex->LockWrite();
  mAcquiredAt = std::chrono::steady_clock::now();
}

//------------------------------------------------------------------------------
// Release the write lock after grab
//------------------------------------------------------------------------------
void
RWMutexWriteLock::Release()
{
  if (mWrMutex) {
    RWMutex* mutex = mWrMutex;
    mWrMutex = nullptr;
    mutex->UnLockWrite();
    ReportLongHold(*mutex, "write", mAcquiredAt, mFunction, mFile, mLine);
  }
}

//------------------------------------------------------------------------------
//                      ***** Class RWMutexReadLock *****
//------------------------------------------------------------------------------

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
RWMutexReadLock::RWMutexReadLock(RWMutex& mutex, const char* function,
                                 const char* file, int line)
{
  Grab(mutex, function, file, line);
}

//------------------------------------------------------------------------------
// Grab mutex and read lock it
//------------------------------------------------------------------------------
void
RWMutexReadLock::Grab(RWMutex& mutex, const char* function, const char* file,
                      int line)
{
  if (mRdMutex) {
    throw std::runtime_error("already holding a mutex");
  }

  mFunction = function;
  mFile = file;
  mLine = line;
  mRdMutex = &mutex;
  mRdMutex->LockRead();
  mAcquiredAt = std::chrono::steady_clock::now();
}

//------------------------------------------------------------------------------
// Release the read lock after grab
//------------------------------------------------------------------------------
void
RWMutexReadLock::Release()
{
  if (mRdMutex) {
    RWMutex* mutex = mRdMutex;
    mRdMutex = nullptr;
    mutex->UnLockRead();
    ReportLongHold(*mutex, "read", mAcquiredAt, mFunction, mFile, mLine);
  }
}

SCIDBCOMMONNAMESPACE_END
