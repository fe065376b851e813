// ----------------------------------------------------------------------
// File: RWMutex.hh
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

#ifndef __SCIDBCOMMON_RWMUTEX_HH__
#define __SCIDBCOMMON_RWMUTEX_HH__

#include "common/Namespace.hh"
#include <chrono>
#include <cstdint>
#include <shared_mutex>
#include <string>

#define SCIDB_FUNCTION __builtin_FUNCTION()
#define SCIDB_FILE __builtin_FILE()
#define SCIDB_LINE __builtin_LINE()

SCIDBCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Read-write mutex wrapping std::shared_timed_mutex. A lock guard which holds
//! the mutex for longer than the configured interval reports it in the log.
//------------------------------------------------------------------------------
class RWMutex
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //----------------------------------------------------------------------------
  RWMutex() = default;

  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  ~RWMutex() = default;

  RWMutex(const RWMutex&) = delete;
  RWMutex& operator=(const RWMutex&) = delete;
  RWMutex(RWMutex&&) = delete;
  RWMutex& operator=(RWMutex&&) = delete;

  //----------------------------------------------------------------------------
  //! Set the mutex name used in log messages
  //----------------------------------------------------------------------------
  void SetName(const std::string& name)
  {
    mName = name;
  }

  const std::string& getName() const
  {
    return mName;
  }

  //----------------------------------------------------------------------------
  //! Set the interval after which a held lock is reported, 0 disables it
  //----------------------------------------------------------------------------
  void SetBlockedForMsInterval(int64_t ms)
  {
    mBlockedForInterval = ms;
  }

  int64_t BlockedForMsInterval() const
  {
    return mBlockedForInterval;
  }

  //----------------------------------------------------------------------------
  //! Lock for read
  //----------------------------------------------------------------------------
  void LockRead()
  {
    mMutex.lock_shared();
  }

  //----------------------------------------------------------------------------
  //! Unlock a read lock
  //----------------------------------------------------------------------------
  void UnLockRead()
  {
    mMutex.unlock_shared();
  }

  //----------------------------------------------------------------------------
  //! Lock for write
  //----------------------------------------------------------------------------
  void LockWrite()
  {
    mMutex.lock();
  }

  //----------------------------------------------------------------------------
  //! Unlock a write lock
  //----------------------------------------------------------------------------
  void UnLockWrite()
  {
    mMutex.unlock();
  }

  //----------------------------------------------------------------------------
  //! Try to write lock the mutex within the timeout
  //!
  //! @param timeout_ms milliseconds timeout
  //!
  //! @return true if the lock was acquired
  //----------------------------------------------------------------------------
  bool TimedWrLock(uint64_t timeout_ms)
  {
    return mMutex.try_lock_for(std::chrono::milliseconds(timeout_ms));
  }

private:
  std::shared_timed_mutex mMutex;
  std::string mName {"unnamed"};
  int64_t mBlockedForInterval {10000};
};

//------------------------------------------------------------------------------
//! Write lock guard
//------------------------------------------------------------------------------
class RWMutexWriteLock
{
public:
  RWMutexWriteLock() = default;

  //----------------------------------------------------------------------------
  //! Constructor
  //!
  //! @param mutex mutex to lock for write
  //! @param function caller function name
  //! @param file caller file name
  //! @param line caller line number in file
  //----------------------------------------------------------------------------
  RWMutexWriteLock(RWMutex& mutex,
                   const char* function = SCIDB_FUNCTION,
                   const char* file = SCIDB_FILE,
                   int line = SCIDB_LINE);

  ~RWMutexWriteLock()
  {
    Release();
  }

  RWMutexWriteLock(const RWMutexWriteLock&) = delete;
  RWMutexWriteLock& operator=(const RWMutexWriteLock&) = delete;

  //----------------------------------------------------------------------------
  //! Grab mutex and write lock it
  //----------------------------------------------------------------------------
  void Grab(RWMutex& mutex,
            const char* function = SCIDB_FUNCTION,
            const char* file = SCIDB_FILE,
            int line = SCIDB_LINE);

  //----------------------------------------------------------------------------
  //! Release the write lock after grab
  //----------------------------------------------------------------------------
  void Release();

private:
  std::chrono::steady_clock::time_point mAcquiredAt;
  RWMutex* mWrMutex {nullptr};
  const char* mFunction {"unknown"};
  const char* mFile {"unknown"};
  int mLine {0};
};

//------------------------------------------------------------------------------
//! Read lock guard
//------------------------------------------------------------------------------
class RWMutexReadLock
{
public:
  RWMutexReadLock() = default;

  //----------------------------------------------------------------------------
  //! Constructor
  //!
  //! @param mutex mutex to lock for read
  //! @param function caller function name
  //! @param file caller file name
  //! @param line caller line number in file
  //----------------------------------------------------------------------------
  RWMutexReadLock(RWMutex& mutex,
                  const char* function = SCIDB_FUNCTION,
                  const char* file = SCIDB_FILE,
                  int line = SCIDB_LINE);

  ~RWMutexReadLock()
  {
    Release();
  }

  RWMutexReadLock(const RWMutexReadLock&) = delete;
  RWMutexReadLock& operator=(const RWMutexReadLock&) = delete;

  //----------------------------------------------------------------------------
  //! Grab mutex and read lock it
  //----------------------------------------------------------------------------
  void Grab(RWMutex& mutex,
            const char* function = SCIDB_FUNCTION,
            const char* file = SCIDB_FILE,
            int line = SCIDB_LINE);

  //----------------------------------------------------------------------------
  //! Release the read lock after grab
  //----------------------------------------------------------------------------
  void Release();

private:
  std::chrono::steady_clock::time_point mAcquiredAt;
  RWMutex* mRdMutex {nullptr};
  const char* mFunction {"unknown"};
  const char* mFile {"unknown"};
  int mLine {0};
};

SCIDBCOMMONNAMESPACE_END

#endif
