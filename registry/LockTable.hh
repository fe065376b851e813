// ----------------------------------------------------------------------
// File: LockTable.hh
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

#ifndef __SCIDBREGISTRY_LOCKTABLE_HH__
#define __SCIDBREGISTRY_LOCKTABLE_HH__

#include "registry/Namespace.hh"
#include "common/RWMutex.hh"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

SCIDBREGISTRYNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Table of per-dataset read-write mutexes. An entry lives only while some
//! lock guard references it.
//------------------------------------------------------------------------------
class LockTable
{
public:
  //----------------------------------------------------------------------------
  //! Get the mutex of a dataset, creating it on first use
  //----------------------------------------------------------------------------
  std::shared_ptr<common::RWMutex> get(const std::string& id);

  //----------------------------------------------------------------------------
  //! Give back a mutex obtained with get. The entry is dropped when the
  //! caller held the last outside reference. Call only after unlocking.
  //----------------------------------------------------------------------------
  void release(const std::string& id, std::shared_ptr<common::RWMutex>& mtx);

  size_t size() const;

private:
  mutable std::mutex mMutex;
  std::map<std::string, std::shared_ptr<common::RWMutex>> mLocks;
};

//------------------------------------------------------------------------------
//! Exclusive lock over a set of datasets. The mutexes are taken in
//! lexicographic id order so that concurrent multi-dataset operations can not
//! deadlock.
//------------------------------------------------------------------------------
class DatasetWriteLock
{
public:
  DatasetWriteLock(LockTable& table, std::vector<std::string> ids);

  DatasetWriteLock(LockTable& table, const std::string& id):
    DatasetWriteLock(table, std::vector<std::string> {id}) {}

  ~DatasetWriteLock();

  DatasetWriteLock(const DatasetWriteLock&) = delete;
  DatasetWriteLock& operator=(const DatasetWriteLock&) = delete;

private:
  LockTable& mTable;
  std::vector<std::pair<std::string, std::shared_ptr<common::RWMutex>>> mHeld;
};

//------------------------------------------------------------------------------
//! Shared lock on one dataset
//------------------------------------------------------------------------------
class DatasetReadLock
{
public:
  DatasetReadLock(LockTable& table, const std::string& id);

  ~DatasetReadLock();

  DatasetReadLock(const DatasetReadLock&) = delete;
  DatasetReadLock& operator=(const DatasetReadLock&) = delete;

private:
  LockTable& mTable;
  std::string mId;
  std::shared_ptr<common::RWMutex> mHeld;
};

SCIDBREGISTRYNAMESPACE_END

#endif
