// ----------------------------------------------------------------------
// File: LockTable.cc
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

#include "registry/LockTable.hh"
#include <algorithm>

SCIDBREGISTRYNAMESPACE_BEGIN

//------------------------------------------------------------------------------
// Get the mutex of a dataset
//------------------------------------------------------------------------------
std::shared_ptr<common::RWMutex>
LockTable::get(const std::string& id)
{
  std::lock_guard<std::mutex> lock(mMutex);
  auto& mtx = mLocks[id];

  if (!mtx) {
    mtx = std::make_shared<common::RWMutex>();
    mtx->SetName(std::string("dataset:") + id);
  }

  return mtx;
}

//------------------------------------------------------------------------------
// Release a mutex and drop its entry once only the table references it
//------------------------------------------------------------------------------
void
LockTable::release(const std::string& id,
                   std::shared_ptr<common::RWMutex>& mtx)
{
  std::lock_guard<std::mutex> lock(mMutex);
  auto it = mLocks.find(id);

  // references: the table entry plus the one handed back here
  if ((it != mLocks.end()) && (it->second == mtx) &&
      (it->second.use_count() == 2)) {
    mLocks.erase(it);
  }

  mtx.reset();
}

size_t
LockTable::size() const
{
  std::lock_guard<std::mutex> lock(mMutex);
  return mLocks.size();
}

//------------------------------------------------------------------------------
// Take the write locks in id order
//------------------------------------------------------------------------------
DatasetWriteLock::DatasetWriteLock(LockTable& table,
                                   std::vector<std::string> ids):
  mTable(table)
{
  std::sort(ids.begin(), ids.end());
  ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

  for (const auto& id : ids) {
    if (id.empty()) {
      continue;
    }

    auto mtx = table.get(id);
    mtx->LockWrite();
    mHeld.emplace_back(id, mtx);
  }
}

//------------------------------------------------------------------------------
// Release in reverse order
//------------------------------------------------------------------------------
DatasetWriteLock::~DatasetWriteLock()
{
  for (auto it = mHeld.rbegin(); it != mHeld.rend(); ++it) {
    it->second->UnLockWrite();
    mTable.release(it->first, it->second);
  }
}

DatasetReadLock::DatasetReadLock(LockTable& table, const std::string& id):
  mTable(table), mId(id), mHeld(table.get(id))
{
  mHeld->LockRead();
}

DatasetReadLock::~DatasetReadLock()
{
  mHeld->UnLockRead();
  mTable.release(mId, mHeld);
}

SCIDBREGISTRYNAMESPACE_END
