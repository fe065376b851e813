// ----------------------------------------------------------------------
// File: VersionChain.cc
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

#include "registry/VersionChain.hh"
#include "common/Logging.hh"
#include "namespace/MDException.hh"
#include <algorithm>

SCIDBREGISTRYNAMESPACE_BEGIN

//------------------------------------------------------------------------------
// Register dataset
//------------------------------------------------------------------------------
void
VersionChain::registerDataset(const std::string& id)
{
  common::RWMutexWriteLock wr_lock(mMutex);
  mKnown.insert(id);
}

void
VersionChain::forgetDataset(const std::string& id)
{
  common::RWMutexWriteLock wr_lock(mMutex);

  if (!mPredecessor.count(id) && !mSuccessor.count(id)) {
    mKnown.erase(id);
  }
}

bool
VersionChain::hasDataset(const std::string& id) const
{
  common::RWMutexReadLock rd_lock(mMutex);
  return mKnown.count(id) != 0;
}

//------------------------------------------------------------------------------
// Validate a link, caller holds the mutex
//------------------------------------------------------------------------------
void
VersionChain::checkLink(const std::string& new_id,
                        const std::string& predecessor_id) const
{
  if (new_id == predecessor_id) {
    throw_nsexception(ns::ChainConflictError, "dataset " << new_id
                      << " can not replace itself");
  }

  if (!mKnown.count(predecessor_id)) {
    throw_nsexception(ns::ChainConflictError, "predecessor " << predecessor_id
                      << " does not exist");
  }

  if (!mKnown.count(new_id)) {
    throw_nsexception(ns::ChainConflictError, "dataset " << new_id
                      << " does not exist");
  }

  auto it = mSuccessor.find(predecessor_id);

  if (it != mSuccessor.end()) {
    throw_nsexception(ns::ChainConflictError, "predecessor " << predecessor_id
                      << " is already replaced by " << it->second);
  }

  if (mPredecessor.count(new_id)) {
    throw_nsexception(ns::ChainConflictError, "dataset " << new_id
                      << " already replaces " << mPredecessor.find(new_id)->second);
  }

  // Walk back from the predecessor, reaching new_id closes a cycle
  std::string cursor = predecessor_id;

  for (size_t i = 0; i <= mPredecessor.size(); ++i) {
    if (cursor == new_id) {
      throw_nsexception(ns::ChainConflictError, "linking " << new_id << " to "
                        << predecessor_id << " creates a cycle");
    }

    auto pit = mPredecessor.find(cursor);

    if (pit == mPredecessor.end()) {
      break;
    }

    cursor = pit->second;
  }
}

//------------------------------------------------------------------------------
// Check link
//------------------------------------------------------------------------------
void
VersionChain::canLink(const std::string& new_id,
                      const std::string& predecessor_id) const
{
  common::RWMutexReadLock rd_lock(mMutex);
  checkLink(new_id, predecessor_id);
}

//------------------------------------------------------------------------------
// Link
//------------------------------------------------------------------------------
void
VersionChain::link(const std::string& new_id,
                   const std::string& predecessor_id)
{
  common::RWMutexWriteLock wr_lock(mMutex);
  checkLink(new_id, predecessor_id);
  mPredecessor[new_id] = predecessor_id;
  mSuccessor[predecessor_id] = new_id;
  scidb_static_debug("msg=\"linked dataset\" id=%s replaces=%s",
                     new_id.c_str(), predecessor_id.c_str());
}

//------------------------------------------------------------------------------
// Unlink
//------------------------------------------------------------------------------
bool
VersionChain::unlink(const std::string& new_id)
{
  common::RWMutexWriteLock wr_lock(mMutex);
  auto it = mPredecessor.find(new_id);

  if (it == mPredecessor.end()) {
    return false;
  }

  mSuccessor.erase(it->second);
  mPredecessor.erase(it);
  return true;
}

std::string
VersionChain::successorOf(const std::string& id) const
{
  common::RWMutexReadLock rd_lock(mMutex);
  auto it = mSuccessor.find(id);
  return (it == mSuccessor.end()) ? std::string() : it->second;
}

std::string
VersionChain::predecessorOf(const std::string& id) const
{
  common::RWMutexReadLock rd_lock(mMutex);
  auto it = mPredecessor.find(id);
  return (it == mPredecessor.end()) ? std::string() : it->second;
}

size_t
VersionChain::numLinks() const
{
  common::RWMutexReadLock rd_lock(mMutex);
  return mPredecessor.size();
}

//------------------------------------------------------------------------------
// Complete chain root to tip
//------------------------------------------------------------------------------
std::vector<std::string>
VersionChain::chainOf(const std::string& id) const
{
  common::RWMutexReadLock rd_lock(mMutex);
  std::vector<std::string> chain;
  std::set<std::string> seen;
  std::string cursor = id;
  size_t bound = mPredecessor.size() + 1;

  // Backwards to the root
  while (chain.size() < bound && seen.insert(cursor).second) {
    chain.push_back(cursor);
    auto it = mPredecessor.find(cursor);

    if (it == mPredecessor.end()) {
      break;
    }

    cursor = it->second;
  }

  std::reverse(chain.begin(), chain.end());
  cursor = id;

  // Forward to the tip
  while (chain.size() <= bound) {
    auto it = mSuccessor.find(cursor);

    if ((it == mSuccessor.end()) || !seen.insert(it->second).second) {
      break;
    }

    cursor = it->second;
    chain.push_back(cursor);
  }

  return chain;
}

SCIDBREGISTRYNAMESPACE_END
