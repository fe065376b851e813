// ----------------------------------------------------------------------
// File: MemoryContentStore.cc
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

#include "store/MemoryContentStore.hh"
#include "common/checksum/SHA256.hh"
#include "namespace/MDException.hh"

SCIDBSTORENAMESPACE_BEGIN

//------------------------------------------------------------------------------
// Fail if the store simulates an outage, mutex has to be held
//------------------------------------------------------------------------------
void
MemoryContentStore::checkOnline() const
{
  if (mOffline) {
    throw_nsexception(ns::StoreError, "content store offline");
  }
}

//------------------------------------------------------------------------------
// Store bytes
//------------------------------------------------------------------------------
std::string
MemoryContentStore::put(const std::string& bytes)
{
  std::string reference = common::SHA256::Hex(bytes);
  std::lock_guard<std::mutex> lock(mMutex);
  checkOnline();
  mBlobs[reference] = bytes;
  return reference;
}

//------------------------------------------------------------------------------
// Fetch bytes
//------------------------------------------------------------------------------
std::string
MemoryContentStore::get(const std::string& reference)
{
  std::lock_guard<std::mutex> lock(mMutex);
  checkOnline();
  auto it = mBlobs.find(reference);

  if (it == mBlobs.end()) {
    throw_nsexception(ns::NotFoundError, "unknown content reference "
                      << reference);
  }

  return it->second;
}

//------------------------------------------------------------------------------
// Size of a reference
//------------------------------------------------------------------------------
uint64_t
MemoryContentStore::size(const std::string& reference)
{
  std::lock_guard<std::mutex> lock(mMutex);
  checkOnline();
  auto it = mBlobs.find(reference);

  if (it == mBlobs.end()) {
    throw_nsexception(ns::NotFoundError, "unknown content reference "
                      << reference);
  }

  return it->second.length();
}

//------------------------------------------------------------------------------
// Check existence
//------------------------------------------------------------------------------
bool
MemoryContentStore::exists(const std::string& reference)
{
  std::lock_guard<std::mutex> lock(mMutex);
  checkOnline();
  return mBlobs.count(reference);
}

//------------------------------------------------------------------------------
// Overwrite stored payload
//------------------------------------------------------------------------------
bool
MemoryContentStore::corrupt(const std::string& reference,
                            const std::string& bytes)
{
  std::lock_guard<std::mutex> lock(mMutex);
  auto it = mBlobs.find(reference);

  if (it == mBlobs.end()) {
    return false;
  }

  it->second = bytes;
  return true;
}

//------------------------------------------------------------------------------
// Simulate outage
//------------------------------------------------------------------------------
void
MemoryContentStore::setOffline(bool offline)
{
  std::lock_guard<std::mutex> lock(mMutex);
  mOffline = offline;
}

//------------------------------------------------------------------------------
// Number of stored payloads
//------------------------------------------------------------------------------
size_t
MemoryContentStore::count() const
{
  std::lock_guard<std::mutex> lock(mMutex);
  return mBlobs.size();
}

SCIDBSTORENAMESPACE_END
