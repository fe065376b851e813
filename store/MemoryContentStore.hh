// ----------------------------------------------------------------------
// File: MemoryContentStore.hh
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

#ifndef __SCIDBSTORE_MEMORYCONTENTSTORE_HH__
#define __SCIDBSTORE_MEMORYCONTENTSTORE_HH__

#include "store/IContentStore.hh"
#include <map>
#include <mutex>

SCIDBSTORENAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Volatile content store keyed by the sha256 of the payload. Besides serving
//! tests it allows corrupting stored payloads and simulating outages.
//------------------------------------------------------------------------------
class MemoryContentStore: public IContentStore
{
public:
  MemoryContentStore() = default;
  ~MemoryContentStore() override = default;

  std::string put(const std::string& bytes) override;
  std::string get(const std::string& reference) override;
  uint64_t size(const std::string& reference) override;
  bool exists(const std::string& reference) override;

  const char* type() const override
  {
    return "memory";
  }

  //----------------------------------------------------------------------------
  //! Replace the payload behind an existing reference
  //!
  //! @return true if the reference existed
  //----------------------------------------------------------------------------
  bool corrupt(const std::string& reference, const std::string& bytes);

  //----------------------------------------------------------------------------
  //! Make every following call fail with a StoreError until reset
  //----------------------------------------------------------------------------
  void setOffline(bool offline);

  //----------------------------------------------------------------------------
  //! Number of stored payloads
  //----------------------------------------------------------------------------
  size_t count() const;

private:
  void checkOnline() const;

  mutable std::mutex mMutex;
  std::map<std::string, std::string> mBlobs;
  bool mOffline {false};
};

SCIDBSTORENAMESPACE_END

#endif
