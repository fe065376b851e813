// ----------------------------------------------------------------------
// File: LocalContentStore.hh
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

#ifndef __SCIDBSTORE_LOCALCONTENTSTORE_HH__
#define __SCIDBSTORE_LOCALCONTENTSTORE_HH__

#include "store/IContentStore.hh"
#include "common/Logging.hh"
#include <atomic>

SCIDBSTORENAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Content store on a local file system. Payloads are content addressed by
//! their sha256 and laid out as <root>/<first two hex digits>/<hex>. A payload
//! is written to a temporary file, synced and renamed into place so that a
//! reference returned by put always points to complete bytes.
//------------------------------------------------------------------------------
class LocalContentStore: public IContentStore, public common::LogId
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //!
  //! @param root directory holding the payloads, created if missing
  //----------------------------------------------------------------------------
  explicit LocalContentStore(const std::string& root);

  ~LocalContentStore() override = default;

  std::string put(const std::string& bytes) override;
  std::string get(const std::string& reference) override;
  uint64_t size(const std::string& reference) override;
  bool exists(const std::string& reference) override;

  const char* type() const override
  {
    return "local";
  }

  //----------------------------------------------------------------------------
  //! Physical path of a reference
  //----------------------------------------------------------------------------
  std::string PathOf(const std::string& reference) const;

private:
  //----------------------------------------------------------------------------
  //! Check that a reference is a well formed sha256 hex digest
  //----------------------------------------------------------------------------
  static bool IsValidReference(const std::string& reference);

  //----------------------------------------------------------------------------
  //! Create a directory if it does not exist yet
  //----------------------------------------------------------------------------
  static void MakeDir(const std::string& path);

  std::string mRoot;
  std::atomic<uint64_t> mTmpCounter {0};
};

SCIDBSTORENAMESPACE_END

#endif
