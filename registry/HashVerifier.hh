// ----------------------------------------------------------------------
// File: HashVerifier.hh
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

#ifndef __SCIDBREGISTRY_HASHVERIFIER_HH__
#define __SCIDBREGISTRY_HASHVERIFIER_HH__

#include "registry/Namespace.hh"
#include "namespace/DatasetMD.hh"
#include "store/IContentStore.hh"
#include <map>
#include <string>
#include <vector>

SCIDBREGISTRYNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Outcome of a payload verification
//------------------------------------------------------------------------------
struct VerificationReport {
  bool match {false};
  std::string claimed; ///< claimed digest as given
  std::string computed; ///< digest over the stored payload, empty if an entry failed
  std::string failed_entry; ///< name of the first failing entry
  std::string reason; ///< human readable failure description

  std::string ToString() const;
};

//------------------------------------------------------------------------------
//! Computes and checks the content digest of a dataset payload.
//!
//! The digest is the hex sha256 over the canonical serialization of the
//! manifest: entries sorted by name (byte-wise), for each entry the 8-byte
//! big-endian length of the name, the name, the 8-byte big-endian length of
//! the content and the content. Inline previews do not take part. The result
//! does not depend on the order in which entries were appended.
//------------------------------------------------------------------------------
class HashVerifier
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //!
  //! @param store content store resolving entry references
  //----------------------------------------------------------------------------
  explicit HashVerifier(store::IContentStore& store): mStore(store) {}

  //----------------------------------------------------------------------------
  //! Digest of a single entry payload as recorded in the manifest
  //----------------------------------------------------------------------------
  static std::string EntryDigest(const std::string& bytes);

  //----------------------------------------------------------------------------
  //! Digest over named payloads already held in memory
  //!
  //! @param payloads map of entry name to bytes
  //----------------------------------------------------------------------------
  static std::string Compute(const std::map<std::string, std::string>& payloads);

  //----------------------------------------------------------------------------
  //! Verify manifest entries against a claimed digest. Every entry is checked
  //! individually against its recorded size and checksum before the aggregate
  //! is compared. Never mutates any state.
  //!
  //! @param entries manifest entries
  //! @param claimed claimed hex digest, compared case insensitive
  //!
  //! @return verification report
  //! @throws ns::StoreError if the content store fails
  //----------------------------------------------------------------------------
  VerificationReport Verify(const std::vector<ns::FileEntry>& entries,
                            const std::string& claimed) const;

private:
  store::IContentStore& mStore;
};

SCIDBREGISTRYNAMESPACE_END

#endif
