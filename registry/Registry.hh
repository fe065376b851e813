// ----------------------------------------------------------------------
// File: Registry.hh
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

#ifndef __SCIDBREGISTRY_REGISTRY_HH__
#define __SCIDBREGISTRY_REGISTRY_HH__

#include "registry/Namespace.hh"
#include "registry/HashVerifier.hh"
#include "registry/LockTable.hh"
#include "registry/PermissionMatrix.hh"
#include "registry/VersionChain.hh"
#include "registry/persistency/SqliteCatalog.hh"
#include "common/Logging.hh"
#include "common/RWMutex.hh"
#include "common/SystemClock.hh"
#include "common/VirtualIdentity.hh"
#include "namespace/DatasetMD.hh"
#include "store/IContentStore.hh"
#include <map>
#include <memory>
#include <string>
#include <vector>

SCIDBREGISTRYNAMESPACE_BEGIN

class IGroupResolver;
class Registry;

//------------------------------------------------------------------------------
//! Lazy listing of the datasets visible to a requester. The id order is fixed
//! when the listing is created or restarted, visibility and permissions are
//! evaluated when an element is produced.
//------------------------------------------------------------------------------
class DatasetListing
{
public:
  DatasetListing(const Registry& registry, const common::VirtualIdentity& vid);

  //----------------------------------------------------------------------------
  //! Produce the next visible dataset
  //!
  //! @return true if ds was filled, false at the end of the listing
  //----------------------------------------------------------------------------
  bool Next(ns::DatasetMD& ds);

  //----------------------------------------------------------------------------
  //! Start again from the newest dataset with a fresh snapshot
  //----------------------------------------------------------------------------
  void Restart();

  //----------------------------------------------------------------------------
  //! Drain the rest of the listing
  //----------------------------------------------------------------------------
  std::vector<ns::DatasetMD> Collect();

private:
  const Registry& mRegistry;
  common::VirtualIdentity mVid;
  std::vector<std::string> mIds;
  size_t mPos {0};
};

//------------------------------------------------------------------------------
//! Dataset registry. Tracks datasets, their manifests, permissions and
//! version chains and persists every mutation in the catalog before it
//! becomes visible in memory.
//!
//! Every mutating call holds the exclusive lock of the datasets it touches,
//! reads hold the shared lock of the dataset they return.
//------------------------------------------------------------------------------
class Registry: public common::LogId
{
  friend class DatasetListing;

public:
  //----------------------------------------------------------------------------
  //! Constructor, loads the catalog contents
  //!
  //! @param store content store holding file payloads
  //! @param resolver group membership resolver, may be nullptr
  //! @param catalog durable catalog, an in-memory catalog is used if nullptr
  //! @param clock fakeable clock, nullptr for system time
  //!
  //! @throws ns::StoreError if the catalog can not be loaded
  //----------------------------------------------------------------------------
  Registry(store::IContentStore& store, IGroupResolver* resolver,
           std::unique_ptr<SqliteCatalog> catalog,
           common::SystemClock* clock = nullptr);

  virtual ~Registry() = default;

  //----------------------------------------------------------------------------
  //! Start a new dataset owned by the requester
  //!
  //! @param vid requester
  //! @param md descriptive metadata, md.uuid is used as id when given
  //! @param predecessor dataset replaced by the new one, if empty
  //!        md.replaces is used
  //!
  //! @return new dataset id
  //----------------------------------------------------------------------------
  std::string beginUpload(const common::VirtualIdentity& vid,
                          const ns::DatasetMetadata& md,
                          const std::string& predecessor = "");

  //----------------------------------------------------------------------------
  //! Append a manifest entry whose payload is already in the content store.
  //! Size and checksum are taken from the store, a checksum given in entry
  //! must match the stored payload.
  //!
  //! @return entry as recorded
  //----------------------------------------------------------------------------
  ns::FileEntry appendFile(const std::string& id,
                           const common::VirtualIdentity& vid,
                           const ns::FileEntry& entry);

  //----------------------------------------------------------------------------
  //! Verify the payload against the claimed hash and mark the dataset complete
  //----------------------------------------------------------------------------
  void completeUpload(const std::string& id, const common::VirtualIdentity& vid,
                      const std::string& claimed_hash);

  //----------------------------------------------------------------------------
  //! Return a dataset the requester may read
  //----------------------------------------------------------------------------
  ns::DatasetMD read(const std::string& id,
                     const common::VirtualIdentity& vid) const;

  //----------------------------------------------------------------------------
  //! Like read, but re-verifies the payload of a complete dataset
  //----------------------------------------------------------------------------
  ns::DatasetMD readVerified(const std::string& id,
                             const common::VirtualIdentity& vid) const;

  //----------------------------------------------------------------------------
  //! Return the verified bytes of a manifest entry
  //----------------------------------------------------------------------------
  std::string fetchFile(const std::string& id,
                        const common::VirtualIdentity& vid,
                        const std::string& name) const;

  //----------------------------------------------------------------------------
  //! Set the tombstone, idempotent
  //----------------------------------------------------------------------------
  void invalidate(const std::string& id, const common::VirtualIdentity& vid);

  //----------------------------------------------------------------------------
  //! Lazy listing of non-invalidated datasets readable by the requester,
  //! newest upload first
  //----------------------------------------------------------------------------
  DatasetListing listVisible(const common::VirtualIdentity& vid) const;

  //----------------------------------------------------------------------------
  //! Apply revokes and grants in one transaction, owner only
  //----------------------------------------------------------------------------
  void updatePermissions(const std::string& id,
                         const common::VirtualIdentity& vid,
                         const std::vector<Grant>& grants,
                         const std::vector<Grant>& revokes);

  //----------------------------------------------------------------------------
  //! Version chain containing a dataset, root first
  //----------------------------------------------------------------------------
  std::vector<std::string> chainOf(const std::string& id,
                                   const common::VirtualIdentity& vid) const;

  //----------------------------------------------------------------------------
  //! Permissions of a dataset
  //----------------------------------------------------------------------------
  PermissionListing permissionsOf(const std::string& id,
                                  const common::VirtualIdentity& vid) const;

  size_t numDatasets() const;

  //----------------------------------------------------------------------------
  //! Number of per-dataset mutexes currently referenced by an operation
  //----------------------------------------------------------------------------
  size_t numLockEntries() const
  {
    return mLocks.size();
  }

  //----------------------------------------------------------------------------
  //! Check descriptive metadata completeness
  //!
  //! @throws ns::ValidationError
  //----------------------------------------------------------------------------
  static void ValidateMetadata(const ns::DatasetMetadata& md);

  //----------------------------------------------------------------------------
  //! Check a manifest entry name
  //!
  //! @throws ns::ValidationError
  //----------------------------------------------------------------------------
  static void ValidateEntryName(const std::string& name);

private:
  store::IContentStore& mStore;
  std::unique_ptr<SqliteCatalog> mCatalog;
  common::SystemClock* mClock;
  HashVerifier mVerifier;
  PermissionMatrix mPermissions;
  VersionChain mChain;
  mutable LockTable mLocks;
  mutable common::RWMutex mMapMutex; ///< protects mDatasets
  std::map<std::string, ns::DatasetMD> mDatasets;

  //----------------------------------------------------------------------------
  //! Reload all state from the catalog
  //----------------------------------------------------------------------------
  void load();

  //----------------------------------------------------------------------------
  //! Copy of a dataset record
  //!
  //! @throws ns::NotFoundError
  //----------------------------------------------------------------------------
  ns::DatasetMD getCopy(const std::string& id) const;

  //----------------------------------------------------------------------------
  //! Publish a committed record in memory
  //----------------------------------------------------------------------------
  void publish(const ns::DatasetMD& ds);

  //----------------------------------------------------------------------------
  //! Throw ns::ForbiddenError unless the requester holds op on the dataset
  //----------------------------------------------------------------------------
  void requirePermission(const std::string& id,
                         const common::VirtualIdentity& vid,
                         Operation op) const;

  //----------------------------------------------------------------------------
  //! Ids sorted by upload time then id, both descending
  //----------------------------------------------------------------------------
  std::vector<std::string> snapshotIds() const;

  //----------------------------------------------------------------------------
  //! Visibility test used by listings, never throws for vanished datasets
  //----------------------------------------------------------------------------
  bool fetchVisible(const std::string& id, const common::VirtualIdentity& vid,
                    ns::DatasetMD& ds) const;

  int64_t now() const
  {
    return common::SystemClock::MicrosSinceEpoch(common::SystemClock::now(mClock));
  }
};

SCIDBREGISTRYNAMESPACE_END

#endif
