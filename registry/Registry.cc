// ----------------------------------------------------------------------
// File: Registry.cc
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

#include "registry/Registry.hh"
#include "registry/GroupResolver.hh"
#include "common/StringConversion.hh"
#include "common/Timing.hh"
#include "namespace/MDException.hh"
#include <uuid/uuid.h>
#include <algorithm>
#include <cctype>

SCIDBREGISTRYNAMESPACE_BEGIN

namespace
{
//------------------------------------------------------------------------------
// Principal names accepted in permission updates
//------------------------------------------------------------------------------
bool
IsValidPrincipalName(const std::string& name)
{
  if (name.empty()) {
    return false;
  }

  for (char c : name) {
    if (!isalnum(static_cast<unsigned char>(c)) && (c != '.') && (c != '_') &&
        (c != '@') && (c != '-')) {
      return false;
    }
  }

  return true;
}
}

//------------------------------------------------------------------------------
// Listing constructor
//------------------------------------------------------------------------------
DatasetListing::DatasetListing(const Registry& registry,
                               const common::VirtualIdentity& vid):
  mRegistry(registry), mVid(vid)
{
  Restart();
}

//------------------------------------------------------------------------------
// Restart listing
//------------------------------------------------------------------------------
void
DatasetListing::Restart()
{
  mIds = mRegistry.snapshotIds();
  mPos = 0;
}

//------------------------------------------------------------------------------
// Next visible dataset
//------------------------------------------------------------------------------
bool
DatasetListing::Next(ns::DatasetMD& ds)
{
  while (mPos < mIds.size()) {
    if (mRegistry.fetchVisible(mIds[mPos++], mVid, ds)) {
      return true;
    }
  }

  return false;
}

//------------------------------------------------------------------------------
// Drain listing
//------------------------------------------------------------------------------
std::vector<ns::DatasetMD>
DatasetListing::Collect()
{
  std::vector<ns::DatasetMD> out;
  ns::DatasetMD ds;

  while (Next(ds)) {
    out.push_back(ds);
  }

  return out;
}

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
Registry::Registry(store::IContentStore& store, IGroupResolver* resolver,
                   std::unique_ptr<SqliteCatalog> catalog,
                   common::SystemClock* clock):
  mStore(store), mCatalog(std::move(catalog)), mClock(clock),
  mVerifier(store), mPermissions(resolver)
{
  SetLogId(nullptr, common::gLogging.gZeroVid, "registry");
  mMapMutex.SetName("Registry::mDatasets");

  if (!mCatalog) {
    mCatalog.reset(new SqliteCatalog(":memory:"));
  }

  load();
}

//------------------------------------------------------------------------------
// Reload all state from the catalog
//------------------------------------------------------------------------------
void
Registry::load()
{
  CatalogState state = mCatalog->loadAll();
  common::RWMutexWriteLock wr_lock(mMapMutex);

  for (auto& ds : state.datasets) {
    std::string id = ds.getId();
    mPermissions.registerDataset(id, ds.getOwner());
    mChain.registerDataset(id);
    mDatasets[id] = std::move(ds);
  }

  for (const auto& perm : state.permissions) {
    if (!mDatasets.count(perm.first)) {
      scidb_warning("msg=\"permission entry for unknown dataset\" id=%s "
                    "principal=%s", perm.first.c_str(),
                    perm.second.principal.ToString().c_str());
      continue;
    }

    mPermissions.grant(perm.first, perm.second.principal, perm.second.op);
  }

  for (const auto& link : state.links) {
    try {
      mChain.link(link.first, link.second);
    } catch (const ns::ChainConflictError& e) {
      scidb_err("msg=\"dropping inconsistent chain link\" successor=%s "
                "predecessor=%s err=\"%s\"", link.first.c_str(),
                link.second.c_str(), e.what());
    }
  }

  scidb_info("msg=\"registry loaded\" catalog=%s datasets=%lu links=%lu",
             mCatalog->getPath().c_str(), mDatasets.size(), mChain.numLinks());
}

//------------------------------------------------------------------------------
// Copy of a dataset record
//------------------------------------------------------------------------------
ns::DatasetMD
Registry::getCopy(const std::string& id) const
{
  common::RWMutexReadLock rd_lock(mMapMutex);
  auto it = mDatasets.find(id);

  if (it == mDatasets.end()) {
    throw_nsexception(ns::NotFoundError, "no such dataset " << id);
  }

  return it->second;
}

//------------------------------------------------------------------------------
// Publish a committed record
//------------------------------------------------------------------------------
void
Registry::publish(const ns::DatasetMD& ds)
{
  common::RWMutexWriteLock wr_lock(mMapMutex);
  mDatasets[ds.getId()] = ds;
}

//------------------------------------------------------------------------------
// Permission gate
//------------------------------------------------------------------------------
void
Registry::requirePermission(const std::string& id,
                            const common::VirtualIdentity& vid,
                            Operation op) const
{
  if (vid.isNobody() ||
      !mPermissions.check(id, Principal::User(vid.name), op)) {
    throw_nsexception(ns::ForbiddenError, "user " << vid.name << " has no "
                      << OperationToString(op) << " permission on dataset "
                      << id);
  }
}

size_t
Registry::numDatasets() const
{
  common::RWMutexReadLock rd_lock(mMapMutex);
  return mDatasets.size();
}

//------------------------------------------------------------------------------
// Metadata completeness
//------------------------------------------------------------------------------
void
Registry::ValidateMetadata(const ns::DatasetMetadata& md)
{
  if (common::StringConversion::Trim(md.title).empty()) {
    throw_nsexception(ns::ValidationError, "metadata misses the title");
  }

  if (common::StringConversion::Trim(md.author).empty()) {
    throw_nsexception(ns::ValidationError, "metadata misses the author");
  }

  if (common::StringConversion::Trim(md.email).empty()) {
    throw_nsexception(ns::ValidationError, "metadata misses the email");
  }

  if (md.email.find('@') == std::string::npos) {
    throw_nsexception(ns::ValidationError, "invalid email address \""
                      << md.email << "\"");
  }
}

//------------------------------------------------------------------------------
// Entry name check
//------------------------------------------------------------------------------
void
Registry::ValidateEntryName(const std::string& name)
{
  if (name.empty()) {
    throw_nsexception(ns::ValidationError, "empty entry name");
  }

  if (name[0] == '/') {
    throw_nsexception(ns::ValidationError, "absolute entry name \"" << name
                      << "\"");
  }

  if (name.find('\0') != std::string::npos) {
    throw_nsexception(ns::ValidationError, "entry name contains a NUL byte");
  }

  std::vector<std::string> parts;
  common::StringConversion::Tokenize(name, parts, "/");

  for (const auto& part : parts) {
    if (part == "..") {
      throw_nsexception(ns::ValidationError, "entry name \"" << name
                        << "\" leaves the container");
    }
  }
}

//------------------------------------------------------------------------------
// Begin upload
//------------------------------------------------------------------------------
std::string
Registry::beginUpload(const common::VirtualIdentity& vid,
                      const ns::DatasetMetadata& md,
                      const std::string& predecessor)
{
  if (vid.isNobody()) {
    throw_nsexception(ns::ForbiddenError, "anonymous uploads are not allowed");
  }

  ValidateMetadata(md);
  std::string pred = predecessor.empty() ? md.replaces : predecessor;

  if (!predecessor.empty() && !md.replaces.empty() &&
      (predecessor != md.replaces)) {
    throw_nsexception(ns::ValidationError, "declared predecessor " << predecessor
                      << " differs from container predecessor " << md.replaces);
  }

  std::string id;

  if (!md.uuid.empty()) {
    uuid_t parsed;

    if (uuid_parse(md.uuid.c_str(), parsed)) {
      throw_nsexception(ns::ValidationError, "invalid dataset uuid \""
                        << md.uuid << "\"");
    }

    char normalized[40];
    uuid_unparse_lower(parsed, normalized);
    id = normalized;
  } else {
    uuid_t fresh;
    char normalized[40];
    uuid_generate_random(fresh);
    uuid_unparse_lower(fresh, normalized);
    id = normalized;
  }

  DatasetWriteLock ds_lock(mLocks, std::vector<std::string> {id, pred});

  if (mPermissions.hasDataset(id)) {
    throw_nsexception(ns::ValidationError, "dataset " << id
                      << " already exists");
  }

  if (!pred.empty()) {
    if (!mChain.hasDataset(pred)) {
      throw_nsexception(ns::ChainConflictError, "predecessor " << pred
                        << " does not exist");
    }

    requirePermission(pred, vid, Operation::kWrite);
  }

  ns::DatasetMD ds = ns::DatasetMD::Create(id, vid.name, md, now());

  if (!pred.empty()) {
    ds.setReplaces(pred);
  }

  CatalogBatch batch;
  batch.upsertDataset(ds);

  if (!pred.empty()) {
    batch.addLink(id, pred);
  }

  // The chain decides races on the predecessor, the link is undone if the
  // catalog does not take the new dataset
  mChain.registerDataset(id);

  try {
    if (!pred.empty()) {
      mChain.link(id, pred);
    }

    mCatalog->commit(batch);
  } catch (const ns::MDException& e) {
    mChain.unlink(id);
    mChain.forgetDataset(id);
    scidb_err("msg=\"upload not started\" id=%s replaces=%s err=\"%s\"",
              id.c_str(), pred.c_str(), e.what());
    throw;
  }

  mPermissions.registerDataset(id, vid.name);
  publish(ds);
  scidb_info("msg=\"upload started\" id=%s owner=%s replaces=%s title=\"%s\"",
             id.c_str(), vid.name.c_str(), pred.c_str(), md.title.c_str());
  return id;
}

//------------------------------------------------------------------------------
// Append file
//------------------------------------------------------------------------------
ns::FileEntry
Registry::appendFile(const std::string& id, const common::VirtualIdentity& vid,
                     const ns::FileEntry& entry)
{
  DatasetWriteLock ds_lock(mLocks, id);
  ns::DatasetMD ds = getCopy(id);

  // a sealed dataset is immutable for every requester
  if (ds.isInvalidated()) {
    throw_nsexception(ns::ImmutableError, "dataset " << id
                      << " is invalidated");
  }

  if (ds.isComplete()) {
    throw_nsexception(ns::ImmutableError, "dataset " << id << " is complete");
  }

  requirePermission(id, vid, Operation::kWrite);

  ValidateEntryName(entry.name);
  ns::FileEntry existing;

  if (ds.findEntry(entry.name, existing)) {
    throw_nsexception(ns::ValidationError, "dataset " << id
                      << " already has an entry \"" << entry.name << "\"");
  }

  std::string bytes;

  try {
    bytes = mStore.get(entry.content_reference);
  } catch (const ns::NotFoundError& e) {
    throw_nsexception(ns::ValidationError, "content of entry \"" << entry.name
                      << "\" is not stored: " << e.what());
  }

  ns::FileEntry recorded;
  recorded.name = entry.name;
  recorded.content_reference = entry.content_reference;
  recorded.size = bytes.length();
  recorded.checksum = HashVerifier::EntryDigest(bytes);
  recorded.preview = entry.preview;

  if (!entry.checksum.empty() &&
      (common::StringConversion::ToLower(entry.checksum) != recorded.checksum)) {
    ns::IntegrityError err;
    err.getMessage() << "checksum mismatch for entry \"" << entry.name
                     << "\" of dataset " << id;
    err.setDetails(entry.name, entry.checksum, recorded.checksum);
    scidb_warning("msg=\"%s\"", err.what());
    throw err;
  }

  ds.appendEntry(recorded);
  CatalogBatch batch;
  batch.upsertDataset(ds);
  mCatalog->commit(batch);
  publish(ds);
  scidb_debug("msg=\"entry appended\" id=%s name=\"%s\" size=%llu",
              id.c_str(), recorded.name.c_str(),
              (unsigned long long) recorded.size);
  return recorded;
}

//------------------------------------------------------------------------------
// Complete upload
//------------------------------------------------------------------------------
void
Registry::completeUpload(const std::string& id,
                         const common::VirtualIdentity& vid,
                         const std::string& claimed_hash)
{
  DatasetWriteLock ds_lock(mLocks, id);
  ns::DatasetMD ds = getCopy(id);

  if (ds.isInvalidated()) {
    throw_nsexception(ns::ImmutableError, "dataset " << id
                      << " is invalidated");
  }

  if (ds.isComplete()) {
    throw_nsexception(ns::ImmutableError, "dataset " << id
                      << " is already complete");
  }

  requirePermission(id, vid, Operation::kWrite);

  VerificationReport report = mVerifier.Verify(ds.getContent(), claimed_hash);

  if (!report.match) {
    ns::IntegrityError err;
    err.getMessage() << "verification of dataset " << id << " failed: "
                     << report.reason;
    err.setDetails(report.failed_entry, claimed_hash, report.computed);
    scidb_warning("msg=\"upload verification failed\" id=%s %s", id.c_str(),
                  report.ToString().c_str());
    throw err;
  }

  ds.setComplete(report.computed, now());
  CatalogBatch batch;
  batch.upsertDataset(ds);
  mCatalog->commit(batch);
  publish(ds);
  scidb_info("msg=\"upload complete\" id=%s hash=%s size=%llu upload_time=%s",
             id.c_str(), report.computed.c_str(),
             (unsigned long long) ds.getSize(),
             common::Timing::Micros_to_ISO8601(ds.getUploadTime()).c_str());
}

//------------------------------------------------------------------------------
// Read
//------------------------------------------------------------------------------
ns::DatasetMD
Registry::read(const std::string& id, const common::VirtualIdentity& vid) const
{
  DatasetReadLock ds_lock(mLocks, id);
  ns::DatasetMD ds = getCopy(id);
  requirePermission(id, vid, Operation::kRead);
  return ds;
}

//------------------------------------------------------------------------------
// Read and verify
//------------------------------------------------------------------------------
ns::DatasetMD
Registry::readVerified(const std::string& id,
                       const common::VirtualIdentity& vid) const
{
  ns::DatasetMD ds = read(id, vid);

  if (!ds.isComplete()) {
    return ds;
  }

  VerificationReport report = mVerifier.Verify(ds.getContent(), ds.getHash());

  if (!report.match) {
    ns::IntegrityError err;
    err.getMessage() << "stored payload of dataset " << id
                     << " is corrupted: " << report.reason;
    err.setDetails(report.failed_entry, ds.getHash(), report.computed);
    scidb_err("msg=\"payload corruption detected\" id=%s %s", id.c_str(),
              report.ToString().c_str());
    throw err;
  }

  return ds;
}

//------------------------------------------------------------------------------
// Fetch file bytes
//------------------------------------------------------------------------------
std::string
Registry::fetchFile(const std::string& id, const common::VirtualIdentity& vid,
                    const std::string& name) const
{
  ns::DatasetMD ds = read(id, vid);
  ns::FileEntry entry;

  if (!ds.findEntry(name, entry)) {
    throw_nsexception(ns::NotFoundError, "dataset " << id << " has no entry \""
                      << name << "\"");
  }

  std::string bytes;

  try {
    bytes = mStore.get(entry.content_reference);
  } catch (const ns::NotFoundError& e) {
    ns::IntegrityError err;
    err.getMessage() << "content of entry \"" << name << "\" of dataset " << id
                     << " is missing";
    err.setDetails(name, entry.checksum, "");
    throw err;
  }

  std::string digest = HashVerifier::EntryDigest(bytes);

  if ((bytes.length() != entry.size) || (digest != entry.checksum)) {
    ns::IntegrityError err;
    err.getMessage() << "content of entry \"" << name << "\" of dataset " << id
                     << " is corrupted";
    err.setDetails(name, entry.checksum, digest);
    scidb_err("msg=\"entry corruption detected\" id=%s name=\"%s\" "
              "expected=%s computed=%s", id.c_str(), name.c_str(),
              entry.checksum.c_str(), digest.c_str());
    throw err;
  }

  return bytes;
}

//------------------------------------------------------------------------------
// Invalidate
//------------------------------------------------------------------------------
void
Registry::invalidate(const std::string& id, const common::VirtualIdentity& vid)
{
  DatasetWriteLock ds_lock(mLocks, id);
  ns::DatasetMD ds = getCopy(id);
  requirePermission(id, vid, Operation::kWrite);

  if (ds.isInvalidated()) {
    return;
  }

  ds.setInvalidated();
  CatalogBatch batch;
  batch.upsertDataset(ds);
  mCatalog->commit(batch);
  publish(ds);
  scidb_info("msg=\"dataset invalidated\" id=%s by=%s", id.c_str(),
             vid.name.c_str());
}

//------------------------------------------------------------------------------
// Snapshot ids in listing order
//------------------------------------------------------------------------------
std::vector<std::string>
Registry::snapshotIds() const
{
  std::vector<std::pair<int64_t, std::string>> order;
  {
    common::RWMutexReadLock rd_lock(mMapMutex);
    order.reserve(mDatasets.size());

    for (const auto& it : mDatasets) {
      order.emplace_back(it.second.getUploadTime(), it.first);
    }
  }
  std::sort(order.begin(), order.end(),
  [](const std::pair<int64_t, std::string>& a,
  const std::pair<int64_t, std::string>& b) {
    return a > b;
  });
  std::vector<std::string> ids;
  ids.reserve(order.size());

  for (auto& it : order) {
    ids.push_back(std::move(it.second));
  }

  return ids;
}

//------------------------------------------------------------------------------
// Visibility test for listings
//------------------------------------------------------------------------------
bool
Registry::fetchVisible(const std::string& id,
                       const common::VirtualIdentity& vid,
                       ns::DatasetMD& ds) const
{
  if (vid.isNobody()) {
    return false;
  }

  DatasetReadLock ds_lock(mLocks, id);
  {
    common::RWMutexReadLock rd_lock(mMapMutex);
    auto it = mDatasets.find(id);

    if ((it == mDatasets.end()) || it->second.isInvalidated()) {
      return false;
    }

    ds = it->second;
  }
  return mPermissions.check(id, Principal::User(vid.name), Operation::kRead);
}

//------------------------------------------------------------------------------
// Listing
//------------------------------------------------------------------------------
DatasetListing
Registry::listVisible(const common::VirtualIdentity& vid) const
{
  return DatasetListing(*this, vid);
}

//------------------------------------------------------------------------------
// Update permissions
//------------------------------------------------------------------------------
void
Registry::updatePermissions(const std::string& id,
                            const common::VirtualIdentity& vid,
                            const std::vector<Grant>& grants,
                            const std::vector<Grant>& revokes)
{
  DatasetWriteLock ds_lock(mLocks, id);
  ns::DatasetMD ds = getCopy(id);

  if (vid.isNobody() || (ds.getOwner() != vid.name)) {
    throw_nsexception(ns::ForbiddenError, "only the owner may change "
                      "permissions of dataset " << id);
  }

  if (ds.isInvalidated()) {
    throw_nsexception(ns::ImmutableError, "dataset " << id
                      << " is invalidated");
  }

  for (const auto* list : {
         &revokes, &grants
       }) {
    for (const auto& grant : *list) {
      if (!IsValidPrincipalName(grant.principal.name)) {
        throw_nsexception(ns::ValidationError, "invalid principal name \""
                          << grant.principal.name << "\"");
      }
    }
  }

  CatalogBatch batch;

  for (const auto& revoke : revokes) {
    batch.removePermission(id, revoke);
  }

  for (const auto& grant : grants) {
    if (grant.principal.isUser() && (grant.principal.name == ds.getOwner())) {
      continue;
    }

    batch.addPermission(id, grant);
  }

  mCatalog->commit(batch);

  for (const auto& revoke : revokes) {
    mPermissions.revoke(id, revoke.principal, revoke.op);
  }

  for (const auto& grant : grants) {
    mPermissions.grant(id, grant.principal, grant.op);
  }

  scidb_info("msg=\"permissions updated\" id=%s grants=\"%s\" revokes=\"%s\"",
             id.c_str(), PermissionMatrix::SerializeRules(grants).c_str(),
             PermissionMatrix::SerializeRules(revokes).c_str());
}

//------------------------------------------------------------------------------
// Chain of a dataset
//------------------------------------------------------------------------------
std::vector<std::string>
Registry::chainOf(const std::string& id,
                  const common::VirtualIdentity& vid) const
{
  DatasetReadLock ds_lock(mLocks, id);
  getCopy(id);
  requirePermission(id, vid, Operation::kRead);
  return mChain.chainOf(id);
}

//------------------------------------------------------------------------------
// Permissions of a dataset
//------------------------------------------------------------------------------
PermissionListing
Registry::permissionsOf(const std::string& id,
                        const common::VirtualIdentity& vid) const
{
  DatasetReadLock ds_lock(mLocks, id);
  getCopy(id);
  requirePermission(id, vid, Operation::kRead);
  return mPermissions.list(id);
}

SCIDBREGISTRYNAMESPACE_END
