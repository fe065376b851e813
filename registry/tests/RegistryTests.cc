// ----------------------------------------------------------------------
// File: RegistryTests.cc
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

#include "gtest/gtest.h"
#include "registry/tests/TestsUtils.hh"
#include "namespace/MDException.hh"
#include "common/Logging.hh"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <thread>

using namespace scidb;
using namespace scidb::test;
using registry::Grant;
using registry::Operation;
using registry::Principal;

namespace
{
std::vector<std::string>
Ids(const std::vector<ns::DatasetMD>& datasets)
{
  std::vector<std::string> ids;

  for (const auto& ds : datasets) {
    ids.push_back(ds.getId());
  }

  return ids;
}
}

TEST_F(RegistryFixture, UploadLifecycle)
{
  std::string id = mRegistry->beginUpload(mUser, MakeMetadata("Lifecycle"));
  ASSERT_EQ(36u, id.length());
  ns::DatasetMD ds = mRegistry->read(id, mUser);
  ASSERT_EQ("alice", ds.getOwner());
  ASSERT_FALSE(ds.isComplete());
  ns::FileEntry recorded = append(id, "data/values.csv", "1,2,3\n");
  ASSERT_EQ(6u, recorded.size);
  ASSERT_EQ(registry::HashVerifier::EntryDigest("1,2,3\n"), recorded.checksum);
  append(id, "meta.json", "{}");
  mClock.advance(std::chrono::seconds(5));
  mRegistry->completeUpload(id, mUser, claim(id));
  ds = mRegistry->read(id, mUser);
  ASSERT_TRUE(ds.isComplete());
  ASSERT_EQ(claim(id), ds.getHash());
  ASSERT_EQ(8u, ds.getSize());
  ASSERT_EQ(2u, ds.getContent().size());
  ASSERT_EQ(common::SystemClock::MicrosSinceEpoch(mClock.GetTime()),
            ds.getUploadTime());
  ASSERT_EQ("1,2,3\n", mRegistry->fetchFile(id, mUser, "data/values.csv"));
  ASSERT_NO_THROW(mRegistry->readVerified(id, mUser));
  ASSERT_EQ(1u, mRegistry->numDatasets());
}

TEST_F(RegistryFixture, EmptyDatasetCompletes)
{
  std::string id = mRegistry->beginUpload(mUser, MakeMetadata());
  mRegistry->completeUpload(id, mUser, registry::HashVerifier::Compute({}));
  ns::DatasetMD ds = mRegistry->read(id, mUser);
  ASSERT_TRUE(ds.isComplete());
  ASSERT_EQ(0u, ds.getSize());
}

TEST_F(RegistryFixture, BeginUploadValidation)
{
  ASSERT_THROW(mRegistry->beginUpload(common::VirtualIdentity::Nobody(),
                                      MakeMetadata()), ns::ForbiddenError);
  ns::DatasetMetadata md = MakeMetadata();
  md.title = "  ";
  ASSERT_THROW(mRegistry->beginUpload(mUser, md), ns::ValidationError);
  md = MakeMetadata();
  md.author.clear();
  ASSERT_THROW(mRegistry->beginUpload(mUser, md), ns::ValidationError);
  md = MakeMetadata();
  md.email = "jane.example.org";
  ASSERT_THROW(mRegistry->beginUpload(mUser, md), ns::ValidationError);
  md = MakeMetadata();
  md.uuid = "not-a-uuid";
  ASSERT_THROW(mRegistry->beginUpload(mUser, md), ns::ValidationError);
  ASSERT_EQ(0u, mRegistry->numDatasets());
}

TEST_F(RegistryFixture, ContainerUuid)
{
  ns::DatasetMetadata md = MakeMetadata();
  md.uuid = "5C1F3A46-9A5B-4C8E-9F6A-2F0C7B1D3E44";
  std::string id = mRegistry->beginUpload(mUser, md);
  ASSERT_EQ("5c1f3a46-9a5b-4c8e-9f6a-2f0c7b1d3e44", id);
  // the same id can not be registered twice, whatever the case
  md.uuid = "5c1f3a46-9a5b-4c8e-9f6a-2f0c7b1d3e44";
  ASSERT_THROW(mRegistry->beginUpload(mOther, md), ns::ValidationError);
  ASSERT_EQ("alice", mRegistry->read(id, mUser).getOwner());
}

TEST_F(RegistryFixture, AppendChecks)
{
  std::string id = mRegistry->beginUpload(mUser, MakeMetadata());
  ns::FileEntry entry;
  entry.name = "a.txt";
  entry.content_reference = mStore.put("payload");
  ASSERT_THROW(mRegistry->appendFile(id, mOther, entry), ns::ForbiddenError);
  ASSERT_THROW(mRegistry->appendFile("unknown", mUser, entry),
               ns::NotFoundError);

  for (const char* name : {
         "", "/etc/passwd", "../escape", "a/../../b"
       }) {
    ns::FileEntry bad = entry;
    bad.name = name;
    ASSERT_THROW(mRegistry->appendFile(id, mUser, bad), ns::ValidationError)
        << "name=" << name;
  }

  ns::FileEntry nul = entry;
  nul.name = std::string("a\0b", 3);
  ASSERT_THROW(mRegistry->appendFile(id, mUser, nul), ns::ValidationError);
  ns::FileEntry unstored = entry;
  unstored.content_reference = "0000";
  ASSERT_THROW(mRegistry->appendFile(id, mUser, unstored), ns::ValidationError);
  ASSERT_NO_THROW(mRegistry->appendFile(id, mUser, entry));
  ASSERT_THROW(mRegistry->appendFile(id, mUser, entry), ns::ValidationError);
  ASSERT_EQ(1u, mRegistry->read(id, mUser).getContent().size());
}

TEST_F(RegistryFixture, AppendChecksumMismatch)
{
  std::string id = mRegistry->beginUpload(mUser, MakeMetadata());
  ns::FileEntry entry;
  entry.name = "a.txt";
  entry.content_reference = mStore.put("payload");
  entry.checksum = registry::HashVerifier::EntryDigest("other payload");

  try {
    mRegistry->appendFile(id, mUser, entry);
    FAIL() << "mismatching checksum was accepted";
  } catch (const ns::IntegrityError& e) {
    ASSERT_EQ("a.txt", e.getEntry());
    ASSERT_EQ(entry.checksum, e.getExpected());
    ASSERT_EQ(registry::HashVerifier::EntryDigest("payload"), e.getComputed());
  }

  ASSERT_TRUE(mRegistry->read(id, mUser).getContent().empty());
  // matching checksum in upper case is accepted
  entry.checksum = registry::HashVerifier::EntryDigest("payload");
  std::transform(entry.checksum.begin(), entry.checksum.end(),
                 entry.checksum.begin(), ::toupper);
  ASSERT_NO_THROW(mRegistry->appendFile(id, mUser, entry));
}

TEST_F(RegistryFixture, CompleteRetryAfterIntegrityError)
{
  std::string id = mRegistry->beginUpload(mUser, MakeMetadata());
  append(id, "a.txt", "first");
  append(id, "b.txt", "second");
  std::string wrong = registry::HashVerifier::Compute({{"a.txt", "first"}});

  try {
    mRegistry->completeUpload(id, mUser, wrong);
    FAIL() << "wrong claim was accepted";
  } catch (const ns::IntegrityError& e) {
    ASSERT_EQ(wrong, e.getExpected());
    ASSERT_EQ(claim(id), e.getComputed());
    ASSERT_TRUE(e.getEntry().empty());
  }

  // nothing changed, the upload can be completed with the right claim
  ns::DatasetMD ds = mRegistry->read(id, mUser);
  ASSERT_FALSE(ds.isComplete());
  ASSERT_TRUE(ds.getHash().empty());
  ASSERT_NO_THROW(mRegistry->completeUpload(id, mUser, claim(id)));
  ASSERT_THROW(mRegistry->completeUpload(id, mUser, claim(id)),
               ns::ImmutableError);
  ns::FileEntry late;
  late.name = "c.txt";
  late.content_reference = mStore.put("late");
  ASSERT_THROW(mRegistry->appendFile(id, mUser, late), ns::ImmutableError);
  ASSERT_THROW(mRegistry->completeUpload(id, mOther, claim(id)),
               ns::ImmutableError);
}

TEST_F(RegistryFixture, SealedDatasetImmutableForEveryone)
{
  std::string id = uploadComplete("Sealed");
  mRegistry->updatePermissions(id, mUser,
  {Grant{Principal::User("bob"), Operation::kWrite}}, {});
  ns::FileEntry late;
  late.name = "late.txt";
  late.content_reference = mStore.put("late");
  // owner, write grantee and a stranger all hit the sealed state
  ASSERT_THROW(mRegistry->appendFile(id, mUser, late), ns::ImmutableError);
  ASSERT_THROW(mRegistry->appendFile(id, mOther, late), ns::ImmutableError);
  ASSERT_THROW(mRegistry->appendFile(id, mThird, late), ns::ImmutableError);
  ASSERT_THROW(mRegistry->completeUpload(id, mThird, claim(id)),
               ns::ImmutableError);
  // an open upload still refuses strangers
  std::string open = mRegistry->beginUpload(mUser, MakeMetadata("Open"));
  ASSERT_THROW(mRegistry->appendFile(open, mThird, late), ns::ForbiddenError);
  ASSERT_THROW(mRegistry->completeUpload(open, mThird, claim(open)),
               ns::ForbiddenError);
  // invalidation seals an incomplete upload as well
  mRegistry->invalidate(open, mUser);
  ASSERT_THROW(mRegistry->appendFile(open, mThird, late), ns::ImmutableError);
  ASSERT_EQ(1u, mRegistry->read(id, mUser).getContent().size());
}

TEST_F(RegistryFixture, CompleteDetectsLostPayload)
{
  std::string id = mRegistry->beginUpload(mUser, MakeMetadata());
  ns::FileEntry entry = append(id, "a.txt", "to be damaged before completion");
  ASSERT_TRUE(mStore.corrupt(entry.content_reference, "x"));

  try {
    mRegistry->completeUpload(id, mUser, claim(id));
    FAIL() << "damaged payload was accepted";
  } catch (const ns::IntegrityError& e) {
    ASSERT_EQ("a.txt", e.getEntry());
  }

  ASSERT_FALSE(mRegistry->read(id, mUser).isComplete());
}

TEST_F(RegistryFixture, CorruptionAfterCompletion)
{
  std::string id = mRegistry->beginUpload(mUser, MakeMetadata());
  ns::FileEntry entry = append(id, "a.txt", "unique corruption payload");
  append(id, "b.txt", "intact payload");
  mRegistry->completeUpload(id, mUser, claim(id));
  ASSERT_TRUE(mStore.corrupt(entry.content_reference,
                             "UNIQUE CORRUPTION PAYLOAD"));
  // plain reads do not touch the payload
  ASSERT_NO_THROW(mRegistry->read(id, mUser));

  try {
    mRegistry->readVerified(id, mUser);
    FAIL() << "corruption not detected";
  } catch (const ns::IntegrityError& e) {
    ASSERT_EQ("a.txt", e.getEntry());
    ASSERT_EQ(claim(id), e.getExpected());
  }

  ASSERT_THROW(mRegistry->fetchFile(id, mUser, "a.txt"), ns::IntegrityError);
  ASSERT_EQ("intact payload", mRegistry->fetchFile(id, mUser, "b.txt"));
  ASSERT_THROW(mRegistry->fetchFile(id, mUser, "c.txt"), ns::NotFoundError);
}

TEST_F(RegistryFixture, LogLinesCarryRequester)
{
  common::Logging& g_logging = common::Logging::GetInstance();
  int priority = g_logging.gPriorityLevel;
  g_logging.SetLogPriority(LOG_INFO);
  std::string id = mRegistry->beginUpload(mOther, MakeMetadata("Logged"));
  std::vector<std::string> recent = g_logging.GetRecent(LOG_INFO, 1);
  g_logging.SetLogPriority(priority);
  ASSERT_EQ(1u, recent.size());
  ASSERT_NE(std::string::npos, recent[0].find("upload started"));
  ASSERT_NE(std::string::npos, recent[0].find(id));
  ASSERT_NE(std::string::npos, recent[0].find("name=bob"));
  ASSERT_NE(std::string::npos, recent[0].find("sec=local"));
}

TEST_F(RegistryFixture, LockTableStaysBounded)
{
  std::string id = uploadComplete("Locked");

  for (int i = 0; i < 1000; ++i) {
    std::string unknown = "unknown-" + std::to_string(i);
    ASSERT_THROW(mRegistry->read(unknown, mUser), ns::NotFoundError);
    ASSERT_THROW(mRegistry->chainOf(unknown, mUser), ns::NotFoundError);
    ASSERT_THROW(mRegistry->permissionsOf(unknown, mUser), ns::NotFoundError);
  }

  ASSERT_THROW(mRegistry->beginUpload(mUser, MakeMetadata("Orphan"),
                                      "5b1e9c1e-0000-4000-8000-000000000000"),
               ns::ChainConflictError);
  ASSERT_EQ(1u, mRegistry->listVisible(mUser).Collect().size());
  ASSERT_NO_THROW(mRegistry->read(id, mUser));
  ASSERT_EQ(0u, mRegistry->numLockEntries());
}

TEST_F(RegistryFixture, ReadPermissions)
{
  std::string id = uploadComplete("Private");
  ASSERT_THROW(mRegistry->read(id, mOther), ns::ForbiddenError);
  ASSERT_THROW(mRegistry->read(id, common::VirtualIdentity::Nobody()),
               ns::ForbiddenError);
  ASSERT_THROW(mRegistry->read("unknown", mUser), ns::NotFoundError);
  ASSERT_THROW(mRegistry->fetchFile(id, mOther, "a.txt"), ns::ForbiddenError);
  mRegistry->updatePermissions(id, mUser, {Grant{Principal::User("bob"), Operation::kRead}},
  {});
  ASSERT_NO_THROW(mRegistry->read(id, mOther));
  ASSERT_EQ("0123456789", mRegistry->fetchFile(id, mOther, "a.txt"));
  // read does not allow writing
  ASSERT_THROW(mRegistry->invalidate(id, mOther), ns::ForbiddenError);
  mRegistry->updatePermissions(id, mUser, {}, {Grant{Principal::User("bob"), Operation::kRead}});
  ASSERT_THROW(mRegistry->read(id, mOther), ns::ForbiddenError);
  // carol reads through her group
  ASSERT_THROW(mRegistry->read(id, mThird), ns::ForbiddenError);
  mRegistry->updatePermissions(id, mUser, {Grant{Principal::Group("physics"), Operation::kRead}},
  {});
  ASSERT_NO_THROW(mRegistry->read(id, mThird));
  ASSERT_THROW(mRegistry->read(id, mOther), ns::ForbiddenError);
}

TEST_F(RegistryFixture, UpdatePermissionsRules)
{
  std::string id = uploadComplete("Shared");
  mRegistry->updatePermissions(id, mUser, {Grant{Principal::User("bob"), Operation::kWrite}},
  {});
  // write permission does not make bob an owner
  ASSERT_THROW(mRegistry->updatePermissions(id, mOther,
  {Grant{Principal::User("bob"), Operation::kRead}}, {}),
  ns::ForbiddenError);
  ASSERT_THROW(mRegistry->updatePermissions(id, mUser,
  {Grant{Principal::User("bad name"), Operation::kRead}}, {}),
  ns::ValidationError);
  ASSERT_THROW(mRegistry->updatePermissions("unknown", mUser, {}, {}),
               ns::NotFoundError);
  // granting the owner is a no-op and revoking never removes ownership
  mRegistry->updatePermissions(id, mUser, {Grant{Principal::User("alice"), Operation::kRead}},
  {Grant{Principal::User("alice"), Operation::kWrite}});
  registry::PermissionListing listing = mRegistry->permissionsOf(id, mUser);
  ASSERT_EQ("alice", listing.owner);
  ASSERT_TRUE(listing.read_users.empty());
  ASSERT_EQ(std::set<std::string> {"bob"}, listing.write_users);
  ASSERT_NO_THROW(mRegistry->read(id, mUser));
  ASSERT_NO_THROW(mRegistry->invalidate(id, mUser));
  // bob may write but not read, listing the permissions needs read
  ASSERT_THROW(mRegistry->permissionsOf(id, mOther), ns::ForbiddenError);
}

TEST_F(RegistryFixture, ListVisible)
{
  std::string first = uploadComplete("First");
  std::string second = uploadComplete("Second");
  std::string third = uploadComplete("Third");
  std::string pending = mRegistry->beginUpload(mUser, MakeMetadata("Pending"));
  mClock.advance(std::chrono::seconds(1));
  // newest first, incomplete datasets included
  ASSERT_EQ((std::vector<std::string> {pending, third, second, first}),
            Ids(mRegistry->listVisible(mUser).Collect()));
  ASSERT_TRUE(mRegistry->listVisible(mOther).Collect().empty());
  ASSERT_TRUE(mRegistry->listVisible(common::VirtualIdentity::Nobody())
              .Collect().empty());
  mRegistry->updatePermissions(second, mUser, {Grant{Principal::User("bob"), Operation::kRead}},
  {});
  mRegistry->updatePermissions(first, mUser, {Grant{Principal::Group("physics"), Operation::kRead}},
  {});
  ASSERT_EQ(std::vector<std::string> {second},
            Ids(mRegistry->listVisible(mOther).Collect()));
  ASSERT_EQ(std::vector<std::string> {first},
            Ids(mRegistry->listVisible(mThird).Collect()));
  mRegistry->invalidate(third, mUser);
  ASSERT_EQ((std::vector<std::string> {pending, second, first}),
            Ids(mRegistry->listVisible(mUser).Collect()));
  // invalidated datasets stay readable by id
  ASSERT_TRUE(mRegistry->read(third, mUser).isInvalidated());
}

TEST_F(RegistryFixture, ListingSnapshotAndRestart)
{
  std::string first = uploadComplete("First");
  registry::DatasetListing listing = mRegistry->listVisible(mUser);
  std::string second = uploadComplete("Second");
  ns::DatasetMD ds;
  ASSERT_TRUE(listing.Next(ds));
  ASSERT_EQ(first, ds.getId());
  ASSERT_FALSE(listing.Next(ds));
  listing.Restart();
  ASSERT_EQ((std::vector<std::string> {second, first}), Ids(listing.Collect()));
}

TEST_F(RegistryFixture, SameUploadTimeOrderedById)
{
  std::string a = mRegistry->beginUpload(mUser, MakeMetadata("A"));
  std::string b = mRegistry->beginUpload(mUser, MakeMetadata("B"));
  std::vector<std::string> ids = Ids(mRegistry->listVisible(mUser).Collect());
  ASSERT_EQ(2u, ids.size());
  ASSERT_EQ(std::max(a, b), ids[0]);
  ASSERT_EQ(std::min(a, b), ids[1]);
}

TEST_F(RegistryFixture, Invalidate)
{
  std::string id = mRegistry->beginUpload(mUser, MakeMetadata());
  append(id, "a.txt", "payload");
  mRegistry->invalidate(id, mUser);
  ASSERT_NO_THROW(mRegistry->invalidate(id, mUser));
  ns::FileEntry entry;
  entry.name = "b.txt";
  entry.content_reference = mStore.put("more");
  ASSERT_THROW(mRegistry->appendFile(id, mUser, entry), ns::ImmutableError);
  ASSERT_THROW(mRegistry->completeUpload(id, mUser, claim(id)),
               ns::ImmutableError);
  ASSERT_THROW(mRegistry->updatePermissions(id, mUser, {}, {}),
               ns::ImmutableError);
  ASSERT_THROW(mRegistry->invalidate(id, mOther), ns::ForbiddenError);
  ASSERT_EQ("payload", mRegistry->fetchFile(id, mUser, "a.txt"));
}

TEST_F(RegistryFixture, VersionChain)
{
  std::string v1 = uploadComplete("v1");
  std::string v2 = uploadComplete("v2", v1);
  ns::DatasetMetadata md = MakeMetadata("v3");
  md.replaces = v2;
  std::string v3 = mRegistry->beginUpload(mUser, md);
  ASSERT_EQ(v2, mRegistry->read(v3, mUser).getReplaces());
  std::vector<std::string> chain {v1, v2, v3};
  ASSERT_EQ(chain, mRegistry->chainOf(v1, mUser));
  ASSERT_EQ(chain, mRegistry->chainOf(v3, mUser));
  ASSERT_THROW(mRegistry->chainOf(v1, mOther), ns::ForbiddenError);
  ASSERT_THROW(mRegistry->chainOf("unknown", mUser), ns::NotFoundError);
}

TEST_F(RegistryFixture, ChainConflicts)
{
  std::string v1 = uploadComplete("v1");
  std::string v2 = uploadComplete("v2", v1);
  size_t known = mRegistry->numDatasets();
  ASSERT_THROW(mRegistry->beginUpload(mUser, MakeMetadata("fork"), v1),
               ns::ChainConflictError);
  ASSERT_THROW(mRegistry->beginUpload(mUser, MakeMetadata("orphan"),
                                      "3b0c6f1e-0000-4000-8000-000000000000"),
               ns::ChainConflictError);
  ns::DatasetMetadata md = MakeMetadata("disagree");
  md.replaces = v1;
  ASSERT_THROW(mRegistry->beginUpload(mUser, md, v2), ns::ValidationError);
  // replacing needs write permission on the predecessor
  ASSERT_THROW(mRegistry->beginUpload(mOther, MakeMetadata("foreign"), v2),
               ns::ForbiddenError);
  ASSERT_EQ(known, mRegistry->numDatasets());
  mRegistry->updatePermissions(v2, mUser, {Grant{Principal::User("bob"), Operation::kWrite}},
  {});
  std::string v3 = mRegistry->beginUpload(mOther, MakeMetadata("by bob"), v2);
  ASSERT_EQ("bob", mRegistry->read(v3, mOther).getOwner());
  ASSERT_THROW(mRegistry->read(v3, mUser), ns::ForbiddenError);
}

TEST_F(RegistryFixture, ConcurrentSuccessors)
{
  std::string v1 = uploadComplete("v1");
  const int nthreads = 8;
  std::atomic<int> succeeded {0};
  std::atomic<int> conflicts {0};
  std::vector<std::thread> threads;

  for (int i = 0; i < nthreads; ++i) {
    threads.emplace_back([&, i]() {
      try {
        mRegistry->beginUpload(mUser, MakeMetadata("racer " + std::to_string(i)),
                               v1);
        ++succeeded;
      } catch (const ns::ChainConflictError& e) {
        ++conflicts;
      }
    });
  }

  for (auto& t : threads) {
    t.join();
  }

  ASSERT_EQ(1, succeeded.load());
  ASSERT_EQ(nthreads - 1, conflicts.load());
  ASSERT_EQ(2u, mRegistry->chainOf(v1, mUser).size());
  ASSERT_EQ(2u, mRegistry->numDatasets());
}

TEST_F(RegistryFixture, ConcurrentAppends)
{
  std::string id = mRegistry->beginUpload(mUser, MakeMetadata());
  const int nthreads = 8;
  std::vector<std::string> refs;

  for (int i = 0; i < nthreads; ++i) {
    refs.push_back(mStore.put("payload " + std::to_string(i)));
  }

  std::vector<std::thread> threads;

  for (int i = 0; i < nthreads; ++i) {
    threads.emplace_back([&, i]() {
      ns::FileEntry entry;
      entry.name = "file" + std::to_string(i);
      entry.content_reference = refs[i];
      mRegistry->appendFile(id, mUser, entry);
    });
  }

  for (auto& t : threads) {
    t.join();
  }

  std::map<std::string, std::string> payloads;

  for (int i = 0; i < nthreads; ++i) {
    payloads["file" + std::to_string(i)] = "payload " + std::to_string(i);
  }

  ASSERT_EQ((size_t) nthreads, mRegistry->read(id, mUser).getContent().size());
  ASSERT_NO_THROW(mRegistry->completeUpload(id, mUser,
                  registry::HashVerifier::Compute(payloads)));
}

TEST_F(RegistryFixture, CatalogFailureLeavesNoTrace)
{
  std::string v1 = uploadComplete("v1");
  mCatalog->injectCommitFailure();
  ASSERT_THROW(mRegistry->beginUpload(mUser, MakeMetadata("v2"), v1),
               ns::StoreError);
  ASSERT_EQ(1u, mRegistry->numDatasets());
  ASSERT_EQ(std::vector<std::string> {v1}, mRegistry->chainOf(v1, mUser));
  // the predecessor is free again
  std::string v2 = mRegistry->beginUpload(mUser, MakeMetadata("v2"), v1);
  mCatalog->injectCommitFailure();
  ns::FileEntry entry;
  entry.name = "a.txt";
  entry.content_reference = mStore.put("payload");
  ASSERT_THROW(mRegistry->appendFile(v2, mUser, entry), ns::StoreError);
  ASSERT_TRUE(mRegistry->read(v2, mUser).getContent().empty());
  mCatalog->injectCommitFailure();
  ASSERT_THROW(mRegistry->updatePermissions(v2, mUser,
  {Grant{Principal::User("bob"), Operation::kRead}}, {}), ns::StoreError);
  ASSERT_THROW(mRegistry->read(v2, mOther), ns::ForbiddenError);
}

TEST_F(RegistryFixture, RestartRestoresState)
{
  TmpDir tmp;
  std::string path = tmp.path() + "/catalog.db";
  reopen(path);
  std::string v1 = uploadComplete("v1");
  std::string v2 = uploadComplete("v2", v1);
  std::string pending = mRegistry->beginUpload(mUser, MakeMetadata("pending"));
  append(pending, "partial.txt", "partial");
  mRegistry->updatePermissions(v1, mUser, {Grant{Principal::User("bob"), Operation::kRead},
    Grant{Principal::Group("physics"), Operation::kWrite}
  }, {});
  mRegistry->invalidate(v2, mUser);
  std::vector<std::string> listed = Ids(mRegistry->listVisible(mUser).Collect());
  reopen(path);
  ASSERT_EQ(3u, mRegistry->numDatasets());
  ASSERT_EQ(listed, Ids(mRegistry->listVisible(mUser).Collect()));
  ASSERT_EQ((std::vector<std::string> {v1, v2}), mRegistry->chainOf(v1, mUser));
  ASSERT_TRUE(mRegistry->read(v2, mUser).isInvalidated());
  ASSERT_NO_THROW(mRegistry->read(v1, mOther));
  registry::PermissionListing listing = mRegistry->permissionsOf(v1, mUser);
  ASSERT_EQ(std::set<std::string> {"physics"}, listing.write_groups);
  // an incomplete upload can be continued after the restart
  append(pending, "rest.txt", "rest");
  ASSERT_NO_THROW(mRegistry->completeUpload(pending, mUser, claim(pending)));
  ASSERT_NO_THROW(mRegistry->readVerified(v1, mUser));
  ASSERT_THROW(mRegistry->beginUpload(mUser, MakeMetadata("fork"), v1),
               ns::ChainConflictError);
}
