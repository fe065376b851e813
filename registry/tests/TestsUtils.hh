// ----------------------------------------------------------------------
// File: TestsUtils.hh
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

#ifndef __SCIDBREGISTRY_TESTS_TESTSUTILS_HH__
#define __SCIDBREGISTRY_TESTS_TESTSUTILS_HH__

#include "gtest/gtest.h"
#include "common/SystemClock.hh"
#include "common/VirtualIdentity.hh"
#include "namespace/DatasetMD.hh"
#include "registry/GroupResolver.hh"
#include "registry/HashVerifier.hh"
#include "registry/Registry.hh"
#include "store/MemoryContentStore.hh"
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <memory>
#include <string>
#include <unistd.h>

namespace scidb
{
namespace test
{

//------------------------------------------------------------------------------
//! Global test environment
//------------------------------------------------------------------------------
class TestsEnv : public ::testing::Environment
{
public:
  static bool verbose;
};

//------------------------------------------------------------------------------
//! Minimal valid metadata
//------------------------------------------------------------------------------
inline ns::DatasetMetadata
MakeMetadata(const std::string& title = "Test dataset")
{
  ns::DatasetMetadata md;
  md.title = title;
  md.author = "Jane Doe";
  md.email = "jane.doe@example.org";
  md.model_version = "0.6";
  md.container_type = {"TestType", "1.0", ""};
  return md;
}

//------------------------------------------------------------------------------
//! Temporary directory removed when going out of scope
//------------------------------------------------------------------------------
class TmpDir
{
public:
  TmpDir()
  {
    char tmpl[] = "/tmp/scidb-test.XXXXXX";
    char* dir = mkdtemp(tmpl);
    mPath = dir ? dir : "";
  }

  ~TmpDir()
  {
    if (!mPath.empty()) {
      std::string cmd = "rm -rf " + mPath;
      (void) !system(cmd.c_str());
    }
  }

  const std::string& path() const
  {
    return mPath;
  }

private:
  std::string mPath;
};

//------------------------------------------------------------------------------
//! Fixture with a registry over a memory store, a static group table and a
//! fake clock
//------------------------------------------------------------------------------
class RegistryFixture : public ::testing::Test
{
public:
  RegistryFixture():
    mClock(true), mUser(common::VirtualIdentity::User("alice")),
    mOther(common::VirtualIdentity::User("bob")),
    mThird(common::VirtualIdentity::User("carol"))
  {
    mClock.advance(std::chrono::hours(24 * 365 * 50));
    mGroups.addMember("physics", "carol");
  }

  void SetUp() override
  {
    reopen(":memory:");
  }

  //----------------------------------------------------------------------------
  //! (Re)create the registry on the given catalog
  //----------------------------------------------------------------------------
  void reopen(const std::string& catalog)
  {
    mRegistry.reset();
    mCatalog = new registry::SqliteCatalog(catalog);
    mRegistry.reset(new registry::Registry(mStore, &mGroups,
                                           std::unique_ptr<registry::SqliteCatalog>(mCatalog), &mClock));
  }

  //----------------------------------------------------------------------------
  //! Store bytes and append them to a dataset
  //----------------------------------------------------------------------------
  ns::FileEntry append(const std::string& id, const std::string& name,
                       const std::string& bytes)
  {
    ns::FileEntry entry;
    entry.name = name;
    entry.content_reference = mStore.put(bytes);
    mPayloads[id][name] = bytes;
    return mRegistry->appendFile(id, mUser, entry);
  }

  //----------------------------------------------------------------------------
  //! Correct claim for the files appended through append()
  //----------------------------------------------------------------------------
  std::string claim(const std::string& id)
  {
    return registry::HashVerifier::Compute(mPayloads[id]);
  }

  //----------------------------------------------------------------------------
  //! Upload and complete a dataset with one file
  //----------------------------------------------------------------------------
  std::string uploadComplete(const std::string& title,
                             const std::string& predecessor = "")
  {
    std::string id = mRegistry->beginUpload(mUser, MakeMetadata(title),
                                            predecessor);
    append(id, "a.txt", "0123456789");
    mRegistry->completeUpload(id, mUser, claim(id));
    mClock.advance(std::chrono::seconds(1));
    return id;
  }

  common::SystemClock mClock;
  store::MemoryContentStore mStore;
  registry::StaticGroupResolver mGroups;
  std::unique_ptr<registry::Registry> mRegistry;
  registry::SqliteCatalog* mCatalog {nullptr}; ///< owned by mRegistry
  common::VirtualIdentity mUser;
  common::VirtualIdentity mOther;
  common::VirtualIdentity mThird;
  std::map<std::string, std::map<std::string, std::string>> mPayloads;
};

}
}

#endif
