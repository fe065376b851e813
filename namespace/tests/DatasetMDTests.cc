// ----------------------------------------------------------------------
// File: DatasetMDTests.cc
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
#include "namespace/DatasetMD.hh"
#include "namespace/MDException.hh"
#include "registry/tests/TestsUtils.hh"

using namespace scidb;

TEST(DatasetMD, CreateIncomplete)
{
  ns::DatasetMetadata md = scidb::test::MakeMetadata("Spectra");
  md.keywords = {"optics", "laser"};
  md.used_software.push_back({"acquire", "1.2", "doi:10.1/x", "DOI"});
  ns::DatasetMD ds = ns::DatasetMD::Create("id-1", "alice", md, 1000);
  ASSERT_EQ("id-1", ds.getId());
  ASSERT_EQ("alice", ds.getOwner());
  ASSERT_EQ("Spectra", ds.getTitle());
  ASSERT_EQ(1000, ds.getUploadTime());
  ASSERT_FALSE(ds.isComplete());
  ASSERT_FALSE(ds.isInvalidated());
  ASSERT_EQ(0u, ds.getSize());
  ns::DatasetMetadata back = ds.getMetadata();
  ASSERT_EQ("id-1", back.uuid);
  ASSERT_EQ(md.keywords, back.keywords);
  ASSERT_EQ(1u, back.used_software.size());
  ASSERT_EQ("DOI", back.used_software[0].type);
  ASSERT_EQ("TestType", back.container_type.name);
}

TEST(DatasetMD, ManifestEntries)
{
  ns::DatasetMD ds = ns::DatasetMD::Create("id-1", "alice",
                     scidb::test::MakeMetadata(), 1000);
  ns::FileEntry entry;
  entry.name = "data/values.csv";
  entry.size = 10;
  entry.content_reference = "ref-a";
  entry.checksum = "abc";
  ds.appendEntry(entry);
  entry.name = "meta.json";
  entry.size = 5;
  entry.preview = std::string("{}");
  ds.appendEntry(entry);
  ASSERT_EQ(15u, ds.getSize());
  std::vector<ns::FileEntry> content = ds.getContent();
  ASSERT_EQ(2u, content.size());
  ASSERT_EQ("data/values.csv", content[0].name);
  ASSERT_FALSE(content[0].preview.has_value());
  ASSERT_EQ("{}", content[1].preview.value());
  ns::FileEntry found;
  ASSERT_TRUE(ds.findEntry("meta.json", found));
  ASSERT_EQ(5u, found.size);
  ASSERT_FALSE(ds.findEntry("missing", found));
  ds.setComplete("digest", 2000);
  ASSERT_TRUE(ds.isComplete());
  ASSERT_EQ("digest", ds.getHash());
  ASSERT_EQ(2000, ds.getUploadTime());
  ASSERT_EQ(15u, ds.getSize());
}

TEST(DatasetMD, SerializeAndJson)
{
  ns::DatasetMD ds = ns::DatasetMD::Create("id-2", "bob",
                     scidb::test::MakeMetadata("Json"), 1000);
  ds.setReplaces("id-1");
  ns::FileEntry entry;
  entry.name = "meta.json";
  entry.size = 2;
  entry.preview = std::string("{}");
  ds.appendEntry(entry);
  std::string blob;
  ASSERT_TRUE(ds.SerializeToString(blob));
  ns::DatasetMD copy;
  ASSERT_TRUE(copy.ParseFromString(blob));
  ASSERT_EQ("id-1", copy.getReplaces());
  ASSERT_EQ("bob", copy.getOwner());
  std::string json;
  ASSERT_TRUE(copy.ToJson(json));
  ASSERT_NE(std::string::npos, json.find("\"replaces\": \"id-1\""));
  ASSERT_NE(std::string::npos, json.find("\"complete\": false"));
  ASSERT_EQ(std::string::npos, json.find("\"preview\": \"e30=\""));
  ASSERT_TRUE(copy.ToJson(json, true));
  ASSERT_NE(std::string::npos, json.find("\"preview\": \"e30=\""));
}

TEST(MDException, KindsAndErrnos)
{
  ns::NotFoundError not_found("gone");
  ASSERT_EQ(ENOENT, not_found.getErrno());
  ASSERT_STREQ("gone", not_found.what());
  ASSERT_EQ(EACCES, ns::ForbiddenError().getErrno());
  ASSERT_EQ(EROFS, ns::ImmutableError().getErrno());
  ASSERT_EQ(EEXIST, ns::ChainConflictError().getErrno());
  ASSERT_EQ(EINVAL, ns::ValidationError().getErrno());
  ASSERT_EQ(EIO, ns::StoreError().getErrno());
  ns::IntegrityError err;
  err.getMessage() << "mismatch";
  err.setDetails("a.txt", "expected", "computed");
  ns::IntegrityError copy(err);
  ASSERT_EQ(EBADMSG, copy.getErrno());
  ASSERT_STREQ("mismatch", copy.what());
  ASSERT_EQ("a.txt", copy.getEntry());
  ASSERT_EQ("expected", copy.getExpected());
  ASSERT_EQ("computed", copy.getComputed());
  ASSERT_STREQ("Integrity", copy.kind());

  try {
    throw_nsexception(ns::ChainConflictError, "already replaced by " << 42);
  } catch (const ns::MDException& e) {
    ASSERT_STREQ("ChainConflict", e.kind());
    ASSERT_STREQ("already replaced by 42", e.what());
  }
}
