// ----------------------------------------------------------------------
// File: HashVerifierTests.cc
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
#include "registry/HashVerifier.hh"
#include "store/MemoryContentStore.hh"
#include "common/StringConversion.hh"
#include <algorithm>
#include <cctype>

using namespace scidb;

namespace
{
ns::FileEntry
MakeEntry(store::MemoryContentStore& store, const std::string& name,
          const std::string& bytes)
{
  ns::FileEntry entry;
  entry.name = name;
  entry.content_reference = store.put(bytes);
  entry.size = bytes.size();
  entry.checksum = registry::HashVerifier::EntryDigest(bytes);
  return entry;
}

bool
ByName(const ns::FileEntry& a, const ns::FileEntry& b)
{
  return a.name < b.name;
}
}

TEST(HashVerifier, OrderIndependent)
{
  store::MemoryContentStore store;
  registry::HashVerifier verifier(store);
  std::vector<ns::FileEntry> entries = {
    MakeEntry(store, "b.txt", "second"),
    MakeEntry(store, "a.txt", "first"),
    MakeEntry(store, "data/c.bin", std::string("\0\1\2", 3))
  };
  std::string claim = registry::HashVerifier::Compute({
    {"a.txt", "first"}, {"b.txt", "second"}, {"data/c.bin", std::string("\0\1\2", 3)}
  });
  ASSERT_EQ(64u, claim.length());
  std::sort(entries.begin(), entries.end(), ByName);

  do {
    registry::VerificationReport report = verifier.Verify(entries, claim);
    ASSERT_TRUE(report.match) << report.ToString();
    ASSERT_EQ(claim, report.computed);
  } while (std::next_permutation(entries.begin(), entries.end(), ByName));
}

TEST(HashVerifier, ClaimNormalized)
{
  store::MemoryContentStore store;
  registry::HashVerifier verifier(store);
  std::vector<ns::FileEntry> entries = {MakeEntry(store, "a.txt", "first")};
  std::string claim = registry::HashVerifier::Compute({{"a.txt", "first"}});
  std::string upper = claim;
  std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
  ASSERT_TRUE(verifier.Verify(entries, " " + upper + "\n").match);
}

TEST(HashVerifier, NamesAreCovered)
{
  // same bytes under different names or split differently give other digests
  std::string one = registry::HashVerifier::Compute({{"a", "xy"}});
  std::string renamed = registry::HashVerifier::Compute({{"b", "xy"}});
  std::string split = registry::HashVerifier::Compute({{"a", "x"}, {"b", "y"}});
  std::string shifted = registry::HashVerifier::Compute({{"ax", "y"}});
  ASSERT_NE(one, renamed);
  ASSERT_NE(one, split);
  ASSERT_NE(one, shifted);
  ASSERT_NE(registry::HashVerifier::Compute({}), one);
}

TEST(HashVerifier, Failures)
{
  store::MemoryContentStore store;
  registry::HashVerifier verifier(store);
  std::vector<ns::FileEntry> entries = {
    MakeEntry(store, "a.txt", "first"),
    MakeEntry(store, "b.txt", "second")
  };
  std::string claim = registry::HashVerifier::Compute({{"a.txt", "first"},
    {"b.txt", "second"}
  });
  // wrong claim
  registry::VerificationReport report = verifier.Verify(entries,
      std::string(64, '0'));
  ASSERT_FALSE(report.match);
  ASSERT_EQ(claim, report.computed);
  ASSERT_TRUE(report.failed_entry.empty());
  // duplicate names
  std::vector<ns::FileEntry> dup = entries;
  dup.push_back(entries[0]);
  report = verifier.Verify(dup, claim);
  ASSERT_FALSE(report.match);
  ASSERT_EQ("a.txt", report.failed_entry);
  // recorded size disagrees
  std::vector<ns::FileEntry> sized = entries;
  sized[1].size = 3;
  report = verifier.Verify(sized, claim);
  ASSERT_FALSE(report.match);
  ASSERT_EQ("b.txt", report.failed_entry);
  ASSERT_TRUE(report.computed.empty());
  // payload missing in the store
  std::vector<ns::FileEntry> missing = entries;
  missing[0].content_reference = "unknown";
  report = verifier.Verify(missing, claim);
  ASSERT_FALSE(report.match);
  ASSERT_EQ("a.txt", report.failed_entry);
  ASSERT_NE(std::string::npos, report.ToString().find("entry=\"a.txt\""));
  // stored payload modified with the same length
  ASSERT_TRUE(store.corrupt(entries[1].content_reference, "SECOND"));
  report = verifier.Verify(entries, claim);
  ASSERT_FALSE(report.match);
  ASSERT_EQ("b.txt", report.failed_entry);
}
