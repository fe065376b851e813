// ----------------------------------------------------------------------
// File: PermissionMatrixTests.cc
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
#include "registry/GroupResolver.hh"
#include "registry/PermissionMatrix.hh"
#include "namespace/MDException.hh"

using namespace scidb;
using registry::Grant;
using registry::Operation;
using registry::PermissionMatrix;
using registry::Principal;

TEST(PermissionMatrix, OwnerAndDirectGrants)
{
  PermissionMatrix matrix;
  matrix.registerDataset("ds", "alice");
  ASSERT_TRUE(matrix.hasDataset("ds"));
  ASSERT_TRUE(matrix.isOwner("ds", "alice"));
  ASSERT_FALSE(matrix.isOwner("ds", "bob"));
  ASSERT_TRUE(matrix.check("ds", Principal::User("alice"), Operation::kRead));
  ASSERT_TRUE(matrix.check("ds", Principal::User("alice"), Operation::kWrite));
  ASSERT_FALSE(matrix.check("ds", Principal::User("bob"), Operation::kRead));
  ASSERT_TRUE(matrix.grant("ds", Principal::User("bob"), Operation::kRead));
  ASSERT_FALSE(matrix.grant("ds", Principal::User("bob"), Operation::kRead));
  ASSERT_TRUE(matrix.check("ds", Principal::User("bob"), Operation::kRead));
  // write does not imply read and read does not imply write
  ASSERT_FALSE(matrix.check("ds", Principal::User("bob"), Operation::kWrite));
  ASSERT_TRUE(matrix.grant("ds", Principal::User("carol"), Operation::kWrite));
  ASSERT_FALSE(matrix.check("ds", Principal::User("carol"), Operation::kRead));
  // the owner never appears as a stored entry
  ASSERT_FALSE(matrix.grant("ds", Principal::User("alice"), Operation::kRead));
  ASSERT_EQ(2u, matrix.grantsOf("ds").size());
}

TEST(PermissionMatrix, GrantRevokeRestores)
{
  PermissionMatrix matrix;
  matrix.registerDataset("ds", "alice");
  ASSERT_TRUE(matrix.grant("ds", Principal::Group("physics"), Operation::kRead));
  std::vector<Grant> before = matrix.grantsOf("ds");
  ASSERT_TRUE(matrix.grant("ds", Principal::User("bob"), Operation::kWrite));
  ASSERT_TRUE(matrix.revoke("ds", Principal::User("bob"), Operation::kWrite));
  ASSERT_EQ(before, matrix.grantsOf("ds"));
  ASSERT_FALSE(matrix.revoke("ds", Principal::User("bob"), Operation::kWrite));
  ASSERT_FALSE(matrix.check("ds", Principal::User("bob"), Operation::kWrite));
}

TEST(PermissionMatrix, GroupGrants)
{
  registry::StaticGroupResolver groups;
  groups.addMember("physics", "carol");
  groups.addMember("chemistry", "dave");
  PermissionMatrix matrix(&groups);
  matrix.registerDataset("ds", "alice");
  matrix.grant("ds", Principal::Group("physics"), Operation::kRead);
  ASSERT_TRUE(matrix.check("ds", Principal::User("carol"), Operation::kRead));
  ASSERT_FALSE(matrix.check("ds", Principal::User("carol"), Operation::kWrite));
  ASSERT_FALSE(matrix.check("ds", Principal::User("dave"), Operation::kRead));
  ASSERT_TRUE(matrix.check("ds", Principal::Group("physics"), Operation::kRead));
  groups.removeMember("physics", "carol");
  ASSERT_FALSE(matrix.check("ds", Principal::User("carol"), Operation::kRead));
  // without a resolver group grants match no user
  PermissionMatrix plain;
  plain.registerDataset("ds", "alice");
  plain.grant("ds", Principal::Group("physics"), Operation::kRead);
  ASSERT_FALSE(plain.check("ds", Principal::User("carol"), Operation::kRead));
}

TEST(PermissionMatrix, Listing)
{
  PermissionMatrix matrix;
  matrix.registerDataset("ds", "alice");
  matrix.grant("ds", Principal::User("bob"), Operation::kRead);
  matrix.grant("ds", Principal::User("bob"), Operation::kWrite);
  matrix.grant("ds", Principal::Group("physics"), Operation::kRead);
  registry::PermissionListing listing = matrix.list("ds");
  ASSERT_EQ("alice", listing.owner);
  ASSERT_EQ(std::set<std::string> {"bob"}, listing.read_users);
  ASSERT_EQ(std::set<std::string> {"bob"}, listing.write_users);
  ASSERT_EQ(std::set<std::string> {"physics"}, listing.read_groups);
  ASSERT_TRUE(listing.write_groups.empty());
}

TEST(PermissionMatrix, UnknownDataset)
{
  PermissionMatrix matrix;
  ASSERT_FALSE(matrix.hasDataset("ds"));
  ASSERT_THROW(matrix.check("ds", Principal::User("alice"), Operation::kRead),
               ns::NotFoundError);
  ASSERT_THROW(matrix.grant("ds", Principal::User("bob"), Operation::kRead),
               ns::NotFoundError);
  ASSERT_THROW(matrix.list("ds"), ns::NotFoundError);
  matrix.registerDataset("ds", "alice");
  matrix.forgetDataset("ds");
  ASSERT_FALSE(matrix.hasDataset("ds"));
}

TEST(PermissionMatrix, RuleCodec)
{
  std::string err;
  ASSERT_TRUE(PermissionMatrix::IsValidRules("u:bob:rw,g:physics:r", err));
  ASSERT_TRUE(PermissionMatrix::IsValidRules("u:jane.doe@cern.ch:w", err));
  ASSERT_FALSE(PermissionMatrix::IsValidRules("", err));
  ASSERT_FALSE(PermissionMatrix::IsValidRules("x:bob:r", err));
  ASSERT_FALSE(PermissionMatrix::IsValidRules("u:bob:x", err));
  ASSERT_FALSE(PermissionMatrix::IsValidRules("u:bob:r,", err));
  ASSERT_EQ("invalid rule syntax", err);
  ASSERT_THROW(PermissionMatrix::ParseRules("u:b b:r"), ns::ValidationError);
  std::vector<Grant> grants = PermissionMatrix::ParseRules("g:physics:r,u:bob:wr");
  ASSERT_EQ(3u, grants.size());
  ASSERT_EQ((Grant{Principal::Group("physics"), Operation::kRead}), grants[0]);
  ASSERT_EQ((Grant{Principal::User("bob"), Operation::kRead}), grants[1]);
  ASSERT_EQ((Grant{Principal::User("bob"), Operation::kWrite}), grants[2]);
  ASSERT_EQ("u:bob:rw,g:physics:r", PermissionMatrix::SerializeRules(grants));
  ASSERT_EQ("", PermissionMatrix::SerializeRules({}));
}
