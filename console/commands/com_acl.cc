// ----------------------------------------------------------------------
// File: com_acl.cc
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

#include "console/ConsoleMain.hh"
#include "common/StringTokenizer.hh"
#include "registry/PermissionMatrix.hh"

namespace
{
void
PrintSet(const char* label, const std::set<std::string>& names)
{
  fprintf(stdout, "%-14s", label);

  for (const auto& name : names) {
    fprintf(stdout, " %s", name.c_str());
  }

  fprintf(stdout, "\n");
}
}

/* Show or change the permissions of a dataset */
int
com_acl(char* arg)
{
  scidb::common::StringTokenizer subtokenizer(arg);
  subtokenizer.GetLine();
  std::string id;
  std::string grant_rules;
  std::string revoke_rules;
  std::string token;
  bool list = false;

  while (subtokenizer.NextToken(token)) {
    if (token == "-l" || token == "--list") {
      list = true;
    } else if (token == "--grant") {
      if (!subtokenizer.NextToken(grant_rules) || grant_rules.empty()) {
        return print_usage("acl");
      }
    } else if (token == "--revoke") {
      if (!subtokenizer.NextToken(revoke_rules) || revoke_rules.empty()) {
        return print_usage("acl");
      }
    } else if (id.empty() && token[0] != '-') {
      id = token;
    } else {
      return print_usage("acl");
    }
  }

  if (id.empty()) {
    return print_usage("acl");
  }

  using scidb::registry::PermissionMatrix;
  scidb::common::VirtualIdentity vid = GetIdentity();

  if (!grant_rules.empty() || !revoke_rules.empty()) {
    std::vector<scidb::registry::Grant> grants;
    std::vector<scidb::registry::Grant> revokes;

    if (!grant_rules.empty()) {
      grants = PermissionMatrix::ParseRules(grant_rules);
    }

    if (!revoke_rules.empty()) {
      revokes = PermissionMatrix::ParseRules(revoke_rules);
    }

    GetRegistry().updatePermissions(id, vid, grants, revokes);

    if (!list) {
      return 0;
    }
  }

  scidb::registry::PermissionListing listing = GetRegistry().permissionsOf(id,
      vid);
  fprintf(stdout, "owner:         %s\n", listing.owner.c_str());
  PrintSet("read users:", listing.read_users);
  PrintSet("read groups:", listing.read_groups);
  PrintSet("write users:", listing.write_users);
  PrintSet("write groups:", listing.write_groups);
  return 0;
}
