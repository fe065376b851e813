// ----------------------------------------------------------------------
// File: com_show.cc
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
#include "common/Timing.hh"

/* Show a dataset */
int
com_show(char* arg)
{
  scidb::common::StringTokenizer subtokenizer(arg);
  subtokenizer.GetLine();
  std::string id;
  std::string token;
  bool json = false;

  while (subtokenizer.NextToken(token)) {
    if (token == "-j" || token == "--json") {
      json = true;
    } else if (id.empty()) {
      id = token;
    } else {
      return print_usage("show");
    }
  }

  if (id.empty()) {
    return print_usage("show");
  }

  scidb::ns::DatasetMD ds = GetRegistry().read(id, GetIdentity());

  if (json) {
    std::string out;

    if (!ds.ToJson(out)) {
      fprintf(stderr, "error: failed to convert dataset %s to json\n",
              id.c_str());
      global_retc = EIO;
      return 0;
    }

    fprintf(stdout, "%s\n", out.c_str());
    return 0;
  }

  scidb::ns::DatasetMetadata md = ds.getMetadata();
  fprintf(stdout, "id:           %s\n", ds.getId().c_str());
  fprintf(stdout, "title:        %s\n", md.title.c_str());
  fprintf(stdout, "author:       %s <%s>\n", md.author.c_str(),
          md.email.c_str());
  fprintf(stdout, "owner:        %s\n", ds.getOwner().c_str());
  fprintf(stdout, "uploaded:     %s\n",
          scidb::common::Timing::Micros_to_ISO8601(ds.getUploadTime()).c_str());
  fprintf(stdout, "size:         %llu\n", (unsigned long long) ds.getSize());
  fprintf(stdout, "complete:     %s\n", ds.isComplete() ? "yes" : "no");
  fprintf(stdout, "invalidated:  %s\n", ds.isInvalidated() ? "yes" : "no");
  fprintf(stdout, "hash:         %s\n", ds.getHash().c_str());

  if (!ds.getReplaces().empty()) {
    fprintf(stdout, "replaces:     %s\n", ds.getReplaces().c_str());
  }

  fprintf(stdout, "model:        %s %s/%s\n", md.model_version.c_str(),
          md.container_type.name.c_str(), md.container_type.version.c_str());

  for (const auto& entry : ds.getContent()) {
    fprintf(stdout, "  %12llu %s %s\n", (unsigned long long) entry.size,
            entry.checksum.c_str(), entry.name.c_str());
  }

  return 0;
}
