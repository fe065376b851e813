// ----------------------------------------------------------------------
// File: com_upload.cc
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
#include "registry/ContainerParser.hh"
#include "registry/HashVerifier.hh"
#include <map>

/* Upload a container directory */
int
com_upload(char* arg)
{
  scidb::common::StringTokenizer subtokenizer(arg);
  subtokenizer.GetLine();
  std::string dir;
  std::string replaces;
  std::string token;

  while (subtokenizer.NextToken(token)) {
    if (token == "--replaces") {
      if (!subtokenizer.NextToken(replaces) || replaces.empty()) {
        return print_usage("upload");
      }
    } else if (dir.empty() && token[0] != '-') {
      dir = token;
    } else {
      return print_usage("upload");
    }
  }

  if (dir.empty()) {
    return print_usage("upload");
  }

  scidb::registry::DirectoryContainer container(dir);
  container.Load();
  scidb::common::VirtualIdentity vid = GetIdentity();
  scidb::registry::Registry& registry = GetRegistry();
  scidb::store::IContentStore& store = GetStore();
  std::map<std::string, std::string> payloads;
  std::string id = registry.beginUpload(vid, container.getMetadata(), replaces);

  for (const auto& file : container.getFiles()) {
    scidb::ns::FileEntry entry;
    entry.name = file.name;
    entry.content_reference = store.put(file.bytes);
    entry.preview = file.preview;
    registry.appendFile(id, vid, entry);
    payloads[file.name] = file.bytes;
  }

  registry.completeUpload(id, vid,
                          scidb::registry::HashVerifier::Compute(payloads));
  fprintf(stdout, "%s\n", id.c_str());
  return 0;
}
