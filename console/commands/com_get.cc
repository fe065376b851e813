// ----------------------------------------------------------------------
// File: com_get.cc
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
#include "common/StringConversion.hh"
#include "common/StringTokenizer.hh"

/* Fetch a file of a dataset */
int
com_get(char* arg)
{
  scidb::common::StringTokenizer subtokenizer(arg);
  subtokenizer.GetLine();
  std::vector<std::string> args;
  std::string output;
  std::string token;

  while (subtokenizer.NextToken(token)) {
    if (token == "-o") {
      if (!subtokenizer.NextToken(output) || output.empty()) {
        return print_usage("get");
      }
    } else {
      args.push_back(token);
    }
  }

  if (args.size() != 2) {
    return print_usage("get");
  }

  std::string bytes = GetRegistry().fetchFile(args[0], GetIdentity(), args[1]);

  if (output.empty()) {
    if (fwrite(bytes.data(), 1, bytes.size(), stdout) != bytes.size()) {
      global_retc = EIO;
    }

    return 0;
  }

  if (!scidb::common::StringConversion::SaveStringIntoFile(output.c_str(),
      bytes)) {
    fprintf(stderr, "error: failed to write %s\n", output.c_str());
    global_retc = EIO;
  }

  return 0;
}
