// ----------------------------------------------------------------------
// File: com_chain.cc
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

/* Show the version chain of a dataset */
int
com_chain(char* arg)
{
  scidb::common::StringTokenizer subtokenizer(arg);
  subtokenizer.GetLine();
  std::vector<std::string> args = subtokenizer.RemainingTokens();

  if (args.size() != 1) {
    return print_usage("chain");
  }

  for (const auto& id : GetRegistry().chainOf(args[0], GetIdentity())) {
    fprintf(stdout, "%s%s\n", id.c_str(), (id == args[0]) ? " *" : "");
  }

  return 0;
}
