// ----------------------------------------------------------------------
// File: com_invalidate.cc
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

/* Invalidate a dataset */
int
com_invalidate(char* arg)
{
  scidb::common::StringTokenizer subtokenizer(arg);
  subtokenizer.GetLine();
  std::vector<std::string> args = subtokenizer.RemainingTokens();

  if (args.size() != 1) {
    return print_usage("invalidate");
  }

  GetRegistry().invalidate(args[0], GetIdentity());
  fprintf(stdout, "success: dataset %s invalidated\n", args[0].c_str());
  return 0;
}
