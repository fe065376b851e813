// ----------------------------------------------------------------------
// File: com_ls.cc
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
#include "common/Timing.hh"

/* List visible datasets */
int
com_ls(char* arg)
{
  if (arg && *arg) {
    return print_usage("ls");
  }

  scidb::registry::DatasetListing listing = GetRegistry().listVisible(
        GetIdentity());
  scidb::ns::DatasetMD ds;

  while (listing.Next(ds)) {
    fprintf(stdout, "%s %s %12llu %-10s %s\n", ds.getId().c_str(),
            scidb::common::Timing::Micros_to_ISO8601(ds.getUploadTime()).c_str(),
            (unsigned long long) ds.getSize(),
            ds.isComplete() ? "complete" : "incomplete", ds.getTitle().c_str());
  }

  return 0;
}
