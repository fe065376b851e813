// ----------------------------------------------------------------------
// File: ConsoleMain.hh
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

#ifndef __SCIDBCONSOLE_CONSOLEMAIN_HH__
#define __SCIDBCONSOLE_CONSOLEMAIN_HH__

#include "common/Config.hh"
#include "common/VirtualIdentity.hh"
#include "registry/Registry.hh"
#include "store/IContentStore.hh"
#include <string>

//------------------------------------------------------------------------------
//! Global console state
//------------------------------------------------------------------------------
extern int global_retc;
extern bool global_debug;
extern std::string gUser;
extern std::string gConfigFile;
extern scidb::common::Config gConfig;
extern int done; ///< set to leave the interactive shell

//------------------------------------------------------------------------------
//! Command table entry
//------------------------------------------------------------------------------
typedef int CFunction(char*);

typedef struct {
  const char* name; ///< user printable name of the function
  CFunction* func; ///< function to call to do the job
  const char* doc; ///< documentation for this function
  const char* usage; ///< argument synopsis
} COMMAND;

extern COMMAND commands[];

//------------------------------------------------------------------------------
//! Commands
//------------------------------------------------------------------------------
extern int com_upload(char*);
extern int com_show(char*);
extern int com_ls(char*);
extern int com_chain(char*);
extern int com_invalidate(char*);
extern int com_acl(char*);
extern int com_get(char*);
extern int com_hash(char*);
extern int com_help(char*);
extern int com_quit(char*);

//------------------------------------------------------------------------------
//! Look up a command by name
//!
//! @return command or nullptr if unknown
//------------------------------------------------------------------------------
COMMAND* find_command(const char* name);

//------------------------------------------------------------------------------
//! Execute one command line, sets global_retc
//!
//! @return global_retc
//------------------------------------------------------------------------------
int execute_line(const char* line);

//------------------------------------------------------------------------------
//! Print the usage of a command to stderr and set global_retc to EINVAL
//------------------------------------------------------------------------------
int print_usage(const char* name);

//------------------------------------------------------------------------------
//! Strip leading and trailing blanks in place
//------------------------------------------------------------------------------
char* stripwhite(char* string);

//------------------------------------------------------------------------------
//! Interactive readline shell, returns the last command's return code
//------------------------------------------------------------------------------
int RunShell();

//------------------------------------------------------------------------------
//! Console entry point, runs a single command or the interactive shell
//------------------------------------------------------------------------------
int Run(int argc, char* argv[]);

//------------------------------------------------------------------------------
//! Registry opened from the [registry] configuration chapter, created on
//! first use
//------------------------------------------------------------------------------
scidb::registry::Registry& GetRegistry();

//------------------------------------------------------------------------------
//! Content store opened from the [registry] configuration chapter
//------------------------------------------------------------------------------
scidb::store::IContentStore& GetStore();

//------------------------------------------------------------------------------
//! Identity of the console user
//------------------------------------------------------------------------------
scidb::common::VirtualIdentity GetIdentity();

//------------------------------------------------------------------------------
//! Apply the [logging] configuration chapter
//------------------------------------------------------------------------------
void ConfigureLogging(const scidb::common::Config& cfg);

#endif
