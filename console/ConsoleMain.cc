// ----------------------------------------------------------------------
// File: ConsoleMain.cc
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
#include "common/Logging.hh"
#include "common/StringTokenizer.hh"
#include "common/StringConversion.hh"
#include "namespace/MDException.hh"
#include "registry/CachedGroupResolver.hh"
#include "registry/GroupResolver.hh"
#include "store/LocalContentStore.hh"
#include <readline/readline.h>
#include <readline/history.h>
#include <getopt.h>
#include <pwd.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <map>
#include <memory>

int global_retc = 0;
bool global_debug = false;
std::string gUser;
std::string gConfigFile;
scidb::common::Config gConfig;
int done = 0;

COMMAND commands[] = {
  { "upload", com_upload, "Upload a container directory", "<dir> [--replaces <id>]"},
  { "show", com_show, "Show a dataset", "<id> [-j]"},
  { "ls", com_ls, "List visible datasets", ""},
  { "chain", com_chain, "Show the version chain of a dataset", "<id>"},
  { "invalidate", com_invalidate, "Invalidate a dataset", "<id>"},
  { "acl", com_acl, "Show or change dataset permissions", "<id> [-l] [--grant <rules>] [--revoke <rules>]"},
  { "get", com_get, "Fetch a file of a dataset", "<id> <name> [-o <file>]"},
  { "hash", com_hash, "Compute the payload hash of a container directory", "<dir>"},
  { "help", com_help, "Print help", "[<command>]"},
  { "quit", com_quit, "Exit from the scidb console", ""},
  { "exit", com_quit, "Exit from the scidb console", ""},
  { nullptr, nullptr, nullptr, nullptr}
};

namespace
{
std::unique_ptr<scidb::store::IContentStore> sStore;
std::unique_ptr<scidb::registry::IGroupResolver> sResolver;
std::unique_ptr<scidb::registry::Registry> sRegistry;

void
usage()
{
  fprintf(stderr, "usage: scidb [--config <file>] [--user <name>] [-d] "
          "[<command> [<args>]]\n"
          "       without a command an interactive shell is started, the "
          "history is kept in\n       $SCIDB_HISTORY_FILE or "
          "$HOME/.scidb_history\n\n");

  for (int i = 0; commands[i].name; ++i) {
    fprintf(stderr, "  %-12s %s\n", commands[i].name, commands[i].doc);
  }
}
}

//------------------------------------------------------------------------------
// Look up a command
//------------------------------------------------------------------------------
COMMAND*
find_command(const char* name)
{
  for (int i = 0; commands[i].name; ++i) {
    if (strcmp(name, commands[i].name) == 0) {
      return (&commands[i]);
    }
  }

  return ((COMMAND*) 0);
}

//------------------------------------------------------------------------------
// Print usage of a command
//------------------------------------------------------------------------------
int
print_usage(const char* name)
{
  COMMAND* cmd = find_command(name);

  if (cmd) {
    fprintf(stderr, "usage: %s %s\n       %s\n", cmd->name, cmd->usage,
            cmd->doc);
  }

  global_retc = EINVAL;
  return 0;
}

//------------------------------------------------------------------------------
// Help
//------------------------------------------------------------------------------
int
com_help(char* arg)
{
  scidb::common::StringTokenizer tokenizer(arg);
  tokenizer.GetLine();
  std::string name;

  if (tokenizer.NextToken(name) && find_command(name.c_str())) {
    COMMAND* cmd = find_command(name.c_str());
    fprintf(stdout, "usage: %s %s\n       %s\n", cmd->name, cmd->usage,
            cmd->doc);
  } else {
    usage();
  }

  global_retc = 0;
  return 0;
}

//------------------------------------------------------------------------------
// Quit the interactive shell
//------------------------------------------------------------------------------
int
com_quit(char* arg)
{
  done = 1;
  global_retc = 0;
  return 0;
}

//------------------------------------------------------------------------------
// Strip blanks from the start and end of a string in place
//------------------------------------------------------------------------------
char*
stripwhite(char* string)
{
  char* s, *t;

  for (s = string; (*s) == ' '; s++)
    ;

  if (*s == 0) {
    return (s);
  }

  t = s + strlen(s) - 1;

  while (t > s && ((*t) == ' ')) {
    t--;
  }

  *++t = '\0';
  return s;
}

//------------------------------------------------------------------------------
// Generator of command names for readline completion
//------------------------------------------------------------------------------
static char*
command_generator(const char* text, int state)
{
  static int list_index;
  static size_t len;

  if (!state) {
    list_index = 0;
    len = strlen(text);
  }

  const char* name;

  while ((name = commands[list_index].name)) {
    list_index++;

    if (strncmp(name, text, len) == 0) {
      return strdup(name);
    }
  }

  return ((char*) 0);
}

//------------------------------------------------------------------------------
// Complete command names at the start of the line, paths otherwise
//------------------------------------------------------------------------------
static char**
scidb_console_completion(const char* text, int start, int end)
{
  char** matches = (char**) 0;

  if (start == 0) {
    rl_completion_append_character = ' ';
    matches = rl_completion_matches(text, command_generator);
  }

  return matches;
}

//------------------------------------------------------------------------------
// Interactive shell
//------------------------------------------------------------------------------
int
RunShell()
{
  std::string historyfile;

  if (getenv("SCIDB_HISTORY_FILE")) {
    historyfile = getenv("SCIDB_HISTORY_FILE");
  } else if (getenv("HOME")) {
    historyfile = getenv("HOME");
    historyfile += "/.scidb_history";
  }

  rl_readline_name = (char*) "scidb";
  rl_attempted_completion_function = scidb_console_completion;
  rl_completer_quote_characters = (char*) "\"";

  if (!historyfile.empty()) {
    read_history(historyfile.c_str());
  }

  std::string prompt = "scidb [" + GetIdentity().name + "] |> ";
  char* line;

  // Loop reading and executing lines until the user quits
  for (done = 0; done == 0;) {
    line = readline(prompt.c_str());

    if (!line) {
      fprintf(stdout, "\n");
      break;
    }

    char* s = stripwhite(line);

    if (*s) {
      add_history(s);
      execute_line(s);
      fflush(stdout);
      fflush(stderr);
    }

    free(line);
  }

  if (!historyfile.empty() && write_history(historyfile.c_str())) {
    scidb_static_warning("msg=\"failed to write history\" path=%s",
                         historyfile.c_str());
  }

  return global_retc;
}

//------------------------------------------------------------------------------
// Apply logging configuration
//------------------------------------------------------------------------------
void
ConfigureLogging(const scidb::common::Config& cfg)
{
  scidb::common::Logging& g_logging = scidb::common::Logging::GetInstance();
  g_logging.SetUnit("scidb");
  std::string level = global_debug ? "debug" :
                      cfg.GetValueByKey("logging", "level", "notice");
  int priority = g_logging.GetPriorityByString(level.c_str());

  if (priority < 0) {
    fprintf(stderr, "warning: unknown log level '%s', using notice\n",
            level.c_str());
    priority = LOG_NOTICE;
  }

  g_logging.SetLogPriority(priority);
  std::string filter = cfg.GetValueByKey("logging", "filter", "");

  if (!filter.empty()) {
    g_logging.SetFilter(filter.c_str());
  }

  std::string syslog = cfg.GetValueByKey("logging", "syslog", "");

  if (!syslog.empty()) {
    g_logging.SetSysLog((syslog == "1") || (syslog == "true"));
  }

  if (cfg.GetValueByKey("logging", "format", "") == "short") {
    g_logging.SetShortFormat(true);
  }

  std::string ratelimit = cfg.GetValueByKey("logging", "ratelimit", "");
  g_logging.EnableRateLimiter((ratelimit == "1") || (ratelimit == "true"));
  std::string buffer = cfg.GetValueByKey("logging", "buffer", "");

  if (!buffer.empty()) {
    unsigned long size = strtoul(buffer.c_str(), nullptr, 10);

    if (size) {
      g_logging.SetIndexSize(size);
    } else {
      fprintf(stderr, "warning: ignoring log buffer size '%s'\n",
              buffer.c_str());
    }
  }

  // fanout=<tag>:<file>,... with tag '*', '#' or a source file name
  std::map<std::string, std::string> fanout;
  std::string fanout_def = cfg.GetValueByKey("logging", "fanout", "");

  if (!fanout_def.empty() &&
      !scidb::common::StringConversion::GetKeyValueMap(fanout_def.c_str(),
          fanout)) {
    fprintf(stderr, "warning: malformed log fanout '%s'\n", fanout_def.c_str());
  }

  for (const auto& tag : fanout) {
    FILE* fd = fopen(tag.second.c_str(), "a");

    if (!fd) {
      fprintf(stderr, "warning: cannot open log fanout file %s: %s\n",
              tag.second.c_str(), strerror(errno));
      continue;
    }

    g_logging.AddFanOut(tag.first.c_str(), fd);
  }

  // fanout-alias=<alias>:<tag>,... sends another source to an existing fanout
  std::map<std::string, std::string> aliases;
  std::string alias_def = cfg.GetValueByKey("logging", "fanout-alias", "");

  if (!alias_def.empty() &&
      scidb::common::StringConversion::GetKeyValueMap(alias_def.c_str(),
          aliases)) {
    for (const auto& alias : aliases) {
      g_logging.AddFanOutAlias(alias.first.c_str(), alias.second.c_str());
    }
  }
}

//------------------------------------------------------------------------------
// Content store
//------------------------------------------------------------------------------
scidb::store::IContentStore&
GetStore()
{
  if (!sStore) {
    std::string root = gConfig.GetValueByKey("registry", "store",
                       "/var/lib/scidb/store");
    sStore.reset(new scidb::store::LocalContentStore(root));
  }

  return *sStore;
}

//------------------------------------------------------------------------------
// Registry
//------------------------------------------------------------------------------
scidb::registry::Registry&
GetRegistry()
{
  if (!sRegistry) {
    std::string groups = gConfig.GetValueByKey("registry", "groups", "static");

    if (groups == "unix") {
      long lifetime = strtol(gConfig.GetValueByKey("registry",
                             "group-cache-seconds", "1800").c_str(), 0, 10);
      sResolver.reset(new scidb::registry::CachedGroupResolver(
                        std::unique_ptr<scidb::registry::IGroupResolver>(
                          new scidb::registry::UnixGroupResolver()),
                        std::chrono::seconds(lifetime > 0 ? lifetime : 1800)));
    } else if (groups == "static") {
      sResolver.reset(new scidb::registry::StaticGroupResolver(
                        scidb::registry::StaticGroupResolver::FromConfig(gConfig)));
    } else {
      throw_nsexception(scidb::ns::ValidationError, "unknown group resolver '"
                        << groups << "' in [registry] groups=");
    }

    std::string catalog = gConfig.GetValueByKey("registry", "catalog",
                          "/var/lib/scidb/catalog.db");
    std::unique_ptr<scidb::registry::SqliteCatalog> db(
      new scidb::registry::SqliteCatalog(catalog));
    sRegistry.reset(new scidb::registry::Registry(GetStore(), sResolver.get(),
                    std::move(db)));
  }

  return *sRegistry;
}

//------------------------------------------------------------------------------
// Identity of the console user
//------------------------------------------------------------------------------
scidb::common::VirtualIdentity
GetIdentity()
{
  if (gUser.empty()) {
    struct passwd* pw = getpwuid(geteuid());

    if (pw) {
      gUser = pw->pw_name;
    }
  }

  return scidb::common::VirtualIdentity::User(gUser, "console");
}

//------------------------------------------------------------------------------
// Execute one command line
//------------------------------------------------------------------------------
int
execute_line(const char* line)
{
  std::string input = scidb::common::StringConversion::Trim(line);
  size_t pos = input.find(' ');
  std::string name = input.substr(0, pos);
  std::string args = (pos == std::string::npos) ? "" :
                     scidb::common::StringConversion::Trim(input.substr(pos));

  if (name.empty()) {
    global_retc = EINVAL;
    return global_retc;
  }

  COMMAND* command = find_command(name.c_str());

  if (!command) {
    fprintf(stderr, "%s: No such command for scidb console.\n", name.c_str());
    global_retc = EINVAL;
    return global_retc;
  }

  global_retc = 0;
  std::vector<char> buffer(args.begin(), args.end());
  buffer.push_back(0);

  try {
    (*(command->func))(buffer.data());
  } catch (const scidb::ns::MDException& e) {
    fprintf(stderr, "error: %s: %s\n", e.kind(), e.what());
    global_retc = e.getErrno();
  }

  return global_retc;
}

//------------------------------------------------------------------------------
// Console entry point
//------------------------------------------------------------------------------
int
Run(int argc, char* argv[])
{
  static struct option long_options[] = {
    {"config", required_argument, 0, 'c'},
    {"user", required_argument, 0, 'u'},
    {"debug", no_argument, 0, 'd'},
    {"help", no_argument, 0, 'h'},
    {0, 0, 0, 0}
  };
  int c;
  // Stop at the first non option, the rest belongs to the command
  while ((c = getopt_long(argc, argv, "+c:u:dh", long_options, 0)) != -1) {
    switch (c) {
    case 'c':
      gConfigFile = optarg;
      break;

    case 'u':
      gUser = optarg;
      break;

    case 'd':
      global_debug = true;
      break;

    case 'h':
      usage();
      return 0;

    default:
      usage();
      return EINVAL;
    }
  }

  bool loaded = gConfigFile.empty() ? gConfig.Load("registry", "default") :
                gConfig.LoadFile(gConfigFile);

  if (!loaded && !gConfigFile.empty()) {
    fprintf(stderr, "error: %s\n", gConfig.getMsg().c_str());
    return gConfig.getErrc() ? gConfig.getErrc() : EINVAL;
  }

  ConfigureLogging(gConfig);

  if (optind >= argc) {
    return RunShell();
  }

  std::string line;

  for (int i = optind; i < argc; ++i) {
    std::string arg = argv[i];

    if (i > optind) {
      line += " ";
    }

    // Re-quote arguments holding blanks for the tokenizer
    if (arg.find(' ') != std::string::npos) {
      line += "\"" + arg + "\"";
    } else {
      line += arg;
    }
  }

  return execute_line(line.c_str());
}
