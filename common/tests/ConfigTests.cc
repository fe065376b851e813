// ----------------------------------------------------------------------
// File: ConfigTests.cc
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
#include "common/Config.hh"
#include "common/StringConversion.hh"
#include <cerrno>
#include <cstdlib>
#include <unistd.h>

using scidb::common::Config;

static const char* sRegistryConfig =
  "# registry settings\n"
  "[sysconfig]\n"
  "SCIDB_HOME=/var/lib/scidb\n"
  "SCIDB_CATALOG=${SCIDB_HOME}/catalog.db\n"
  "\n"
  "[registry]\n"
  "store = $SCIDB_HOME/store\n"
  "catalog=${SCIDB_CATALOG}\n"
  "groups=static\n"
  "  # indented comment\n"
  "bogus line without separator\n"
  "[ groups ]\n"
  "physics=carol,dave\n";

TEST(Config, ParseChaptersAndSections)
{
  Config cfg;
  ASSERT_TRUE(cfg.Parse(sRegistryConfig));
  ASSERT_TRUE(cfg.ok());
  ASSERT_TRUE(cfg.Has("sysconfig"));
  ASSERT_TRUE(cfg.Has("registry"));
  ASSERT_TRUE(cfg.Has("groups"));
  ASSERT_FALSE(cfg.Has("missing"));
  ASSERT_EQ(5u, cfg["registry"].size());
  ASSERT_EQ("groups=static", cfg["registry"][2]);
  ASSERT_TRUE(cfg["missing"].empty());
}

TEST(Config, LineBeforeChapter)
{
  Config cfg;
  ASSERT_FALSE(cfg.Parse("key=value\n[registry]\n"));
  ASSERT_FALSE(cfg.ok());
  ASSERT_EQ(EINVAL, cfg.getErrc());
  // comments and blank lines are fine before the first chapter
  Config other;
  ASSERT_TRUE(other.Parse("# header\n\n[registry]\nkey=value\n"));
}

TEST(Config, ValueSubstitution)
{
  Config cfg;
  ASSERT_TRUE(cfg.Parse(sRegistryConfig));
  ASSERT_EQ("/var/lib/scidb/store",
            cfg.GetValueByKey("registry", "store"));
  // substitution repeats until all references are resolved
  ASSERT_EQ("/var/lib/scidb/catalog.db",
            cfg.GetValueByKey("registry", "catalog"));
  ASSERT_EQ("static", cfg.GetValueByKey("registry", "groups"));
  ASSERT_EQ("fallback", cfg.GetValueByKey("registry", "nokey", "fallback"));
  ASSERT_EQ("fallback", cfg.GetValueByKey("nochapter", "store", "fallback"));
  std::map<std::string, std::string> groups = cfg.AsMap("groups");
  ASSERT_EQ(1u, groups.size());
  ASSERT_EQ("carol,dave", groups["physics"]);
}

TEST(Config, UnknownVariableKept)
{
  Config cfg;
  ASSERT_TRUE(cfg.Parse("[sysconfig]\nA=1\n[x]\nk=$B/path\n"));
  ASSERT_EQ("$B/path", cfg.GetValueByKey("x", "k"));
  std::string s = "$A:$A";
  cfg.ReplaceFromChapter(s, "sysconfig");
  ASSERT_EQ("1:1", s);
}

TEST(Config, DumpChapter)
{
  Config cfg;
  ASSERT_TRUE(cfg.Parse(sRegistryConfig));
  std::string dump = cfg.Dump("groups");
  ASSERT_EQ("physics=carol,dave\n", dump);
  std::string full = cfg.Dump(nullptr, true);
  ASSERT_NE(std::string::npos, full.find("[registry]\n"));
  ASSERT_NE(std::string::npos, full.find("store = /var/lib/scidb/store\n"));
}

TEST(Config, LoadFile)
{
  char path[] = "/tmp/scidb-config.XXXXXX";
  int fd = mkstemp(path);
  ASSERT_NE(-1, fd);
  close(fd);
  ASSERT_TRUE(scidb::common::StringConversion::SaveStringIntoFile(path,
              sRegistryConfig));
  Config cfg;
  ASSERT_TRUE(cfg.LoadFile(path));
  ASSERT_EQ("static", cfg.GetValueByKey("registry", "groups"));
  // SCIDB_CONFIG overrides the default location
  setenv("SCIDB_CONFIG", path, 1);
  Config env_cfg;
  ASSERT_TRUE(env_cfg.Load("registry"));
  ASSERT_TRUE(env_cfg.Has("groups"));
  unsetenv("SCIDB_CONFIG");
  unlink(path);
  Config missing;
  ASSERT_FALSE(missing.LoadFile(path));
  ASSERT_EQ(ENOENT, missing.getErrc());
}
