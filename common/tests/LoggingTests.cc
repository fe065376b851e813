// ----------------------------------------------------------------------
// File: LoggingTests.cc
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
#include "common/Logging.hh"
#include <cstdio>
#include <string>

using scidb::common::Logging;

//------------------------------------------------------------------------------
//! Restores the global log settings after each test
//------------------------------------------------------------------------------
class LoggingTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    mPriority = Logging::GetInstance().gPriorityLevel;
    Logging::GetInstance().SetLogPriority(LOG_DEBUG);
  }

  void TearDown() override
  {
    Logging& g_logging = Logging::GetInstance();
    g_logging.SetFilter("");
    g_logging.SetLogPriority(mPriority);
    g_logging.SetShortFormat(false);
    g_logging.EnableRateLimiter(false);
    g_logging.gLogFanOut.clear();
  }

  int mPriority {LOG_INFO};
};

TEST_F(LoggingTest, PriorityByString)
{
  Logging& g_logging = Logging::GetInstance();
  ASSERT_EQ(LOG_DEBUG, g_logging.GetPriorityByString("debug"));
  ASSERT_EQ(LOG_INFO, g_logging.GetPriorityByString("info"));
  ASSERT_EQ(LOG_ERR, g_logging.GetPriorityByString("err"));
  ASSERT_EQ(-1, g_logging.GetPriorityByString("chatty"));
  ASSERT_STREQ("ERROR", g_logging.GetPriorityString(LOG_ERR));
}

TEST_F(LoggingTest, PriorityMask)
{
  Logging& g_logging = Logging::GetInstance();
  g_logging.SetLogPriority(LOG_WARNING);
  ASSERT_FALSE(g_logging.shouldlog(__FUNCTION__, LOG_INFO));
  ASSERT_TRUE(g_logging.shouldlog(__FUNCTION__, LOG_WARNING));
  ASSERT_TRUE(g_logging.shouldlog(__FUNCTION__, LOG_ERR));
}

TEST_F(LoggingTest, Filter)
{
  Logging& g_logging = Logging::GetInstance();
  g_logging.SetFilter("Chatty,Noisy");
  ASSERT_FALSE(g_logging.shouldlog("Chatty", LOG_DEBUG));
  ASSERT_FALSE(g_logging.shouldlog("Noisy", LOG_INFO));
  // the filter never hides warnings or errors
  ASSERT_TRUE(g_logging.shouldlog("Noisy", LOG_ERR));
  ASSERT_TRUE(g_logging.shouldlog("Quiet", LOG_DEBUG));
  g_logging.SetFilter("PASS:Quiet");
  ASSERT_TRUE(g_logging.shouldlog("Quiet", LOG_DEBUG));
  ASSERT_FALSE(g_logging.shouldlog("Chatty", LOG_DEBUG));
  g_logging.SetFilter("");
  ASSERT_TRUE(g_logging.shouldlog("Chatty", LOG_DEBUG));
}

TEST_F(LoggingTest, RecentMessages)
{
  Logging& g_logging = Logging::GetInstance();
  scidb_static_err("msg=\"first recent message\"");
  scidb_static_err("msg=\"second recent message\"");
  std::vector<std::string> recent = g_logging.GetRecent(LOG_ERR, 2);
  ASSERT_EQ(2u, recent.size());
  ASSERT_NE(std::string::npos, recent[0].find("first recent message"));
  ASSERT_NE(std::string::npos, recent[1].find("second recent message"));
  ASSERT_NE(std::string::npos, recent[1].find("level=ERROR"));
  ASSERT_TRUE(g_logging.GetRecent(42, 10).empty());
}

TEST_F(LoggingTest, LogIdMessages)
{
  scidb::common::LogId id;
  id.SetLogId("logid-test", scidb::common::gLogging.gZeroVid, "tests");
  std::string out = scidb::common::Logging::GetInstance().log(__FUNCTION__,
                    __FILE__, __LINE__, id.logId, id.vid, id.cident, LOG_ERR,
                    "msg=\"%s\" n=%d", "tagged", 7);
  ASSERT_NE(std::string::npos, out.find("logid=logid-test"));
  ASSERT_NE(std::string::npos, out.find("msg=\"tagged\" n=7"));
}

TEST_F(LoggingTest, ShortFormat)
{
  Logging& g_logging = Logging::GetInstance();
  scidb::common::VirtualIdentity vid;
  vid.name = "alice";
  g_logging.SetShortFormat(true);
  std::string out = g_logging.log(__FUNCTION__, __FILE__, __LINE__, "id", vid,
                                  "tests", LOG_ERR, "msg=\"short\"");
  ASSERT_NE(std::string::npos, out.find(" f="));
  ASSERT_NE(std::string::npos, out.find("msg=\"short\""));
  ASSERT_EQ(std::string::npos, out.find("name=alice"));
  ASSERT_EQ(std::string::npos, out.find("logid="));
  g_logging.SetShortFormat(false);
  out = g_logging.log(__FUNCTION__, __FILE__, __LINE__, "id", vid, "tests",
                      LOG_ERR, "msg=\"long\"");
  ASSERT_NE(std::string::npos, out.find("name=alice"));
}

TEST_F(LoggingTest, RateLimiter)
{
  Logging& g_logging = Logging::GetInstance();
  g_logging.EnableRateLimiter();
  std::string out[3];

  for (int i = 0; i < 3; ++i) {
    out[i] = g_logging.log(__FUNCTION__, __FILE__, __LINE__, "id",
                           g_logging.gZeroVid, "tests", LOG_ERR,
                           "msg=\"burst\" n=%d", i);
  }

  ASSERT_FALSE(out[0].empty());
  ASSERT_TRUE(out[1].empty());
  ASSERT_TRUE(out[2].empty());
  // warnings are never suppressed
  g_logging.log(__FUNCTION__, __FILE__, __LINE__, "id", g_logging.gZeroVid,
                "tests", LOG_WARNING, "msg=\"first\"");
  ASSERT_FALSE(g_logging.log(__FUNCTION__, __FILE__, __LINE__, "id",
                             g_logging.gZeroVid, "tests", LOG_WARNING,
                             "msg=\"second\"").empty());
}

TEST_F(LoggingTest, FanOut)
{
  Logging& g_logging = Logging::GetInstance();
  FILE* fd = tmpfile();
  ASSERT_NE(nullptr, fd);
  // messages are tagged with the source file name without extension
  g_logging.AddFanOut("LoggingTests", fd);
  g_logging.AddFanOutAlias("Registry", "LoggingTests");
  g_logging.AddFanOutAlias("Store", "NoSuchTag");
  ASSERT_EQ(fd, g_logging.gLogFanOut["Registry"]);
  ASSERT_EQ(0u, g_logging.gLogFanOut.count("Store"));
  scidb_static_err("msg=\"fanned out\"");
  rewind(fd);
  char line[4096];
  std::string content;

  while (fgets(line, sizeof(line), fd)) {
    content += line;
  }

  ASSERT_NE(std::string::npos, content.find("msg=\"fanned out\""));
  ASSERT_NE(std::string::npos, content.find("ERROR"));
  ASSERT_NE(std::string::npos, content.find(g_logging.GetLogColour("ERROR")));
  g_logging.gLogFanOut.clear();
  fclose(fd);
}

TEST_F(LoggingTest, IndexSize)
{
  Logging& g_logging = Logging::GetInstance();
  g_logging.SetIndexSize(2);
  scidb_static_err("msg=\"one\"");
  scidb_static_err("msg=\"two\"");
  scidb_static_err("msg=\"three\"");
  std::vector<std::string> recent = g_logging.GetRecent(LOG_ERR, 10);
  g_logging.SetIndexSize(SCIDBCOMMONLOGGING_CIRCULARINDEXSIZE);
  ASSERT_EQ(2u, recent.size());
  ASSERT_NE(std::string::npos, recent[0].find("two"));
  ASSERT_NE(std::string::npos, recent[1].find("three"));
}
