// ----------------------------------------------------------------------
// File: Logging.cc
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

#include "common/Namespace.hh"
#include "common/Logging.hh"
#include <XrdSys/XrdSysPthread.hh>
#include <stdarg.h>
#include <stdlib.h>
#include <new>
#include <type_traits>
#include <atomic>

SCIDBCOMMONNAMESPACE_BEGIN

static std::atomic<int> sCounter {0};
static typename std::aligned_storage<sizeof(Logging), alignof(Logging)>::type
logging_buf; ///< Memory for the global logging object
Logging& gLogging = reinterpret_cast<Logging&>(logging_buf);

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
LoggingInitializer::LoggingInitializer()
{
  if (sCounter++ == 0) {
    new (&gLogging) Logging(); // placement new
  }
}

//------------------------------------------------------------------------------
// Destructor
//------------------------------------------------------------------------------
LoggingInitializer::~LoggingInitializer()
{
  if (--sCounter == 0) {
    (&gLogging)->~Logging();
  }
}

//------------------------------------------------------------------------------
// Get singleton instance
//------------------------------------------------------------------------------
Logging&
Logging::GetInstance()
{
  return gLogging;
}

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
Logging::Logging():
  gLogMask(0), gPriorityLevel(0), gToSysLog(false), gUnit("none"),
  gShortFormat(0), gRateLimiter(false)
{
  // Initialize the log array and sets the log circular size
  gLogCircularIndex.resize(LOG_DEBUG + 1);
  gLogMemory.resize(LOG_DEBUG + 1);
  gCircularIndexSize = SCIDBCOMMONLOGGING_CIRCULARINDEXSIZE;

  for (int i = 0; i <= LOG_DEBUG; i++) {
    gLogCircularIndex[i] = 0;
    gLogMemory[i].resize(gCircularIndexSize);
  }

  gZeroVid.name = "-";
  XrdOucString tosyslog;

  if (getenv("SCIDB_LOG_SYSLOG")) {
    tosyslog = getenv("SCIDB_LOG_SYSLOG");

    if ((tosyslog == "1" ||
         (tosyslog == "true"))) {
      gToSysLog = true;
    }
  }
}

//------------------------------------------------------------------------------
// Set index size
//------------------------------------------------------------------------------
void
Logging::SetIndexSize(size_t size)
{
  XrdSysMutexHelper scope_lock(gMutex);
  gCircularIndexSize = size;

  for (int i = 0; i <= LOG_DEBUG; i++) {
    gLogCircularIndex[i] = 0;
    gLogMemory[i].clear();
    gLogMemory[i].resize(size);
    gLogMemory[i].shrink_to_fit();
  }
}

//------------------------------------------------------------------------------
// Set the log filter
//------------------------------------------------------------------------------
void
Logging::SetFilter(const char* filter)
{
  int pos = 0;
  char del = ',';
  XrdOucString token;
  XrdOucString pass_tag = "PASS:";
  XrdOucString sfilter = filter;
  // Clear both maps
  gDenyFilter.Purge();
  gAllowFilter.Purge();

  if ((pos = sfilter.find(pass_tag)) != STR_NPOS) {
    // Extract the function names which are allowed to log
    pos += pass_tag.length();

    while ((pos = sfilter.tokenize(token, pos, del)) != -1) {
      gAllowFilter.Add(token.c_str(), NULL, 0, Hash_data_is_key);
    }
  } else {
    // Extract the function names which are denied to log
    pos = 0;

    while ((pos = sfilter.tokenize(token, pos, del)) != -1) {
      gDenyFilter.Add(token.c_str(), NULL, 0, Hash_data_is_key);
    }
  }
}

//------------------------------------------------------------------------------
// Return priority as string
//------------------------------------------------------------------------------
const char*
Logging::GetPriorityString(int pri)
{
  switch (pri) {
  case LOG_INFO:
    return "INFO ";

  case LOG_DEBUG:
    return "DEBUG";

  case LOG_ERR:
    return "ERROR";

  case LOG_EMERG:
    return "EMERG";

  case LOG_ALERT:
    return "ALERT";

  case LOG_CRIT:
    return "CRIT ";

  case LOG_WARNING:
    return "WARN ";

  case LOG_NOTICE:
    return "NOTE ";

  case LOG_SILENT:
    return "";

  default:
    return "NONE ";
  }
}

//------------------------------------------------------------------------------
// Return priority int from string
//------------------------------------------------------------------------------
int
Logging::GetPriorityByString(const char* pri)
{
  static const std::map<std::string, int> sPriorities = {
    {"info", LOG_INFO}, {"debug", LOG_DEBUG}, {"err", LOG_ERR},
    {"emerg", LOG_EMERG}, {"alert", LOG_ALERT}, {"crit", LOG_CRIT},
    {"warning", LOG_WARNING}, {"notice", LOG_NOTICE}, {"silent", LOG_SILENT}
  };

  if (pri == nullptr) {
    return -1;
  }

  auto it = sPriorities.find(pri);
  return (it == sPriorities.end()) ? -1 : it->second;
}

//------------------------------------------------------------------------------
// Get a color for a given logging level
//------------------------------------------------------------------------------
const char*
Logging::GetLogColour(const char* loglevel)
{
  if (!strcmp(loglevel, "INFO ")) {
    return SCIDB_TEXTGREEN;
  }

  if (!strcmp(loglevel, "ERROR")) {
    return SCIDB_TEXTRED;
  }

  if (!strcmp(loglevel, "WARN ")) {
    return SCIDB_TEXTYELLOW;
  }

  if (!strcmp(loglevel, "NOTE ")) {
    return SCIDB_TEXTBLUE;
  }

  if (!strcmp(loglevel, "CRIT ") || !strcmp(loglevel, "ALERT")) {
    return SCIDB_TEXTREDERROR;
  }

  if (!strcmp(loglevel, "EMERG")) {
    return SCIDB_TEXTBLUEERROR;
  }

  return "";
}

//------------------------------------------------------------------------------
// Should log function
//------------------------------------------------------------------------------
bool
Logging::shouldlog(const char* func, int priority)
{
  if (priority == LOG_SILENT) {
    return true;
  }

  // short cut if log messages are masked
  if (!((LOG_MASK(priority) & gLogMask))) {
    return false;
  }

  // apply filter to avoid message flooding for debug messages
  if (priority >= LOG_INFO) {
    if (gAllowFilter.Num()) {
      return (gAllowFilter.Find(func) != nullptr);
    }

    if (gDenyFilter.Num() && gDenyFilter.Find(func)) {
      return false;
    }
  }

  return true;
}

//------------------------------------------------------------------------------
// Logging function
//------------------------------------------------------------------------------
std::string
Logging::log(const char* func, const char* file, int line, const char* logid,
             const VirtualIdentity& vid, const char* cident, int priority,
             const char* msg, ...)
{
  bool silent = (priority == LOG_SILENT);

  if (!shouldlog(func, priority)) {
    return "";
  }

  XrdOucString File = file;
  // we show only the file name without directory and extension
  File.erase(0, File.rfind("/") + 1);
  File.erase(File.length() - 3);
  struct timeval tv;
  struct timezone tz;
  tm tm;
  gettimeofday(&tv, &tz);
  time_t current_time = tv.tv_sec;
  localtime_r(&current_time, &tm);
  XrdOucString truncname = vid.name.c_str();

  // we show only the last 16 bytes of the name
  if (truncname.length() > 16) {
    truncname.insert("..", 0);
    truncname.erase(0, truncname.length() - 16);
  }

  char sourceline[64];
  snprintf(sourceline, sizeof(sourceline), "%s:%d", File.c_str(), line);
  char header[1024];

  if (gShortFormat) {
    snprintf(header, sizeof(header),
             "%02d%02d%02d %02d:%02d:%02d t=%lu.%06lu f=%-16s l=%s tid=%016lx s=%-24s ",
             tm.tm_year - 100, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
             tm.tm_min, tm.tm_sec, (unsigned long) current_time,
             (unsigned long) tv.tv_usec, func, GetPriorityString(priority),
             (unsigned long) XrdSysThread::ID(), sourceline);
  } else {
    snprintf(header, sizeof(header),
             "%02d%02d%02d %02d:%02d:%02d time=%lu.%06lu func=%-24s level=%s logid=%s unit=%s tid=%016lx source=%-30s tident=%s sec=%-5s uid=%d gid=%d name=%s ",
             tm.tm_year - 100, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min,
             tm.tm_sec, (unsigned long) current_time, (unsigned long) tv.tv_usec,
             func, GetPriorityString(priority), logid, gUnit.c_str(),
             (unsigned long) XrdSysThread::ID(), sourceline, cident,
             vid.prot.c_str(), (int) vid.uid, (int) vid.gid, truncname.c_str());
  }

  char body[8192];
  va_list args;
  va_start(args, msg);
  vsnprintf(body, sizeof(body), msg, args);
  va_end(args);
  std::string out = header;
  out += body;

  if (silent) {
    return out;
  }

  XrdSysMutexHelper scope_lock(gMutex);

  if (rate_limit(tv, priority, file, line)) {
    return "";
  }

  bool fanned = false;

  if (gLogFanOut.size()) {
    // we do log-message fanout
    if (gLogFanOut.count("*")) {
      fprintf(gLogFanOut["*"], "%s\n", out.c_str());
      fflush(gLogFanOut["*"]);
    }

    if (gLogFanOut.count(File.c_str())) {
      fprintf(gLogFanOut[File.c_str()], "%02d%02d%02d %02d:%02d:%02d %s%s%s %-30s %s\n",
              tm.tm_year - 100, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
              tm.tm_min, tm.tm_sec, GetLogColour(GetPriorityString(priority)),
              GetPriorityString(priority), SCIDB_TEXTNORMAL, sourceline, body);
      fflush(gLogFanOut[File.c_str()]);
      fanned = true;
    } else if (gLogFanOut.count("#")) {
      fprintf(gLogFanOut["#"], "%s\n", out.c_str());
      fflush(gLogFanOut["#"]);
      fanned = true;
    }
  }

  if (!fanned) {
    fprintf(stderr, "%s\n", out.c_str());
    fflush(stderr);
  }

  if (gToSysLog) {
    syslog(priority, "%s", body);
  }

  // keep the message in the circular memory of its priority
  if ((priority >= 0) && (priority <= LOG_DEBUG) && gCircularIndexSize) {
    unsigned long slot = gLogCircularIndex[priority] % gCircularIndexSize;
    gLogMemory[priority][slot] = out.c_str();
    gLogCircularIndex[priority]++;
  }

  return out;
}

//------------------------------------------------------------------------------
// Return the most recent in-memory messages of a priority
//------------------------------------------------------------------------------
std::vector<std::string>
Logging::GetRecent(int priority, size_t max)
{
  std::vector<std::string> recent;

  if ((priority < 0) || (priority > LOG_DEBUG)) {
    return recent;
  }

  XrdSysMutexHelper scope_lock(gMutex);
  unsigned long end = gLogCircularIndex[priority];
  unsigned long begin = 0;

  if (end > max) {
    begin = end - max;
  }

  if (end - begin > gCircularIndexSize) {
    begin = end - gCircularIndexSize;
  }

  for (unsigned long i = begin; i < end; ++i) {
    recent.push_back(gLogMemory[priority][i % gCircularIndexSize].c_str());
  }

  return recent;
}

//------------------------------------------------------------------------------
// Rate limit repeated messages coming from the same source line
//------------------------------------------------------------------------------
bool
Logging::rate_limit(struct timeval& tv, int priority, const char* file,
                    int line)
{
  static bool do_limit = false;
  static std::string last_file = "";
  static int last_line = 0;
  static int last_priority = priority;
  static struct timeval last_tv;

  if (!gRateLimiter) {
    return false;
  }

  if ((line == last_line) &&
      (priority == last_priority) &&
      (last_file == file) &&
      (priority < LOG_WARNING)) {
    float elapsed = (1.0 * (tv.tv_sec - last_tv.tv_sec)) + ((
                      tv.tv_usec - last_tv.tv_usec) / 1000000.0);

    if (elapsed < 5.0) {
      if (!do_limit) {
        fprintf(stderr,
                "                 ---- high rate error messages suppressed ----\n");
      }

      do_limit = true;
    } else {
      do_limit = false;
    }
  } else {
    do_limit = false;
  }

  if (!do_limit) {
    last_tv = tv;
    last_line = line;
    last_file = file;
    last_priority = priority;
  }

  return do_limit;
}

SCIDBCOMMONNAMESPACE_END
