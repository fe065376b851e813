// ----------------------------------------------------------------------
// File: Logging.hh
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

/**
 * @file   Logging.hh
 *
 * @brief  Class for message logging.
 *
 * You can use this class without creating an instance object (it provides a
 * global singleton). All the 'scidb_<state>' functions require that the logging
 * class inherits from the 'LogId' class. As an alternative a set of static
 * 'scidb_static_<state>' logging functions are provided. To define the log
 * level one uses the static 'SetLogPriority' function. 'SetFilter' allows to
 * filter out log messages which are identified by their function/method name
 * (__FUNCTION__). If you prefix this comma separated list with 'PASS:' it is
 * used as an acceptance filter. By default all logging is printed to 'stderr'.
 * You can arrange a log stream filter fan-out using 'AddFanOut'. The fan-out of
 * messages is defined by the source filename the message comes from and maps
 * to a FILE* where the message is written. If you add a '*' fan-out you can
 * write all messages into this file. If you add a '#' fan-out you can write
 * all messages which are not in any other fan-out (besides '*') into that file.
 */

#ifndef __SCIDBCOMMON_LOGGING_HH__
#define __SCIDBCOMMON_LOGGING_HH__

#include "common/Namespace.hh"
#include "common/VirtualIdentity.hh"
#include "XrdOuc/XrdOucString.hh"
#include "XrdOuc/XrdOucHash.hh"
#include "XrdSys/XrdSysPthread.hh"
#include <string.h>
#include <stdio.h>
#include <sys/syslog.h>
#include <sys/time.h>
#include <uuid/uuid.h>
#include <map>
#include <string>
#include <vector>
#include <sstream>

#define SSTR(message) static_cast<std::ostringstream&>(std::ostringstream().flush() << message).str()

SCIDBCOMMONNAMESPACE_BEGIN

#define SCIDB_TEXTNORMAL "\033[0m"
#define SCIDB_TEXTRED    "\033[49;31m"
#define SCIDB_TEXTREDERROR "\033[47;31m\e[5m"
#define SCIDB_TEXTBLUEERROR "\033[47;34m\e[5m"
#define SCIDB_TEXTGREEN  "\033[49;32m"
#define SCIDB_TEXTYELLOW "\033[49;33m"
#define SCIDB_TEXTBLUE   "\033[49;34m"
#define LOG_SILENT 0xffff

//------------------------------------------------------------------------------
//! Log Macros usable in objects inheriting from the LogId Class
//------------------------------------------------------------------------------
#define scidb_log(__SCIDBCOMMON_LOG_PRIORITY__ , ...) \
  scidb::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, this->logId, \
                                            vid, this->cident, __SCIDBCOMMON_LOG_PRIORITY__, __VA_ARGS__)
#define scidb_debug(...) \
  scidb::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, this->logId, \
                                            vid, this->cident, (LOG_DEBUG), __VA_ARGS__)
#define scidb_info(...) \
  scidb::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, this->logId, \
                                            vid, this->cident, (LOG_INFO), __VA_ARGS__)
#define scidb_notice(...) \
  scidb::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, this->logId, \
                                            vid, this->cident, (LOG_NOTICE), __VA_ARGS__)
#define scidb_warning(...) \
  scidb::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, this->logId, \
                                            vid, this->cident, (LOG_WARNING), __VA_ARGS__)
#define scidb_err(...) \
  scidb::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, this->logId, \
                                            vid, this->cident, (LOG_ERR), __VA_ARGS__)
#define scidb_crit(...) \
  scidb::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, this->logId, \
                                            vid, this->cident, (LOG_CRIT), __VA_ARGS__)

//------------------------------------------------------------------------------
//! Log Macros usable from static member functions without LogId object
//------------------------------------------------------------------------------
#define scidb_static_debug(...) \
  scidb::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, "static..............................", \
                                            scidb::common::gLogging.gZeroVid, "", (LOG_DEBUG), __VA_ARGS__)
#define scidb_static_info(...) \
  scidb::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, "static..............................", \
                                            scidb::common::gLogging.gZeroVid, "", (LOG_INFO), __VA_ARGS__)
#define scidb_static_notice(...) \
  scidb::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, "static..............................", \
                                            scidb::common::gLogging.gZeroVid, "", (LOG_NOTICE), __VA_ARGS__)
#define scidb_static_warning(...) \
  scidb::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, "static..............................", \
                                            scidb::common::gLogging.gZeroVid, "", (LOG_WARNING), __VA_ARGS__)
#define scidb_static_err(...) \
  scidb::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, "static..............................", \
                                            scidb::common::gLogging.gZeroVid, "", (LOG_ERR), __VA_ARGS__)
#define scidb_static_crit(...) \
  scidb::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, "static..............................", \
                                            scidb::common::gLogging.gZeroVid, "", (LOG_CRIT), __VA_ARGS__)

//------------------------------------------------------------------------------
//! Log Macros to check if a function would log in a certain log level
//------------------------------------------------------------------------------
#define SCIDB_LOGS_DEBUG   scidb::common::Logging::GetInstance().shouldlog(__FUNCTION__,(LOG_DEBUG)  )
#define SCIDB_LOGS_INFO    scidb::common::Logging::GetInstance().shouldlog(__FUNCTION__,(LOG_INFO)   )

#define SCIDBCOMMONLOGGING_CIRCULARINDEXSIZE 10000

//------------------------------------------------------------------------------
//! Class giving an object a log identity
//------------------------------------------------------------------------------
class LogId
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //----------------------------------------------------------------------------
  LogId()
  {
    uuid_t uuid;
    uuid_generate_time(uuid);
    uuid_unparse(uuid, logId);
    snprintf(cident, sizeof(cident), "<service>");
  }

  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  virtual ~LogId() = default;

  //----------------------------------------------------------------------------
  //! Generate log id value
  //----------------------------------------------------------------------------
  static std::string GenerateLogId()
  {
    char log_id[40];
    uuid_t uuid;
    uuid_generate_time(uuid);
    uuid_unparse(uuid, log_id);
    return log_id;
  }

  //----------------------------------------------------------------------------
  //! For calls which are not client initiated this function sets a unique
  //! dummy log id
  //----------------------------------------------------------------------------
  void
  SetSingleShotLogId(const char* td = "<single-exec>")
  {
    snprintf(logId, sizeof(logId), "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx");
    snprintf(cident, sizeof(cident), "%s", td);
  }

  //----------------------------------------------------------------------------
  //! Sets the logid, vid and trace identifier
  //----------------------------------------------------------------------------
  void
  SetLogId(const char* newlogid, const VirtualIdentity& vid_in,
           const char* td = "")
  {
    vid = vid_in;
    snprintf(cident, sizeof(cident), "%s", td);

    if (newlogid && (newlogid != logId)) {
      snprintf(logId, sizeof(logId), "%s", newlogid);
    }
  }

  char logId[40]; //< the log Id for message printout
  char cident[256]; //< the client identifier
  VirtualIdentity vid; //< the client identity
};

//------------------------------------------------------------------------------
//! Class wrapping global singleton objects for logging
//------------------------------------------------------------------------------
class Logging
{
public:
  //! Typedef for circular index pointing to the next message position in the log array
  typedef std::vector< unsigned long > LogCircularIndex;
  //! Typdef for log message array
  typedef std::vector< std::vector <XrdOucString> > LogArray;
  VirtualIdentity gZeroVid; ///< Root vid
  LogCircularIndex gLogCircularIndex; //< global circular index
  LogArray gLogMemory; //< global logging memory
  unsigned long gCircularIndexSize; //< global circular index size
  int gLogMask; //< log mask
  int gPriorityLevel; //< log priority
  bool gToSysLog; //< duplicate into syslog
  XrdSysMutex gMutex; //< global mutex
  XrdOucString gUnit; //< global unit name
  //! Global list of function names allowed to log
  XrdOucHash<const char*> gAllowFilter;
  //! Global list of function names denied to log
  XrdOucHash<const char*> gDenyFilter;
  int gShortFormat; //< indicating if the log-output is in short format
  //! Here one can define log fan-out to different file descriptors than stderr
  std::map<std::string, FILE*> gLogFanOut;
  bool gRateLimiter; //< indicating to apply message rate limiting

  //----------------------------------------------------------------------------
  //! Get singleton instance
  //----------------------------------------------------------------------------
  static Logging& GetInstance();

  //----------------------------------------------------------------------------
  //! Constructor
  //----------------------------------------------------------------------------
  Logging();

  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  ~Logging() = default;

  //----------------------------------------------------------------------------
  //! Suppress bursts of identical error messages
  //----------------------------------------------------------------------------
  void
  EnableRateLimiter(bool onoff = true)
  {
    gRateLimiter = onoff;
  }

  //----------------------------------------------------------------------------
  //! Switch to the short message header (no identity fields)
  //----------------------------------------------------------------------------
  void
  SetShortFormat(bool onoff)
  {
    gShortFormat = onoff ? 1 : 0;
  }

  //----------------------------------------------------------------------------
  //! Get current loglevel
  //----------------------------------------------------------------------------
  int
  GetLogMask() const
  {
    return gLogMask;
  }

  //----------------------------------------------------------------------------
  //! Set the log priority (like syslog)
  //----------------------------------------------------------------------------
  void
  SetLogPriority(int pri)
  {
    gLogMask = LOG_UPTO(pri);
    gPriorityLevel = pri;
  }

  //----------------------------------------------------------------------------
  //! Set the log unit name
  //----------------------------------------------------------------------------
  void
  SetUnit(const char* unit)
  {
    gUnit = unit;
  }

  void
  SetSysLog(bool onoff)
  {
    gToSysLog = onoff;
  }

  //----------------------------------------------------------------------------
  //! Set index size
  //----------------------------------------------------------------------------
  void SetIndexSize(size_t size);

  //----------------------------------------------------------------------------
  //! Set the log filter
  //!
  //! @param filter comma separated list of function names which are denied
  //!        to log, or with a 'PASS:' prefix the only ones allowed to log
  //----------------------------------------------------------------------------
  void SetFilter(const char* filter);

  //----------------------------------------------------------------------------
  //! Return priority as string
  //----------------------------------------------------------------------------
  const char* GetPriorityString(int pri);

  //----------------------------------------------------------------------------
  //! Return priority int from string, -1 if unknown
  //----------------------------------------------------------------------------
  int GetPriorityByString(const char* pri);

  //----------------------------------------------------------------------------
  //! Add a tag fanout filedescriptor to the logging module
  //----------------------------------------------------------------------------
  void
  AddFanOut(const char* tag, FILE* fd)
  {
    gLogFanOut[tag] = fd;
  }

  //----------------------------------------------------------------------------
  //! Add a tag fanout alias to the logging module
  //----------------------------------------------------------------------------
  void
  AddFanOutAlias(const char* alias, const char* tag)
  {
    if (gLogFanOut.count(tag)) {
      gLogFanOut[alias] = gLogFanOut[tag];
    }
  }

  //----------------------------------------------------------------------------
  //! Get a color for a given logging level
  //----------------------------------------------------------------------------
  const char* GetLogColour(const char* loglevel);

  //----------------------------------------------------------------------------
  //! Check if we should log in the defined level/filter
  //!
  //! @param func name of the calling function
  //! @param priority priority level of the message
  //----------------------------------------------------------------------------
  bool shouldlog(const char* func, int priority);

  //----------------------------------------------------------------------------
  //! Log a message into the global buffer
  //!
  //! @param func name of the calling function
  //! @param file name of the source file calling
  //! @param line line in the source file
  //! @param logid log message identifier
  //! @param vid virtual id of the caller
  //! @param cident client identifier
  //! @param priority priority level of the message
  //! @param msg the actual log message
  //!
  //! @return the formatted log message, empty if it was filtered
  //----------------------------------------------------------------------------
  std::string log(const char* func, const char* file, int line,
                  const char* logid, const VirtualIdentity& vid,
                  const char* cident, int priority, const char* msg, ...)
  __attribute__((format(printf, 9, 10)));

  //----------------------------------------------------------------------------
  //! Return the last messages kept in memory for the given priority
  //!
  //! @param priority priority level
  //! @param max maximum number of messages, oldest first
  //----------------------------------------------------------------------------
  std::vector<std::string> GetRecent(int priority, size_t max);

  //----------------------------------------------------------------------------
  //! Estimates log message distance and similarity to suppress log messages
  //!
  //! @return true if it should be suppressed, otherwise false
  //----------------------------------------------------------------------------
  bool rate_limit(struct timeval& tv, int priority, const char* file, int line);
};

extern Logging& gLogging; ///< Global logging object

//------------------------------------------------------------------------------
//! Static Logging initializer
//------------------------------------------------------------------------------
static struct LoggingInitializer {
  LoggingInitializer();
  ~LoggingInitializer();
} sLoggingInit; ///< Static initializer for every translation unit

SCIDBCOMMONNAMESPACE_END

#endif
