// ----------------------------------------------------------------------
// File: Config.hh
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

#ifndef __SCIDBCOMMON_CONFIG_HH__
#define __SCIDBCOMMON_CONFIG_HH__

#include "common/Namespace.hh"
#include <sstream>
#include <string>
#include <map>
#include <vector>

SCIDBCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Chapter based configuration file support. A file looks like
//!
//!   [sysconfig]
//!   ROOT=/var/lib/scidb
//!   [registry]
//!   catalog=${ROOT}/catalog.db
//!
//! Lines starting with '#' are comments. Values of every chapter can refer to
//! definitions of the 'sysconfig' chapter with $VAR or ${VAR}.
//------------------------------------------------------------------------------
class Config
{
public:
  typedef std::vector<std::string> ConfigSection;
  typedef std::map<std::string, ConfigSection> ConfigChapter;

  //----------------------------------------------------------------------------
  //! Default constructor
  //----------------------------------------------------------------------------
  Config() : errcode(0) {}

  //----------------------------------------------------------------------------
  //! Load /etc/scidb/config/<service>/<name>, or the file named by the
  //! SCIDB_CONFIG environment variable if it is set
  //!
  //! @return true if loaded successfully, otherwise set error code/msg
  //----------------------------------------------------------------------------
  bool Load(const char* service, const char* name = "default",
            bool reset = true);

  //----------------------------------------------------------------------------
  //! Load a configuration file from an explicit path
  //----------------------------------------------------------------------------
  bool LoadFile(const std::string& path, bool reset = true);

  //----------------------------------------------------------------------------
  //! Parse configuration from a string
  //----------------------------------------------------------------------------
  bool Parse(const std::string& contents);

  //----------------------------------------------------------------------------
  //! Parse and possibly return a chapter entry
  //----------------------------------------------------------------------------
  std::string ParseChapter(const std::string& line);

  //----------------------------------------------------------------------------
  //! Parse and possibly return a section entry
  //----------------------------------------------------------------------------
  std::string ParseSection(const std::string& line);

  bool ok() const
  {
    return (errcode == 0);
  }

  int getErrc() const
  {
    return errcode;
  }

  std::string getMsg() const
  {
    return errorMessage;
  }

  //----------------------------------------------------------------------------
  //! To string, including error code
  //----------------------------------------------------------------------------
  std::string toString() const
  {
    std::ostringstream ss;
    ss << "(" << errcode << "): " << errorMessage;
    return ss.str();
  }

  operator bool() const
  {
    return ok();
  }

  //----------------------------------------------------------------------------
  //! Overloaded [] operator, returns an empty section for unknown chapters
  //----------------------------------------------------------------------------
  const ConfigSection& operator[](const char* i) const;

  //----------------------------------------------------------------------------
  //! Replace variables from a chapter until they are resolved
  //----------------------------------------------------------------------------
  void ReplaceFromChapter(std::string& s, const char* substitute_chapter) const;

  //----------------------------------------------------------------------------
  //! Config dumper
  //----------------------------------------------------------------------------
  std::string Dump(const char* chapter = 0, bool substitute = false,
                   const char* substitute_chapter = "sysconfig") const;

  //----------------------------------------------------------------------------
  //! Test for configuration chapter
  //----------------------------------------------------------------------------
  bool Has(const char* chapter) const
  {
    return conf.count(chapter);
  }

  //----------------------------------------------------------------------------
  //! Get substituted <value> of line '<key>=<value>' in chapter
  //!
  //! @param chapter chapter name
  //! @param key key to look for
  //! @param dflt value returned if the key is absent
  //----------------------------------------------------------------------------
  std::string GetValueByKey(const char* chapter, const char* key,
                            const std::string& dflt = "") const;

  //----------------------------------------------------------------------------
  //! Return a map with the lines matching x=y in chapter, values substituted
  //----------------------------------------------------------------------------
  std::map<std::string, std::string> AsMap(const char* chapter) const;

private:
  //----------------------------------------------------------------------------
  //! Locate the next variable reference in s
  //----------------------------------------------------------------------------
  static std::string ParseVariable(const std::string& s, size_t& start,
                                   size_t& stop);

  int errcode;
  std::string errorMessage;
  ConfigChapter conf;
};

SCIDBCOMMONNAMESPACE_END

#endif
