// ----------------------------------------------------------------------
// File: Config.cc
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

#include "common/Config.hh"
#include "common/Logging.hh"
#include "common/StringConversion.hh"
#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>

SCIDBCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
// Load a configuration file for a service
//------------------------------------------------------------------------------
bool
Config::Load(const char* service, const char* name, bool reset)
{
  std::string path = "/etc/scidb/config/";
  path += service;
  path += "/";
  path += name;

  if (getenv("SCIDB_CONFIG")) {
    path = getenv("SCIDB_CONFIG");
  }

  return LoadFile(path, reset);
}

//------------------------------------------------------------------------------
// Load a configuration file from a path
//------------------------------------------------------------------------------
bool
Config::LoadFile(const std::string& path, bool reset)
{
  if (reset) {
    // wipe previous configuration
    conf.clear();
    errcode = 0 ;
    errorMessage = "";
  }

  scidb_static_info("msg=\"loading configuration\" path=\"%s\"", path.c_str());
  struct stat buf;

  if (stat(path.c_str(), &buf)) {
    errcode = errno;
    errorMessage = "error: unable to load '" + path + "' : ";
    errorMessage += strerror(errno);
    return false;
  }

  std::string in;

  if (!StringConversion::LoadFileIntoString(path.c_str(), in)) {
    errcode = EIO;
    errorMessage = "error: unable to read '" + path + "'";
    return false;
  }

  return Parse(in);
}

//------------------------------------------------------------------------------
// Parse configuration contents
//------------------------------------------------------------------------------
bool
Config::Parse(const std::string& contents)
{
  std::istringstream f(contents);
  std::string line;
  std::string chapter;

  while (std::getline(f, line)) {
    std::string p = ParseChapter(line);

    if (p.empty()) {
      p = ParseSection(line);

      if (!p.empty()) {
        if (!chapter.empty()) {
          conf[chapter].push_back(p);
        } else {
          errcode = EINVAL;
          errorMessage = "error: no chapter header in config file";
          return false;
        }
      }
    } else {
      chapter = p;
      conf[chapter];
    }
  }

  return true;
}

//------------------------------------------------------------------------------
// Parse and possibly return a chapter entry
//------------------------------------------------------------------------------
std::string
Config::ParseChapter(const std::string& line)
{
  std::string pline = StringConversion::Trim(line);

  // skip comments
  if (pline.empty() || pline.front() == '#') {
    return "";
  }

  if ((pline.front() == '[') && (pline.back() == ']')) {
    pline.pop_back();
    pline.erase(0, 1);
    return StringConversion::Trim(pline);
  }

  return "";
}

//------------------------------------------------------------------------------
// Parse and possibly return a section entry
//------------------------------------------------------------------------------
std::string
Config::ParseSection(const std::string& line)
{
  std::string pline = StringConversion::Trim(line);

  // skip comments
  if (pline.empty() || pline.front() == '#') {
    return "";
  }

  return pline;
}

//------------------------------------------------------------------------------
// Overloaded [] operator
//------------------------------------------------------------------------------
const Config::ConfigSection&
Config::operator[](const char* i) const
{
  static const ConfigSection none;
  auto it = conf.find(i);
  return (it == conf.end()) ? none : it->second;
}

//------------------------------------------------------------------------------
// Locate the next $VAR or ${VAR} reference
//------------------------------------------------------------------------------
std::string
Config::ParseVariable(const std::string& s, size_t& start, size_t& stop)
{
  size_t vstart = s.find("$");
  start = stop = 0;

  if ((vstart == std::string::npos) || (vstart + 1 >= s.length())) {
    return "";
  }

  if (s.at(vstart + 1) == '{') {
    size_t vstop = s.find("}", vstart);

    if (vstop == std::string::npos) {
      return "";
    }

    start = vstart;
    stop = vstop + 1;
    return s.substr(vstart + 2, vstop - vstart - 2);
  }

  size_t vstop = s.find_first_of(" /:,", vstart + 1);

  if (vstop == std::string::npos) {
    vstop = s.length();
  }

  start = vstart;
  stop = vstop;
  return s.substr(vstart + 1, vstop - vstart - 1);
}

//------------------------------------------------------------------------------
// Replace variables from a chapter until they are resolved
//------------------------------------------------------------------------------
void
Config::ReplaceFromChapter(std::string& s, const char* substitute_chapter) const
{
  if (!Has(substitute_chapter)) {
    return;
  }

  std::map<std::string, std::string> m;

  for (const auto& line : (*this)[substitute_chapter]) {
    std::string key, value;

    if (StringConversion::SplitKeyValue(line, key, value, "=")) {
      m[StringConversion::Trim(key)] = StringConversion::Trim(value);
    }
  }

  std::string var;
  size_t p1, p2;
  // bounded to stop on self referencing definitions
  int rounds = 64;

  while (rounds-- && (var = ParseVariable(s, p1, p2)).length()) {
    auto it = m.find(var);

    if (it == m.end()) {
      break;
    }

    s.erase(p1, p2 - p1);
    s.insert(p1, it->second);
  }
}

//------------------------------------------------------------------------------
// Config dumper
//------------------------------------------------------------------------------
std::string
Config::Dump(const char* chapter, bool substitute,
             const char* substitute_chapter) const
{
  std::string out;

  for (const auto& c : conf) {
    if (chapter && (c.first != chapter)) {
      continue;
    }

    if (!chapter) {
      out += "[";
      out += c.first;
      out += "]\n";
    }

    for (auto line : c.second) {
      if (substitute) {
        ReplaceFromChapter(line, substitute_chapter);
      }

      out += line;
      out += "\n";
    }
  }

  return out;
}

//------------------------------------------------------------------------------
// Get value for key in chapter
//------------------------------------------------------------------------------
std::string
Config::GetValueByKey(const char* chapter, const char* key,
                      const std::string& dflt) const
{
  std::map<std::string, std::string> map = AsMap(chapter);
  auto it = map.find(key);
  return (it == map.end()) ? dflt : it->second;
}

//------------------------------------------------------------------------------
// AsMap
//------------------------------------------------------------------------------
std::map<std::string, std::string>
Config::AsMap(const char* chapter) const
{
  std::map<std::string, std::string> map;

  if (!chapter || !Has(chapter)) {
    return map;
  }

  for (const auto& line : (*this)[chapter]) {
    std::string key, value;

    if (StringConversion::SplitKeyValue(line, key, value, "=")) {
      ReplaceFromChapter(value, "sysconfig");
      map[StringConversion::Trim(key)] = StringConversion::Trim(value);
    } else {
      scidb_static_debug("msg=\"skip config line without '='\" chapter=%s "
                         "line=\"%s\"", chapter, line.c_str());
    }
  }

  return map;
}

SCIDBCOMMONNAMESPACE_END
