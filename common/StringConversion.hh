// ----------------------------------------------------------------------
// File: StringConversion.hh
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

#ifndef __SCIDBCOMMON_STRINGCONVERSION_HH__
#define __SCIDBCOMMON_STRINGCONVERSION_HH__

#include "common/Namespace.hh"
#include <map>
#include <string>
#include <vector>

SCIDBCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Static helper class with convenience functions for string tokenizing,
//! key-value splitting and hex encoding
//------------------------------------------------------------------------------
class StringConversion
{
public:
  //----------------------------------------------------------------------------
  //! Tokenize a string, empty members are skipped
  //!
  //! @param str string to be tokenized
  //! @param tokens returned list of tokens, appended to
  //! @param delimiters string of delimiter characters
  //----------------------------------------------------------------------------
  static void Tokenize(const std::string& str,
                       std::vector<std::string>& tokens,
                       const std::string& delimiters = " ");

  //----------------------------------------------------------------------------
  //! Split a 'key<split>value' definition into key and value
  //!
  //! @return true if the separator was found, otherwise false
  //----------------------------------------------------------------------------
  static bool SplitKeyValue(const std::string& keyval, std::string& key,
                            std::string& value, const std::string& split = ":");

  //----------------------------------------------------------------------------
  //! Split a delimiter separated key:val list and fill it into a map
  //!
  //! @param mapstring input string e.g. "a=1,b=2"
  //! @param map output map
  //! @param split key-value separator
  //! @param delimiter list delimiter
  //!
  //! @return true if every member could be split, otherwise false
  //----------------------------------------------------------------------------
  static bool GetKeyValueMap(const char* mapstring,
                             std::map<std::string, std::string>& map,
                             const char* split = ":",
                             const char* delimiter = ",");

  //----------------------------------------------------------------------------
  //! Convert a binary buffer to its lowercase hex representation
  //----------------------------------------------------------------------------
  static std::string BinData2HexString(const unsigned char* buf, size_t len);

  //----------------------------------------------------------------------------
  //! Return lowercase copy of the input
  //----------------------------------------------------------------------------
  static std::string ToLower(const std::string& input);

  //----------------------------------------------------------------------------
  //! Remove leading and trailing white space
  //----------------------------------------------------------------------------
  static std::string Trim(const std::string& input);

  //----------------------------------------------------------------------------
  //! Check if str starts with prefix
  //----------------------------------------------------------------------------
  static bool StartsWith(const std::string& str, const std::string& prefix)
  {
    return (str.compare(0, prefix.length(), prefix) == 0);
  }

  //----------------------------------------------------------------------------
  //! Check if str ends with suffix
  //----------------------------------------------------------------------------
  static bool EndsWith(const std::string& str, const std::string& suffix)
  {
    return (str.length() >= suffix.length()) &&
           (str.compare(str.length() - suffix.length(), suffix.length(),
                        suffix) == 0);
  }

  //----------------------------------------------------------------------------
  //! Load a text file <name> into a string
  //!
  //! @return true if the file could be read
  //----------------------------------------------------------------------------
  static bool LoadFileIntoString(const char* filename, std::string& out);

  //----------------------------------------------------------------------------
  //! Save a string into a text file <name>
  //----------------------------------------------------------------------------
  static bool SaveStringIntoFile(const char* filename, const std::string& in);

private:
  StringConversion() = delete;
};

SCIDBCOMMONNAMESPACE_END

#endif
