// ----------------------------------------------------------------------
// File: StringConversion.cc
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

#include "common/StringConversion.hh"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

SCIDBCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
// Tokenize a string
//------------------------------------------------------------------------------
void
StringConversion::Tokenize(const std::string& str,
                           std::vector<std::string>& tokens,
                           const std::string& delimiters)
{
  // Skip delimiters at the beginning
  std::string::size_type lastPos = str.find_first_not_of(delimiters, 0);
  // Find first "non-delimiter"
  std::string::size_type pos = str.find_first_of(delimiters, lastPos);

  while (std::string::npos != pos || std::string::npos != lastPos) {
    tokens.push_back(str.substr(lastPos, pos - lastPos));
    lastPos = str.find_first_not_of(delimiters, pos);
    pos = str.find_first_of(delimiters, lastPos);
  }
}

//------------------------------------------------------------------------------
// Split a 'key<split>value' definition into key + value
//------------------------------------------------------------------------------
bool
StringConversion::SplitKeyValue(const std::string& keyval, std::string& key,
                                std::string& value, const std::string& split)
{
  auto equalpos = keyval.find(split);

  if (equalpos != std::string::npos) {
    key.assign(keyval, 0, equalpos);
    value.assign(keyval, equalpos + split.length(), std::string::npos);
    return true;
  }

  key = value = "";
  return false;
}

//------------------------------------------------------------------------------
// Split a separated key:val list and fill it into a map
//------------------------------------------------------------------------------
bool
StringConversion::GetKeyValueMap(const char* mapstring,
                                 std::map<std::string, std::string>& map,
                                 const char* split, const char* delimiter)
{
  if (!mapstring) {
    return false;
  }

  std::vector<std::string> slist;
  Tokenize(mapstring, slist, delimiter);

  if (!slist.size()) {
    return false;
  }

  for (const auto& item : slist) {
    std::string key;
    std::string val;

    if (!SplitKeyValue(item, key, val, split)) {
      return false;
    }

    map[Trim(key)] = Trim(val);
  }

  return true;
}

//------------------------------------------------------------------------------
// Convert binary buffer to hex string
//------------------------------------------------------------------------------
std::string
StringConversion::BinData2HexString(const unsigned char* buf, size_t len)
{
  static const char* const lut = "0123456789abcdef";
  std::string output;
  output.reserve(2 * len);

  for (size_t i = 0; i < len; ++i) {
    output.push_back(lut[buf[i] >> 4]);
    output.push_back(lut[buf[i] & 15]);
  }

  return output;
}

//------------------------------------------------------------------------------
// Lowercase copy
//------------------------------------------------------------------------------
std::string
StringConversion::ToLower(const std::string& input)
{
  std::string out = input;
  std::transform(out.begin(), out.end(), out.begin(),
  [](unsigned char c) {
    return std::tolower(c);
  });
  return out;
}

//------------------------------------------------------------------------------
// Trim white space
//------------------------------------------------------------------------------
std::string
StringConversion::Trim(const std::string& input)
{
  static const char* ws = " \t\r\n";
  size_t begin = input.find_first_not_of(ws);

  if (begin == std::string::npos) {
    return "";
  }

  size_t end = input.find_last_not_of(ws);
  return input.substr(begin, end - begin + 1);
}

//------------------------------------------------------------------------------
// Load a text file <name> into a string
//------------------------------------------------------------------------------
bool
StringConversion::LoadFileIntoString(const char* filename, std::string& out)
{
  std::ifstream load(filename, std::ios::in | std::ios::binary);

  if (!load.is_open()) {
    out.clear();
    return false;
  }

  std::stringstream buffer;
  buffer << load.rdbuf();
  out = buffer.str();
  return true;
}

//------------------------------------------------------------------------------
// Save a string into a text file <name>
//------------------------------------------------------------------------------
bool
StringConversion::SaveStringIntoFile(const char* filename,
                                     const std::string& in)
{
  std::ofstream save(filename, std::ios::out | std::ios::binary |
                     std::ios::trunc);

  if (!save.is_open()) {
    return false;
  }

  save.write(in.c_str(), in.size());
  return save.good();
}

SCIDBCOMMONNAMESPACE_END
