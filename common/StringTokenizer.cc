// ----------------------------------------------------------------------
// File: StringTokenizer.cc
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

#include "common/StringTokenizer.hh"

SCIDBCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
// Constructor - only splits lines, tokens are split by GetLine
//------------------------------------------------------------------------------
StringTokenizer::StringTokenizer(const char* s)
{
  if (s == nullptr) {
    return;
  }

  mBuffer = s;
  bool inquote = false;

  if (!mBuffer.empty()) {
    mLineStart.push_back(0);
  }

  for (size_t i = 0; i < mBuffer.length(); i++) {
    if ((mBuffer[i] == '"') && ((i == 0) || (mBuffer[i - 1] != '\\'))) {
      inquote = !inquote;
    }

    if ((!inquote) && (mBuffer[i] == '\n') && (i + 1 < mBuffer.length())) {
      mLineStart.push_back(i + 1);
    }
  }
}

//------------------------------------------------------------------------------
// Return the next parsed line
//------------------------------------------------------------------------------
const char*
StringTokenizer::GetLine()
{
  mCurrentLine++;
  mCurrentArg = -1;
  mLineArgs.clear();

  if (mCurrentLine >= (int) mLineStart.size()) {
    return nullptr;
  }

  size_t start = mLineStart[mCurrentLine];
  size_t end = (mCurrentLine + 1 < (int) mLineStart.size()) ?
               mLineStart[mCurrentLine + 1] - 1 : mBuffer.length();
  std::string word;
  bool inquote = false;
  bool inword = false;

  for (size_t i = start; i <= end; i++) {
    char c = (i < end) ? mBuffer[i] : ' ';

    if ((c == '\\') && (i + 1 < end) &&
        ((mBuffer[i + 1] == ' ') || (mBuffer[i + 1] == '"'))) {
      word += mBuffer[++i];
      inword = true;
      continue;
    }

    if (c == '"') {
      inquote = !inquote;
      inword = true;
      continue;
    }

    if (((c == ' ') || (c == '\t') || (c == '\n')) && !inquote) {
      if (inword) {
        mLineArgs.push_back(word);
        word.clear();
        inword = false;
      }

      continue;
    }

    word += c;
    inword = true;
  }

  if (inword) {
    mLineArgs.push_back(word);
  }

  return mBuffer.c_str() + start;
}

//------------------------------------------------------------------------------
// Return next token
//------------------------------------------------------------------------------
const char*
StringTokenizer::GetToken()
{
  mCurrentArg++;

  if (mCurrentArg < (int) mLineArgs.size()) {
    return mLineArgs[mCurrentArg].c_str();
  }

  return nullptr;
}

//------------------------------------------------------------------------------
// Remaining tokens of the line
//------------------------------------------------------------------------------
std::vector<std::string>
StringTokenizer::RemainingTokens()
{
  std::vector<std::string> rest;
  std::string token;

  while (NextToken(token)) {
    rest.push_back(token);
  }

  return rest;
}

SCIDBCOMMONNAMESPACE_END
