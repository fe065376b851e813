// ----------------------------------------------------------------------
// File: StringTokenizer.hh
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

#pragma once
#include "common/Namespace.hh"
#include <string>
#include <vector>

SCIDBCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Utility class for command line parsing.
//!
//! Splits a buffer into lines and each line into blank separated tokens. A
//! token enclosed in " may contain blanks, a blank escaped with \ does not
//! split a token. Returned tokens have the enclosing quotes removed.
//------------------------------------------------------------------------------
class StringTokenizer
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //----------------------------------------------------------------------------
  StringTokenizer(const char* s);

  StringTokenizer(const std::string& s) : StringTokenizer(s.c_str()) {}

  //----------------------------------------------------------------------------
  //! Get next parsed line separated by \n
  //!
  //! @return next line or nullptr
  //----------------------------------------------------------------------------
  const char* GetLine();

  //----------------------------------------------------------------------------
  //! Return next token of the current line
  //!
  //! @return next token or nullptr if no token is left
  //----------------------------------------------------------------------------
  const char* GetToken();

  //----------------------------------------------------------------------------
  //! Get next token and return it in the supplied string
  //!
  //! @return true if token retrieved, otherwise false
  //----------------------------------------------------------------------------
  bool NextToken(std::string& token)
  {
    const char* tmp = GetToken();
    token = tmp ? tmp : "";
    return tmp != nullptr;
  }

  //----------------------------------------------------------------------------
  //! Remaining tokens of the current line
  //----------------------------------------------------------------------------
  std::vector<std::string> RemainingTokens();

private:
  std::string mBuffer;
  std::vector<size_t> mLineStart;
  std::vector<std::string> mLineArgs;
  int mCurrentLine {-1};
  int mCurrentArg {-1};
};

SCIDBCOMMONNAMESPACE_END
