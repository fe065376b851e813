// ----------------------------------------------------------------------
// File: Timing.cc
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

#include "common/Timing.hh"
#include <cctype>
#include <cstdio>
#include <cstring>

SCIDBCOMMONNAMESPACE_BEGIN

namespace
{
//------------------------------------------------------------------------------
// Parse exactly n digits at pos, advance pos
//------------------------------------------------------------------------------
bool
ParseDigits(const std::string& s, size_t& pos, size_t n, int& value)
{
  if (pos + n > s.length()) {
    return false;
  }

  value = 0;

  for (size_t i = 0; i < n; ++i) {
    char c = s[pos + i];

    if (!isdigit(static_cast<unsigned char>(c))) {
      return false;
    }

    value = value * 10 + (c - '0');
  }

  pos += n;
  return true;
}

//------------------------------------------------------------------------------
// Expect a literal character at pos, advance pos
//------------------------------------------------------------------------------
bool
Expect(const std::string& s, size_t& pos, char c)
{
  if ((pos < s.length()) && (s[pos] == c)) {
    ++pos;
    return true;
  }

  return false;
}

//------------------------------------------------------------------------------
// Parse a numeric UTC offset '+HH:MM', '+HHMM' or '+HH' into seconds
//------------------------------------------------------------------------------
bool
ParseOffset(const std::string& s, size_t& pos, int& offset)
{
  int sign = (s[pos] == '-') ? -1 : 1;
  int hh = 0, mm = 0;
  ++pos;

  if (!ParseDigits(s, pos, 2, hh)) {
    return false;
  }

  if (pos < s.length()) {
    Expect(s, pos, ':');

    if (!ParseDigits(s, pos, 2, mm)) {
      return false;
    }
  }

  if ((hh > 23) || (mm > 59)) {
    return false;
  }

  offset = sign * (hh * 3600 + mm * 60);
  return true;
}
}

//------------------------------------------------------------------------------
// Render microseconds as ISO8601
//------------------------------------------------------------------------------
std::string
Timing::Micros_to_ISO8601(int64_t micros)
{
  int64_t secs = micros / 1000000;
  int64_t frac = micros % 1000000;

  if (frac < 0) {
    frac += 1000000;
    --secs;
  }

  std::string iso = UnixTimestamp_to_ISO8601(static_cast<time_t>(secs));
  char sfrac[16];
  snprintf(sfrac, sizeof(sfrac), ".%06lld", (long long) frac);
  iso.insert(iso.length() - 1, sfrac);
  return iso;
}

//------------------------------------------------------------------------------
// Parse timestamp string
//------------------------------------------------------------------------------
bool
Timing::ParseTimestamp(const std::string& in, int64_t& micros)
{
  size_t pos = 0;
  struct tm tm;
  memset(&tm, 0, sizeof(tm));
  int year, mon, day;

  if (!ParseDigits(in, pos, 4, year) || !Expect(in, pos, '-') ||
      !ParseDigits(in, pos, 2, mon) || !Expect(in, pos, '-') ||
      !ParseDigits(in, pos, 2, day)) {
    return false;
  }

  if ((mon < 1) || (mon > 12) || (day < 1) || (day > 31)) {
    return false;
  }

  int hh = 0, mm = 0, ss = 0;
  int64_t frac = 0;
  int offset = 0;

  if (pos < in.length()) {
    if ((in[pos] != 'T') && (in[pos] != ' ')) {
      return false;
    }

    ++pos;

    if (!ParseDigits(in, pos, 2, hh) || !Expect(in, pos, ':') ||
        !ParseDigits(in, pos, 2, mm)) {
      return false;
    }

    if (Expect(in, pos, ':') && !ParseDigits(in, pos, 2, ss)) {
      return false;
    }

    if ((hh > 23) || (mm > 59) || (ss > 60)) {
      return false;
    }

    if (Expect(in, pos, '.')) {
      int digits = 0;

      while ((pos < in.length()) && isdigit(static_cast<unsigned char>(in[pos]))) {
        if (digits < 6) {
          frac = frac * 10 + (in[pos] - '0');
        }

        ++digits;
        ++pos;
      }

      if (!digits) {
        return false;
      }

      for (; digits < 6; ++digits) {
        frac *= 10;
      }
    }

    if (pos < in.length()) {
      std::string rest = in.substr(pos);

      if ((rest == "Z") || (rest == " UTC") || (rest == " GMT") ||
          (rest == "UTC")) {
        pos = in.length();
      } else if ((rest.length() > 1) && (rest[0] == '+') &&
                 ((rest[1] == '+') || (rest[1] == '-'))) {
        // producer wrote a literal '+' before the offset, the offset is
        // dropped and the wall time is taken as UTC
        int ignored = 0;
        ++pos;

        if (!ParseOffset(in, pos, ignored)) {
          return false;
        }
      } else if ((rest[0] == '+') || (rest[0] == '-')) {
        if (!ParseOffset(in, pos, offset)) {
          return false;
        }
      } else {
        return false;
      }

      if (pos != in.length()) {
        return false;
      }
    }
  }

  tm.tm_year = year - 1900;
  tm.tm_mon = mon - 1;
  tm.tm_mday = day;
  tm.tm_hour = hh;
  tm.tm_min = mm;
  tm.tm_sec = ss;
  time_t secs = timegm(&tm);
  micros = (static_cast<int64_t>(secs) - offset) * 1000000 + frac;
  return true;
}

SCIDBCOMMONNAMESPACE_END
