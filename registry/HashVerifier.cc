// ----------------------------------------------------------------------
// File: HashVerifier.cc
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

#include "registry/HashVerifier.hh"
#include "common/checksum/SHA256.hh"
#include "common/StringConversion.hh"
#include "common/Logging.hh"
#include "namespace/MDException.hh"
#include <algorithm>
#include <sstream>

SCIDBREGISTRYNAMESPACE_BEGIN

namespace
{
//------------------------------------------------------------------------------
// Add a length prefixed field to the running digest
//------------------------------------------------------------------------------
void
AddField(common::SHA256& xs, const std::string& data)
{
  unsigned char prefix[8];
  uint64_t len = data.length();

  for (int i = 7; i >= 0; --i) {
    prefix[i] = static_cast<unsigned char>(len & 0xff);
    len >>= 8;
  }

  xs.Add(reinterpret_cast<const char*>(prefix), sizeof(prefix),
         xs.GetLastOffset());
  xs.Add(data.data(), data.length(), xs.GetLastOffset());
}
}

//------------------------------------------------------------------------------
// Report as string
//------------------------------------------------------------------------------
std::string
VerificationReport::ToString() const
{
  std::ostringstream oss;
  oss << "match=" << (match ? "true" : "false")
      << " claimed=" << claimed << " computed=" << computed;

  if (!failed_entry.empty()) {
    oss << " entry=\"" << failed_entry << "\"";
  }

  if (!reason.empty()) {
    oss << " reason=\"" << reason << "\"";
  }

  return oss.str();
}

//------------------------------------------------------------------------------
// Digest of a single entry
//------------------------------------------------------------------------------
std::string
HashVerifier::EntryDigest(const std::string& bytes)
{
  return common::SHA256::Hex(bytes);
}

//------------------------------------------------------------------------------
// Digest over named payloads
//------------------------------------------------------------------------------
std::string
HashVerifier::Compute(const std::map<std::string, std::string>& payloads)
{
  // std::map iterates in byte-wise name order
  common::SHA256 xs;

  for (const auto& payload : payloads) {
    AddField(xs, payload.first);
    AddField(xs, payload.second);
  }

  xs.Finalize();
  return xs.GetHexChecksum();
}

//------------------------------------------------------------------------------
// Verify manifest entries against a claimed digest
//------------------------------------------------------------------------------
VerificationReport
HashVerifier::Verify(const std::vector<ns::FileEntry>& entries,
                     const std::string& claimed) const
{
  VerificationReport report;
  report.claimed = claimed;
  std::vector<const ns::FileEntry*> sorted;
  sorted.reserve(entries.size());

  for (const auto& entry : entries) {
    sorted.push_back(&entry);
  }

  std::sort(sorted.begin(), sorted.end(),
  [](const ns::FileEntry * a, const ns::FileEntry * b) {
    return a->name < b->name;
  });

  for (size_t i = 1; i < sorted.size(); ++i) {
    if (sorted[i]->name == sorted[i - 1]->name) {
      report.failed_entry = sorted[i]->name;
      report.reason = "duplicate entry name";
      return report;
    }
  }

  common::SHA256 xs;

  for (const auto* entry : sorted) {
    std::string bytes;

    try {
      bytes = mStore.get(entry->content_reference);
    } catch (const ns::NotFoundError& e) {
      report.failed_entry = entry->name;
      report.reason = "content missing in store";
      return report;
    }

    if (bytes.length() != entry->size) {
      report.failed_entry = entry->name;
      report.reason = SSTR("size mismatch recorded=" << entry->size
                           << " stored=" << bytes.length());
      return report;
    }

    std::string digest = EntryDigest(bytes);

    if (digest != common::StringConversion::ToLower(entry->checksum)) {
      report.failed_entry = entry->name;
      report.reason = SSTR("checksum mismatch recorded=" << entry->checksum
                           << " stored=" << digest);
      return report;
    }

    AddField(xs, entry->name);
    AddField(xs, bytes);
  }

  xs.Finalize();
  report.computed = xs.GetHexChecksum();
  report.match = (report.computed ==
                  common::StringConversion::ToLower(common::StringConversion::Trim(claimed)));

  if (!report.match) {
    report.reason = "payload digest mismatch";
  }

  return report;
}

SCIDBREGISTRYNAMESPACE_END
