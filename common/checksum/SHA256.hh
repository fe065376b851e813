// ----------------------------------------------------------------------
// File: SHA256.hh
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

#ifndef __SCIDBCOMMON_SHA256_HH__
#define __SCIDBCOMMON_SHA256_HH__

#include "common/Namespace.hh"
#include "common/checksum/CheckSum.hh"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <cstring>
#include <cstdio>
#include <new>

SCIDBCOMMONNAMESPACE_BEGIN

class SHA256 : public CheckSum
{
private:
  EVP_MD_CTX* ctx;
  off_t sha256offset;
  unsigned char sha256[SHA256_DIGEST_LENGTH + 1];

public:
  SHA256() : CheckSum("sha256"), ctx(EVP_MD_CTX_new())
  {
    if (ctx == nullptr) {
      throw std::bad_alloc();
    }

    Reset();
  }

  ~SHA256() override
  {
    EVP_MD_CTX_free(ctx);
  }

  SHA256(const SHA256&) = delete;
  SHA256& operator=(const SHA256&) = delete;

  //----------------------------------------------------------------------------
  //! Convenience function returning the hex digest of a buffer
  //----------------------------------------------------------------------------
  static std::string Hex(const std::string& data)
  {
    SHA256 xs;
    xs.Append(data);
    xs.Finalize();
    return xs.GetHexChecksum();
  }

  off_t
  GetLastOffset() override
  {
    return sha256offset;
  }

  bool
  Add(const char* buffer, size_t length, off_t offset) override
  {
    if ((offset != sha256offset) || finalized) {
      needsRecalculation = true;
      return false;
    }

    EVP_DigestUpdate(ctx, (const void*) buffer, length);
    sha256offset += length;
    return true;
  }

  const char*
  GetHexChecksum() override
  {
    Checksum = "";
    char hexs[16];

    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
      snprintf(hexs, sizeof(hexs), "%02x", sha256[i]);
      Checksum += hexs;
    }

    return Checksum.c_str();
  }

  const char*
  GetBinChecksum(int& len) override
  {
    len = SHA256_DIGEST_LENGTH;
    return (char*) &sha256;
  }

  int
  GetCheckSumLen() override
  {
    return SHA256_DIGEST_LENGTH;
  }

  void
  Finalize() override
  {
    if (!finalized) {
      unsigned int sz = 0;
      EVP_DigestFinal_ex(ctx, sha256, &sz);
      sha256[SHA256_DIGEST_LENGTH] = 0;
      finalized = true;
    }
  }

  void
  Reset() override
  {
    sha256offset = 0;
    EVP_DigestInit_ex(ctx, EVP_sha256(), NULL);
    memset(sha256, 0, SHA256_DIGEST_LENGTH + 1);
    needsRecalculation = false;
    finalized = false;
  }
};

SCIDBCOMMONNAMESPACE_END

#endif
