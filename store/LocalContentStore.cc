// ----------------------------------------------------------------------
// File: LocalContentStore.cc
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

#include "store/LocalContentStore.hh"
#include "common/checksum/SHA256.hh"
#include "namespace/MDException.hh"
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <memory>

SCIDBSTORENAMESPACE_BEGIN

namespace
{
//------------------------------------------------------------------------------
// Close a file descriptor on scope exit
//------------------------------------------------------------------------------
struct FdCloser {
  void operator()(int* fd) const
  {
    if (fd && (*fd >= 0)) {
      ::close(*fd);
    }
  }
};
}

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
LocalContentStore::LocalContentStore(const std::string& root):
  mRoot(root)
{
  while ((mRoot.length() > 1) && (mRoot.back() == '/')) {
    mRoot.pop_back();
  }

  MakeDir(mRoot);
  scidb_info("msg=\"content store ready\" root=\"%s\"", mRoot.c_str());
}

//------------------------------------------------------------------------------
// Validate reference format
//------------------------------------------------------------------------------
bool
LocalContentStore::IsValidReference(const std::string& reference)
{
  if (reference.length() != 2 * SHA256_DIGEST_LENGTH) {
    return false;
  }

  for (char c : reference) {
    if (!isxdigit(static_cast<unsigned char>(c)) ||
        isupper(static_cast<unsigned char>(c))) {
      return false;
    }
  }

  return true;
}

//------------------------------------------------------------------------------
// Create directory
//------------------------------------------------------------------------------
void
LocalContentStore::MakeDir(const std::string& path)
{
  if (::mkdir(path.c_str(), S_IRWXU | S_IRGRP | S_IXGRP) && (errno != EEXIST)) {
    throw_nsexception(ns::StoreError, "unable to create directory " << path
                      << ": " << strerror(errno));
  }
}

//------------------------------------------------------------------------------
// Physical path
//------------------------------------------------------------------------------
std::string
LocalContentStore::PathOf(const std::string& reference) const
{
  return mRoot + "/" + reference.substr(0, 2) + "/" + reference;
}

//------------------------------------------------------------------------------
// Store bytes
//------------------------------------------------------------------------------
std::string
LocalContentStore::put(const std::string& bytes)
{
  std::string reference = common::SHA256::Hex(bytes);
  std::string path = PathOf(reference);
  struct stat buf;

  if (!::stat(path.c_str(), &buf) && ((uint64_t) buf.st_size == bytes.size())) {
    scidb_debug("msg=\"payload already stored\" ref=%s", reference.c_str());
    return reference;
  }

  std::string dir = mRoot + "/" + reference.substr(0, 2);
  MakeDir(dir);
  std::string tmp = dir + "/." + reference + ".tmp." +
                    std::to_string(getpid()) + "." + std::to_string(mTmpCounter++);
  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                  S_IRUSR | S_IWUSR | S_IRGRP);

  if (fd < 0) {
    throw_nsexception(ns::StoreError, "unable to create " << tmp << ": "
                      << strerror(errno));
  }

  std::unique_ptr<int, FdCloser> fd_guard(&fd);
  size_t written = 0;

  while (written < bytes.size()) {
    ssize_t nwr = ::write(fd, bytes.data() + written, bytes.size() - written);

    if (nwr < 0) {
      if (errno == EINTR) {
        continue;
      }

      int err = errno;
      ::unlink(tmp.c_str());
      throw_nsexception(ns::StoreError, "write failed on " << tmp << ": "
                        << strerror(err));
    }

    written += nwr;
  }

  if (::fsync(fd)) {
    int err = errno;
    ::unlink(tmp.c_str());
    throw_nsexception(ns::StoreError, "fsync failed on " << tmp << ": "
                      << strerror(err));
  }

  if (::rename(tmp.c_str(), path.c_str())) {
    int err = errno;
    ::unlink(tmp.c_str());
    throw_nsexception(ns::StoreError, "rename failed " << tmp << " => " << path
                      << ": " << strerror(err));
  }

  // make the rename itself durable
  int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);

  if (dfd >= 0) {
    if (::fsync(dfd)) {
      scidb_warning("msg=\"directory fsync failed\" dir=\"%s\" errno=%d",
                    dir.c_str(), errno);
    }

    ::close(dfd);
  }

  scidb_debug("msg=\"payload stored\" ref=%s size=%llu", reference.c_str(),
              (unsigned long long) bytes.size());
  return reference;
}

//------------------------------------------------------------------------------
// Fetch bytes
//------------------------------------------------------------------------------
std::string
LocalContentStore::get(const std::string& reference)
{
  if (!IsValidReference(reference)) {
    throw_nsexception(ns::NotFoundError, "malformed content reference "
                      << reference);
  }

  std::string path = PathOf(reference);
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);

  if (fd < 0) {
    if (errno == ENOENT) {
      throw_nsexception(ns::NotFoundError, "unknown content reference "
                        << reference);
    }

    throw_nsexception(ns::StoreError, "unable to open " << path << ": "
                      << strerror(errno));
  }

  std::unique_ptr<int, FdCloser> fd_guard(&fd);
  std::string out;
  char buffer[65536];

  while (true) {
    ssize_t nrd = ::read(fd, buffer, sizeof(buffer));

    if (nrd < 0) {
      if (errno == EINTR) {
        continue;
      }

      throw_nsexception(ns::StoreError, "read failed on " << path << ": "
                        << strerror(errno));
    }

    if (nrd == 0) {
      break;
    }

    out.append(buffer, nrd);
  }

  return out;
}

//------------------------------------------------------------------------------
// Size of a reference
//------------------------------------------------------------------------------
uint64_t
LocalContentStore::size(const std::string& reference)
{
  if (!IsValidReference(reference)) {
    throw_nsexception(ns::NotFoundError, "malformed content reference "
                      << reference);
  }

  struct stat buf;

  if (::stat(PathOf(reference).c_str(), &buf)) {
    if (errno == ENOENT) {
      throw_nsexception(ns::NotFoundError, "unknown content reference "
                        << reference);
    }

    throw_nsexception(ns::StoreError, "unable to stat " << reference << ": "
                      << strerror(errno));
  }

  return buf.st_size;
}

//------------------------------------------------------------------------------
// Check existence
//------------------------------------------------------------------------------
bool
LocalContentStore::exists(const std::string& reference)
{
  if (!IsValidReference(reference)) {
    return false;
  }

  struct stat buf;
  return (::stat(PathOf(reference).c_str(), &buf) == 0);
}

SCIDBSTORENAMESPACE_END
