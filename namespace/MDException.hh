// ----------------------------------------------------------------------
// File: MDException.hh
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

//------------------------------------------------------------------------------
// desc:   Dataset metadata exceptions
//------------------------------------------------------------------------------

#ifndef __SCIDBNS_MDEXCEPTION_HH__
#define __SCIDBNS_MDEXCEPTION_HH__

#include "namespace/Namespace.hh"
#include <stdexcept>
#include <sstream>
#include <string>
#include <cerrno>

#define throw_mdexception(err, msg) { scidb::ns::MDException __md___exception____(err); __md___exception____.getMessage() << msg; throw __md___exception____; }
#define throw_nsexception(type, msg) { type __ns___exception____; __ns___exception____.getMessage() << msg; throw __ns___exception____; }

SCIDBNSNAMESPACE_BEGIN

//----------------------------------------------------------------------------
//! Metadata exception, carries an errno value and a message stream
//----------------------------------------------------------------------------
class MDException: public std::exception
{
public:
  //------------------------------------------------------------------------
  //! Constructor taking an error code and string message
  //------------------------------------------------------------------------
  MDException(int errorNo = ENODATA, const std::string& msg = ""):
    mErrorNo(errorNo)
  {
    if (!msg.empty()) {
      getMessage() << msg;
    }
  }

  //------------------------------------------------------------------------
  //! Destructor
  //------------------------------------------------------------------------
  virtual ~MDException() noexcept = default;

  //------------------------------------------------------------------------
  //! Copy constructor - this is actually required because we cannot copy
  //! stringstreams
  //------------------------------------------------------------------------
  MDException(const MDException& e):
    std::exception(e), mErrorNo(e.getErrno())
  {
    mMessage << e.mMessage.str();
  }

  //------------------------------------------------------------------------
  //! Get errno associated with the exception
  //------------------------------------------------------------------------
  int getErrno() const
  {
    return mErrorNo;
  }

  //------------------------------------------------------------------------
  //! Get the message stream
  //------------------------------------------------------------------------
  std::ostringstream& getMessage()
  {
    return mMessage;
  }

  //------------------------------------------------------------------------
  //! Short name of the error class
  //------------------------------------------------------------------------
  virtual const char* kind() const
  {
    return "MDException";
  }

  //------------------------------------------------------------------------
  //! Get the message
  //------------------------------------------------------------------------
  const char* what() const noexcept override
  {
    mWhat = mMessage.str();
    return mWhat.c_str();
  }

private:
  std::ostringstream mMessage;
  int mErrorNo;
  mutable std::string mWhat;
};

//----------------------------------------------------------------------------
//! Unknown dataset, entry or reference
//----------------------------------------------------------------------------
class NotFoundError: public MDException
{
public:
  NotFoundError(const std::string& msg = ""): MDException(ENOENT, msg) {}

  const char* kind() const override
  {
    return "NotFound";
  }
};

//----------------------------------------------------------------------------
//! Requester lacks the permission for the operation
//----------------------------------------------------------------------------
class ForbiddenError: public MDException
{
public:
  ForbiddenError(const std::string& msg = ""): MDException(EACCES, msg) {}

  const char* kind() const override
  {
    return "Forbidden";
  }
};

//----------------------------------------------------------------------------
//! Mutation of a complete or invalidated dataset
//----------------------------------------------------------------------------
class ImmutableError: public MDException
{
public:
  ImmutableError(const std::string& msg = ""): MDException(EROFS, msg) {}

  const char* kind() const override
  {
    return "Immutable";
  }
};

//----------------------------------------------------------------------------
//! Version chain would acquire a second successor, a cycle or a dangling link
//----------------------------------------------------------------------------
class ChainConflictError: public MDException
{
public:
  ChainConflictError(const std::string& msg = ""): MDException(EEXIST, msg) {}

  const char* kind() const override
  {
    return "ChainConflict";
  }
};

//----------------------------------------------------------------------------
//! Malformed or incomplete input
//----------------------------------------------------------------------------
class ValidationError: public MDException
{
public:
  ValidationError(const std::string& msg = ""): MDException(EINVAL, msg) {}

  const char* kind() const override
  {
    return "Validation";
  }
};

//----------------------------------------------------------------------------
//! Content store or catalog failure
//----------------------------------------------------------------------------
class StoreError: public MDException
{
public:
  StoreError(const std::string& msg = ""): MDException(EIO, msg) {}

  const char* kind() const override
  {
    return "Store";
  }
};

//----------------------------------------------------------------------------
//! Digest mismatch. Names the failing manifest entry when the mismatch is
//! local to one entry, otherwise the entry is empty and the digests refer to
//! the whole payload.
//----------------------------------------------------------------------------
class IntegrityError: public MDException
{
public:
  IntegrityError(const std::string& msg = ""): MDException(EBADMSG, msg) {}

  IntegrityError(const IntegrityError& e):
    MDException(e), mEntry(e.mEntry), mExpected(e.mExpected),
    mComputed(e.mComputed) {}

  const char* kind() const override
  {
    return "Integrity";
  }

  void setDetails(const std::string& entry, const std::string& expected,
                  const std::string& computed)
  {
    mEntry = entry;
    mExpected = expected;
    mComputed = computed;
  }

  const std::string& getEntry() const
  {
    return mEntry;
  }

  const std::string& getExpected() const
  {
    return mExpected;
  }

  const std::string& getComputed() const
  {
    return mComputed;
  }

private:
  std::string mEntry;
  std::string mExpected;
  std::string mComputed;
};

SCIDBNSNAMESPACE_END

#endif
