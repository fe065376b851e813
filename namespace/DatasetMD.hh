// ----------------------------------------------------------------------
// File: DatasetMD.hh
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

#ifndef __SCIDBNS_DATASETMD_HH__
#define __SCIDBNS_DATASETMD_HH__

#include "namespace/Namespace.hh"
#include "proto/DatasetMd.pb.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

SCIDBNSNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Software referenced by a container
//------------------------------------------------------------------------------
struct Software {
  std::string name;
  std::string version;
  std::string id;
  std::string type;
};

//------------------------------------------------------------------------------
//! Producer defined container type
//------------------------------------------------------------------------------
struct ContainerType {
  std::string name;
  std::string version;
  std::string id;
};

//------------------------------------------------------------------------------
//! One file of a dataset manifest
//------------------------------------------------------------------------------
struct FileEntry {
  std::string name;
  uint64_t size {0};
  std::string content_reference;
  std::string checksum;
  std::optional<std::string> preview;
};

//------------------------------------------------------------------------------
//! Descriptive metadata supplied when an upload begins
//------------------------------------------------------------------------------
struct DatasetMetadata {
  std::string uuid; ///< container supplied id, may be empty
  std::string title;
  std::string author;
  std::string organization;
  std::string email;
  std::string comment;
  std::string description;
  std::string license;
  std::string doi;
  int64_t timestamp {0};
  std::vector<std::string> keywords;
  std::vector<Software> used_software;
  std::string model_version;
  ContainerType container_type;
  int64_t created {0};
  int64_t modified {0};
  bool is_static {false};
  std::string replaces; ///< predecessor named inside the container
  std::string hash; ///< producer claimed payload hash
};

//------------------------------------------------------------------------------
//! Class modelling a registered dataset. It wraps the DatasetMdProto class
//! generated from the protobuf specification and adds typed accessors and the
//! conversions to/from the blob representation kept in the catalog.
//------------------------------------------------------------------------------
class DatasetMD
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //----------------------------------------------------------------------------
  DatasetMD() = default;

  //----------------------------------------------------------------------------
  //! Constructor with protobuf object
  //----------------------------------------------------------------------------
  explicit DatasetMD(const DatasetMdProto& proto): mProto(proto) {}

  //----------------------------------------------------------------------------
  //! Constructor with protobuf object: Move only variant
  //----------------------------------------------------------------------------
  explicit DatasetMD(DatasetMdProto&& proto): mProto(std::move(proto)) {}

  //----------------------------------------------------------------------------
  //! Create a new incomplete dataset record
  //!
  //! @param id dataset identifier
  //! @param owner owning principal
  //! @param md descriptive metadata
  //! @param upload_time server assigned upload time
  //----------------------------------------------------------------------------
  static DatasetMD Create(const std::string& id, const std::string& owner,
                          const DatasetMetadata& md, int64_t upload_time);

  const std::string& getId() const
  {
    return mProto.id();
  }

  const std::string& getOwner() const
  {
    return mProto.owner();
  }

  const std::string& getTitle() const
  {
    return mProto.title();
  }

  const std::string& getReplaces() const
  {
    return mProto.replaces();
  }

  const std::string& getHash() const
  {
    return mProto.hash();
  }

  uint64_t getSize() const
  {
    return mProto.size();
  }

  int64_t getUploadTime() const
  {
    return mProto.upload_time();
  }

  bool isComplete() const
  {
    return mProto.complete();
  }

  bool isInvalidated() const
  {
    return mProto.invalidated();
  }

  //----------------------------------------------------------------------------
  //! Return the descriptive metadata part of the record
  //----------------------------------------------------------------------------
  DatasetMetadata getMetadata() const;

  //----------------------------------------------------------------------------
  //! Return the manifest entries in append order
  //----------------------------------------------------------------------------
  std::vector<FileEntry> getContent() const;

  //----------------------------------------------------------------------------
  //! Find a manifest entry by name
  //!
  //! @return true if found and entry filled, otherwise false
  //----------------------------------------------------------------------------
  bool findEntry(const std::string& name, FileEntry& entry) const;

  //----------------------------------------------------------------------------
  //! Append a manifest entry and update the cached size
  //----------------------------------------------------------------------------
  void appendEntry(const FileEntry& entry);

  //----------------------------------------------------------------------------
  //! Mark the dataset complete with the verified hash
  //----------------------------------------------------------------------------
  void setComplete(const std::string& hash, int64_t upload_time);

  //----------------------------------------------------------------------------
  //! Set the tombstone
  //----------------------------------------------------------------------------
  void setInvalidated()
  {
    mProto.set_invalidated(true);
  }

  //----------------------------------------------------------------------------
  //! Set the predecessor reference
  //----------------------------------------------------------------------------
  void setReplaces(const std::string& id)
  {
    mProto.set_replaces(id);
  }

  //----------------------------------------------------------------------------
  //! Recompute the size from the manifest
  //----------------------------------------------------------------------------
  uint64_t recomputeSize();

  //----------------------------------------------------------------------------
  //! Serialize to the catalog blob representation
  //!
  //! @return true if successful, otherwise false
  //----------------------------------------------------------------------------
  bool SerializeToString(std::string& out) const;

  //----------------------------------------------------------------------------
  //! Parse the catalog blob representation
  //!
  //! @return true if successful, otherwise false
  //----------------------------------------------------------------------------
  bool ParseFromString(const std::string& in);

  //----------------------------------------------------------------------------
  //! Convert to JSON using protobuf's json printer
  //!
  //! @param out json output
  //! @param with_preview include inline previews
  //!
  //! @return true if successful, otherwise false
  //----------------------------------------------------------------------------
  bool ToJson(std::string& out, bool with_preview = false) const;

  DatasetMdProto mProto; ///< Protobuf dataset metadata
};

SCIDBNSNAMESPACE_END

#endif
