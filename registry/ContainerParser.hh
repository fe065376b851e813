// ----------------------------------------------------------------------
// File: ContainerParser.hh
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

#ifndef __SCIDBREGISTRY_CONTAINERPARSER_HH__
#define __SCIDBREGISTRY_CONTAINERPARSER_HH__

#include "registry/Namespace.hh"
#include "common/Logging.hh"
#include "namespace/DatasetMD.hh"
#include <optional>
#include <string>
#include <vector>

namespace Json
{
class Value;
}

SCIDBREGISTRYNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Parser of the two JSON documents describing a scientific data container,
//! content.json and meta.json.
//!
//! The set of accepted attributes depends on the container model version. The
//! constraint table used is the newest one whose version is strictly lower
//! than the model version of the container. Empty values count as absent.
//------------------------------------------------------------------------------
class ContainerParser
{
public:
  enum class ValueType {
    kString,
    kBool,
    kTimestamp,
    kContainerType,
    kSoftwareList,
    kStringList
  };

  struct Constraint {
    const char* key;
    ValueType type;
    bool required;
  };

  struct ConstraintTable {
    const char* version;
    std::vector<Constraint> content;
    std::vector<Constraint> meta;
  };

  //----------------------------------------------------------------------------
  //! Minimum supported container model version
  //----------------------------------------------------------------------------
  static const char* sMinModelVersion;

  //----------------------------------------------------------------------------
  //! Parse both documents into dataset metadata
  //!
  //! @param content_json text of content.json
  //! @param meta_json text of meta.json
  //!
  //! @throws ns::ValidationError on malformed documents, missing required
  //!         attributes, type mismatches or unsupported model versions
  //----------------------------------------------------------------------------
  static ns::DatasetMetadata Parse(const std::string& content_json,
                                   const std::string& meta_json);

  //----------------------------------------------------------------------------
  //! Select the constraint table for a model version
  //!
  //! @throws ns::ValidationError if the version is unsupported
  //----------------------------------------------------------------------------
  static const ConstraintTable& SelectConstraints(const std::string&
      model_version);

  //----------------------------------------------------------------------------
  //! Compare dotted numeric versions
  //!
  //! @return <0, 0, >0 like strcmp
  //! @throws ns::ValidationError for non numeric components
  //----------------------------------------------------------------------------
  static int CompareVersions(const std::string& a, const std::string& b);

private:
  static const std::vector<ConstraintTable>& Tables();

  static void ParseDocument(const std::string& text, const char* name,
                            Json::Value& out);

  static void Apply(const Json::Value& doc, const char* name,
                    const std::vector<Constraint>& constraints,
                    ns::DatasetMetadata& md);
};

//------------------------------------------------------------------------------
//! Container unpacked into a local directory
//------------------------------------------------------------------------------
class DirectoryContainer: public common::LogId
{
public:
  struct File {
    std::string name; ///< path relative to the container root
    std::string bytes;
    std::optional<std::string> preview;
  };

  explicit DirectoryContainer(const std::string& path);

  //----------------------------------------------------------------------------
  //! Read all files and parse the container documents
  //!
  //! @throws ns::NotFoundError if the directory or a document is missing
  //! @throws ns::ValidationError if the documents do not validate
  //----------------------------------------------------------------------------
  void Load();

  const ns::DatasetMetadata& getMetadata() const
  {
    return mMetadata;
  }

  const std::vector<File>& getFiles() const
  {
    return mFiles;
  }

  //----------------------------------------------------------------------------
  //! Name of a file below the container root, relative to that root
  //----------------------------------------------------------------------------
  static std::string RelativeName(const std::string& root,
                                  const std::string& path);

private:
  std::string mPath;
  ns::DatasetMetadata mMetadata;
  std::vector<File> mFiles;
};

SCIDBREGISTRYNAMESPACE_END

#endif
