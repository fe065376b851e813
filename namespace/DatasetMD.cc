// ----------------------------------------------------------------------
// File: DatasetMD.cc
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

#include "namespace/DatasetMD.hh"
#include <google/protobuf/util/json_util.h>

SCIDBNSNAMESPACE_BEGIN

//------------------------------------------------------------------------------
// Create a new incomplete dataset record
//------------------------------------------------------------------------------
DatasetMD
DatasetMD::Create(const std::string& id, const std::string& owner,
                  const DatasetMetadata& md, int64_t upload_time)
{
  DatasetMD ds;
  DatasetMdProto& p = ds.mProto;
  p.set_id(id);
  p.set_owner(owner);
  p.set_title(md.title);
  p.set_author(md.author);
  p.set_organization(md.organization);
  p.set_email(md.email);
  p.set_comment(md.comment);
  p.set_description(md.description);
  p.set_license(md.license);
  p.set_doi(md.doi);
  p.set_timestamp(md.timestamp);

  for (const auto& kw : md.keywords) {
    p.add_keywords(kw);
  }

  for (const auto& sw : md.used_software) {
    SoftwareProto* psw = p.add_used_software();
    psw->set_name(sw.name);
    psw->set_version(sw.version);
    psw->set_id(sw.id);
    psw->set_type(sw.type);
  }

  p.set_model_version(md.model_version);
  p.mutable_container_type()->set_name(md.container_type.name);
  p.mutable_container_type()->set_version(md.container_type.version);
  p.mutable_container_type()->set_id(md.container_type.id);
  p.set_created(md.created);
  p.set_modified(md.modified);
  p.set_is_static(md.is_static);
  p.set_upload_time(upload_time);
  p.set_storage_time(upload_time);
  p.set_complete(false);
  p.set_invalidated(false);
  p.set_size(0);
  return ds;
}

//------------------------------------------------------------------------------
// Return the descriptive metadata
//------------------------------------------------------------------------------
DatasetMetadata
DatasetMD::getMetadata() const
{
  DatasetMetadata md;
  md.uuid = mProto.id();
  md.title = mProto.title();
  md.author = mProto.author();
  md.organization = mProto.organization();
  md.email = mProto.email();
  md.comment = mProto.comment();
  md.description = mProto.description();
  md.license = mProto.license();
  md.doi = mProto.doi();
  md.timestamp = mProto.timestamp();
  md.keywords.assign(mProto.keywords().begin(), mProto.keywords().end());

  for (const auto& psw : mProto.used_software()) {
    md.used_software.push_back({psw.name(), psw.version(), psw.id(), psw.type()});
  }

  md.model_version = mProto.model_version();
  md.container_type = {mProto.container_type().name(),
                       mProto.container_type().version(),
                       mProto.container_type().id()
                      };
  md.created = mProto.created();
  md.modified = mProto.modified();
  md.is_static = mProto.is_static();
  md.replaces = mProto.replaces();
  md.hash = mProto.hash();
  return md;
}

//------------------------------------------------------------------------------
// Return the manifest entries
//------------------------------------------------------------------------------
std::vector<FileEntry>
DatasetMD::getContent() const
{
  std::vector<FileEntry> content;
  content.reserve(mProto.content_size());

  for (const auto& pe : mProto.content()) {
    FileEntry entry;
    entry.name = pe.name();
    entry.size = pe.size();
    entry.content_reference = pe.content_reference();
    entry.checksum = pe.checksum();

    if (pe.has_preview()) {
      entry.preview = pe.preview();
    }

    content.push_back(std::move(entry));
  }

  return content;
}

//------------------------------------------------------------------------------
// Find manifest entry by name
//------------------------------------------------------------------------------
bool
DatasetMD::findEntry(const std::string& name, FileEntry& entry) const
{
  for (const auto& pe : mProto.content()) {
    if (pe.name() == name) {
      entry.name = pe.name();
      entry.size = pe.size();
      entry.content_reference = pe.content_reference();
      entry.checksum = pe.checksum();
      entry.preview.reset();

      if (pe.has_preview()) {
        entry.preview = pe.preview();
      }

      return true;
    }
  }

  return false;
}

//------------------------------------------------------------------------------
// Append manifest entry
//------------------------------------------------------------------------------
void
DatasetMD::appendEntry(const FileEntry& entry)
{
  FileEntryProto* pe = mProto.add_content();
  pe->set_name(entry.name);
  pe->set_size(entry.size);
  pe->set_content_reference(entry.content_reference);
  pe->set_checksum(entry.checksum);

  if (entry.preview) {
    pe->set_has_preview(true);
    pe->set_preview(*entry.preview);
  }

  mProto.set_size(mProto.size() + entry.size);
}

//------------------------------------------------------------------------------
// Mark complete
//------------------------------------------------------------------------------
void
DatasetMD::setComplete(const std::string& hash, int64_t upload_time)
{
  mProto.set_hash(hash);
  mProto.set_upload_time(upload_time);
  mProto.set_complete(true);
  recomputeSize();
}

//------------------------------------------------------------------------------
// Recompute size from the manifest
//------------------------------------------------------------------------------
uint64_t
DatasetMD::recomputeSize()
{
  uint64_t size = 0;

  for (const auto& pe : mProto.content()) {
    size += pe.size();
  }

  mProto.set_size(size);
  return size;
}

//------------------------------------------------------------------------------
// Serialize to blob
//------------------------------------------------------------------------------
bool
DatasetMD::SerializeToString(std::string& out) const
{
  return mProto.SerializeToString(&out);
}

//------------------------------------------------------------------------------
// Parse from blob
//------------------------------------------------------------------------------
bool
DatasetMD::ParseFromString(const std::string& in)
{
  return mProto.ParseFromString(in);
}

//------------------------------------------------------------------------------
// Convert to JSON
//------------------------------------------------------------------------------
bool
DatasetMD::ToJson(std::string& out, bool with_preview) const
{
  DatasetMdProto copy = mProto;

  if (!with_preview) {
    for (auto& pe : *copy.mutable_content()) {
      pe.clear_preview();
    }
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names = true;
  out.clear();
  return google::protobuf::util::MessageToJsonString(copy, &out, options).ok();
}

SCIDBNSNAMESPACE_END
