// ----------------------------------------------------------------------
// File: ContainerParser.cc
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

#include "registry/ContainerParser.hh"
#include "common/StringConversion.hh"
#include "common/Timing.hh"
#include "namespace/MDException.hh"
#include <json/json.h>
#include <fts.h>
#include <sys/stat.h>
#include <algorithm>
#include <memory>

SCIDBREGISTRYNAMESPACE_BEGIN

const char* ContainerParser::sMinModelVersion = "0.3";

//------------------------------------------------------------------------------
// Constraint tables per model version
//------------------------------------------------------------------------------
const std::vector<ContainerParser::ConstraintTable>&
ContainerParser::Tables()
{
  static const std::vector<Constraint> content_0_3 = {
    {"uuid", ValueType::kString, true},
    {"replaces", ValueType::kString, false},
    {"containerType", ValueType::kContainerType, true},
    {"created", ValueType::kTimestamp, true},
    {"modified", ValueType::kTimestamp, true},
    {"static", ValueType::kBool, true},
    {"complete", ValueType::kBool, true},
    {"hash", ValueType::kString, false},
    {"usedSoftware", ValueType::kSoftwareList, false},
    {"modelVersion", ValueType::kString, true}
  };
  static const std::vector<Constraint> meta_0_3 = {
    {"author", ValueType::kString, true},
    {"email", ValueType::kString, true},
    {"comment", ValueType::kString, false},
    {"title", ValueType::kString, true},
    {"keywords", ValueType::kStringList, false},
    {"description", ValueType::kString, false}
  };
  static std::vector<Constraint> meta_0_5_1 = [] {
    std::vector<Constraint> meta = meta_0_3;
    meta.push_back({"timestamp", ValueType::kTimestamp, false});
    meta.push_back({"doi", ValueType::kString, false});
    meta.push_back({"license", ValueType::kString, false});
    return meta;
  }();
  static const std::vector<ConstraintTable> tables = {
    {"0.3", content_0_3, meta_0_3},
    {"0.5.1", content_0_3, meta_0_5_1}
  };
  return tables;
}

//------------------------------------------------------------------------------
// Compare dotted versions
//------------------------------------------------------------------------------
int
ContainerParser::CompareVersions(const std::string& a, const std::string& b)
{
  auto split = [](const std::string & v) {
    std::vector<std::string> tokens;
    std::vector<long> parts;
    common::StringConversion::Tokenize(v, tokens, ".");

    if (tokens.empty()) {
      throw_nsexception(ns::ValidationError, "invalid model version \"" << v
                        << "\"");
    }

    for (const auto& token : tokens) {
      char* end = nullptr;
      long num = strtol(token.c_str(), &end, 10);

      if (token.empty() || (end == nullptr) || *end || (num < 0)) {
        throw_nsexception(ns::ValidationError, "invalid model version \"" << v
                          << "\"");
      }

      parts.push_back(num);
    }

    return parts;
  };
  std::vector<long> va = split(a);
  std::vector<long> vb = split(b);
  size_t n = std::max(va.size(), vb.size());
  va.resize(n, 0);
  vb.resize(n, 0);

  for (size_t i = 0; i < n; ++i) {
    if (va[i] != vb[i]) {
      return (va[i] < vb[i]) ? -1 : 1;
    }
  }

  return 0;
}

//------------------------------------------------------------------------------
// Select constraints for a model version
//------------------------------------------------------------------------------
const ContainerParser::ConstraintTable&
ContainerParser::SelectConstraints(const std::string& model_version)
{
  if (CompareVersions(model_version, sMinModelVersion) < 0) {
    throw_nsexception(ns::ValidationError, "container model version "
                      << model_version << " is not supported, the minimum "
                      "model version is " << sMinModelVersion);
  }

  const ConstraintTable* selected = nullptr;

  for (const auto& table : Tables()) {
    if ((CompareVersions(table.version, model_version) < 0) &&
        (!selected || (CompareVersions(table.version, selected->version) > 0))) {
      selected = &table;
    }
  }

  if (selected == nullptr) {
    throw_nsexception(ns::ValidationError, "no constraints for container "
                      "model version " << model_version);
  }

  return *selected;
}

//------------------------------------------------------------------------------
// Parse JSON text
//------------------------------------------------------------------------------
void
ContainerParser::ParseDocument(const std::string& text, const char* name,
                               Json::Value& out)
{
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  std::string errs;

  if (!reader->parse(text.data(), text.data() + text.size(), &out, &errs)) {
    throw_nsexception(ns::ValidationError, "failed to parse " << name
                      << ".json: " << errs);
  }

  if (!out.isObject()) {
    throw_nsexception(ns::ValidationError, name << ".json is not a JSON object");
  }
}

namespace
{
//------------------------------------------------------------------------------
// JSON falsy values count as absent
//------------------------------------------------------------------------------
bool
IsEmpty(const Json::Value& v)
{
  switch (v.type()) {
  case Json::nullValue:
    return true;

  case Json::stringValue:
    return v.asString().empty();

  case Json::booleanValue:
    return !v.asBool();

  case Json::intValue:
  case Json::uintValue:
  case Json::realValue:
    return v.asDouble() == 0;

  case Json::arrayValue:
  case Json::objectValue:
    return v.empty();
  }

  return false;
}

std::string
AsString(const Json::Value& v, const char* doc, const char* key)
{
  if (!v.isString()) {
    throw_nsexception(ns::ValidationError, "attribute '" << key << "' in "
                      << doc << ".json must be a string");
  }

  return v.asString();
}

std::string
OptionalMember(const Json::Value& obj, const char* member, const char* doc,
               const char* key)
{
  if (!obj.isMember(member) || obj[member].isNull()) {
    return "";
  }

  return AsString(obj[member], doc, key);
}
}

//------------------------------------------------------------------------------
// Apply constraints of one document
//------------------------------------------------------------------------------
void
ContainerParser::Apply(const Json::Value& doc, const char* name,
                       const std::vector<Constraint>& constraints,
                       ns::DatasetMetadata& md)
{
  for (const auto& c : constraints) {
    if (!doc.isMember(c.key)) {
      if (c.required) {
        throw_nsexception(ns::ValidationError, "attribute '" << c.key
                          << "' required in " << name << ".json");
      }

      continue;
    }

    const Json::Value& v = doc[c.key];

    if (IsEmpty(v)) {
      continue;
    }

    std::string key = c.key;

    switch (c.type) {
    case ValueType::kString: {
      std::string s = AsString(v, name, c.key);

      if (key == "uuid") {
        md.uuid = s;
      } else if (key == "replaces") {
        md.replaces = s;
      } else if (key == "hash") {
        md.hash = s;
      } else if (key == "modelVersion") {
        md.model_version = s;
      } else if (key == "author") {
        md.author = s;
      } else if (key == "email") {
        md.email = s;
      } else if (key == "comment") {
        md.comment = s;
      } else if (key == "title") {
        md.title = s;
      } else if (key == "description") {
        md.description = s;
      } else if (key == "doi") {
        md.doi = s;
      } else if (key == "license") {
        md.license = s;
      }

      break;
    }

    case ValueType::kBool:
      if (!v.isBool()) {
        throw_nsexception(ns::ValidationError, "attribute '" << c.key << "' in "
                          << name << ".json must be a boolean");
      }

      if (key == "static") {
        md.is_static = v.asBool();
      }

      break;

    case ValueType::kTimestamp: {
      int64_t micros = 0;
      std::string s = AsString(v, name, c.key);

      if (!common::Timing::ParseTimestamp(s, micros)) {
        throw_nsexception(ns::ValidationError, "failed to convert '" << s
                          << "' of attribute '" << c.key << "' in " << name
                          << ".json to a timestamp");
      }

      if (key == "created") {
        md.created = micros;
      } else if (key == "modified") {
        md.modified = micros;
      } else if (key == "timestamp") {
        md.timestamp = micros;
      }

      break;
    }

    case ValueType::kContainerType:
      if (!v.isObject()) {
        throw_nsexception(ns::ValidationError, "attribute '" << c.key << "' in "
                          << name << ".json must be an object");
      }

      md.container_type.name = OptionalMember(v, "name", name, c.key);
      md.container_type.version = OptionalMember(v, "version", name, c.key);
      md.container_type.id = OptionalMember(v, "id", name, c.key);

      if (md.container_type.name.empty()) {
        throw_nsexception(ns::ValidationError, "attribute '" << c.key
                          << "' in " << name << ".json needs a name");
      }

      break;

    case ValueType::kSoftwareList:
      if (!v.isArray()) {
        throw_nsexception(ns::ValidationError, "attribute '" << c.key << "' in "
                          << name << ".json must be a list");
      }

      for (const auto& item : v) {
        if (!item.isObject()) {
          throw_nsexception(ns::ValidationError, "entries of '" << c.key
                            << "' in " << name << ".json must be objects");
        }

        ns::Software sw;
        sw.name = OptionalMember(item, "name", name, c.key);
        sw.version = OptionalMember(item, "version", name, c.key);
        sw.id = OptionalMember(item, "id", name, c.key);
        sw.type = OptionalMember(item, "idType", name, c.key);

        if (sw.type.empty()) {
          sw.type = OptionalMember(item, "type", name, c.key);
        }

        md.used_software.push_back(sw);
      }

      break;

    case ValueType::kStringList:
      if (!v.isArray()) {
        throw_nsexception(ns::ValidationError, "attribute '" << c.key << "' in "
                          << name << ".json must be a list");
      }

      for (const auto& item : v) {
        md.keywords.push_back(AsString(item, name, c.key));
      }

      break;
    }
  }
}

//------------------------------------------------------------------------------
// Parse both documents
//------------------------------------------------------------------------------
ns::DatasetMetadata
ContainerParser::Parse(const std::string& content_json,
                       const std::string& meta_json)
{
  Json::Value content;
  Json::Value meta;
  ParseDocument(content_json, "content", content);
  ParseDocument(meta_json, "meta", meta);

  if (!content.isMember("modelVersion")) {
    throw_nsexception(ns::ValidationError, "attribute 'modelVersion' required "
                      "in content.json");
  }

  const ConstraintTable& table = SelectConstraints(AsString(
                                   content["modelVersion"], "content", "modelVersion"));
  ns::DatasetMetadata md;
  Apply(content, "content", table.content, md);
  Apply(meta, "meta", table.meta, md);
  scidb_static_debug("msg=\"parsed container documents\" uuid=%s "
                     "model_version=%s constraints=%s", md.uuid.c_str(),
                     md.model_version.c_str(), table.version);
  return md;
}

//------------------------------------------------------------------------------
// Directory container
//------------------------------------------------------------------------------
DirectoryContainer::DirectoryContainer(const std::string& path):
  mPath(path)
{
  while ((mPath.length() > 1) && (mPath.back() == '/')) {
    mPath.pop_back();
  }
}

//------------------------------------------------------------------------------
// Path relative to the container root
//------------------------------------------------------------------------------
std::string
DirectoryContainer::RelativeName(const std::string& root,
                                 const std::string& path)
{
  // only "/" keeps its trailing slash after normalization
  size_t prefix = root.length();

  if (root.empty() || (root.back() != '/')) {
    ++prefix;
  }

  return (path.length() > prefix) ? path.substr(prefix) : "";
}

//------------------------------------------------------------------------------
// Read all files of the container
//------------------------------------------------------------------------------
void
DirectoryContainer::Load()
{
  struct stat buf;

  if (::stat(mPath.c_str(), &buf) || !S_ISDIR(buf.st_mode)) {
    throw_nsexception(ns::NotFoundError, "container directory " << mPath
                      << " does not exist");
  }

  mFiles.clear();
  char* paths[] = {(char*) mPath.c_str(), 0};
  FTS* tree = fts_open(paths, FTS_NOCHDIR | FTS_PHYSICAL, 0);

  if (!tree) {
    throw_nsexception(ns::StoreError, "fts_open failed for " << mPath);
  }

  FTSENT* node;
  std::string content_json;
  std::string meta_json;
  bool has_content = false;
  bool has_meta = false;

  while ((node = fts_read(tree))) {
    if (node->fts_level > 0 && node->fts_name[0] == '.') {
      fts_set(tree, node, FTS_SKIP);
      continue;
    }

    if (node->fts_info != FTS_F) {
      continue;
    }

    File file;
    file.name = RelativeName(mPath, node->fts_path);

    if (!common::StringConversion::LoadFileIntoString(node->fts_accpath,
        file.bytes)) {
      fts_close(tree);
      throw_nsexception(ns::StoreError, "failed to read " << node->fts_path);
    }

    if (common::StringConversion::EndsWith(file.name, ".json")) {
      file.preview = file.bytes;
    }

    if (file.name == "content.json") {
      content_json = file.bytes;
      has_content = true;
    } else if (file.name == "meta.json") {
      meta_json = file.bytes;
      has_meta = true;
    }

    scidb_debug("msg=\"container file\" name=\"%s\" size=%lu",
                file.name.c_str(), file.bytes.size());
    mFiles.push_back(std::move(file));
  }

  if (fts_close(tree)) {
    scidb_err("msg=\"fts_close failed\" path=%s", mPath.c_str());
  }

  if (!has_content || !has_meta) {
    throw_nsexception(ns::NotFoundError, "container " << mPath << " misses "
                      << (has_content ? "meta.json" : "content.json"));
  }

  std::sort(mFiles.begin(), mFiles.end(), [](const File & a, const File & b) {
    return a.name < b.name;
  });
  mMetadata = ContainerParser::Parse(content_json, meta_json);
  scidb_info("msg=\"loaded container\" path=%s uuid=%s files=%lu",
             mPath.c_str(), mMetadata.uuid.c_str(), mFiles.size());
}

SCIDBREGISTRYNAMESPACE_END
