// ----------------------------------------------------------------------
// File: SqliteCatalog.hh
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
//! @file SqliteCatalog.hh
//! @brief Durable catalog of datasets, permission entries and chain links
//------------------------------------------------------------------------------

#ifndef __SCIDBREGISTRY_SQLITECATALOG_HH__
#define __SCIDBREGISTRY_SQLITECATALOG_HH__

#include "registry/Namespace.hh"
#include "registry/Principal.hh"
#include "namespace/DatasetMD.hh"
#include "common/Logging.hh"
#include <sqlite3.h>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

SCIDBREGISTRYNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Set of catalog mutations committed in one transaction
//------------------------------------------------------------------------------
class CatalogBatch
{
public:
  enum class OpType {
    kUpsertDataset,
    kAddPermission,
    kRemovePermission,
    kAddLink
  };

  struct Op {
    OpType type;
    std::string id; ///< dataset id, or successor for link ops
    std::string arg; ///< serialized record, or predecessor for link ops
    int64_t upload_time {0};
    Grant grant;
  };

  //----------------------------------------------------------------------------
  //! Insert or replace a dataset record
  //!
  //! @throws ns::StoreError if the record can not be serialized
  //----------------------------------------------------------------------------
  void upsertDataset(const ns::DatasetMD& ds);

  void addPermission(const std::string& id, const Grant& grant);

  void removePermission(const std::string& id, const Grant& grant);

  void addLink(const std::string& successor, const std::string& predecessor);

  const std::vector<Op>& ops() const
  {
    return mOps;
  }

  bool empty() const
  {
    return mOps.empty();
  }

private:
  std::vector<Op> mOps;
};

//------------------------------------------------------------------------------
//! Catalog contents as loaded at start-up
//------------------------------------------------------------------------------
struct CatalogState {
  std::vector<ns::DatasetMD> datasets;
  std::vector<std::pair<std::string, Grant>> permissions;
  std::vector<std::pair<std::string, std::string>> links; ///< successor, predecessor
};

//------------------------------------------------------------------------------
//! SQLite backed catalog. All mutations go through commit() which applies a
//! batch inside one transaction and rolls it back entirely on failure.
//!
//! Tables:
//!   datasets(id PRIMARY KEY, upload_time, record)
//!   permissions(dataset_id, kind, name, op) unique per row
//!   links(successor PRIMARY KEY, predecessor UNIQUE)
//------------------------------------------------------------------------------
class SqliteCatalog: public common::LogId
{
public:
  //----------------------------------------------------------------------------
  //! Constructor opening or creating the catalog
  //!
  //! @param path database file, ":memory:" for a private in-memory catalog
  //!
  //! @throws ns::StoreError if the database can not be opened
  //----------------------------------------------------------------------------
  explicit SqliteCatalog(const std::string& path);

  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  virtual ~SqliteCatalog();

  SqliteCatalog(const SqliteCatalog&) = delete;
  SqliteCatalog& operator=(const SqliteCatalog&) = delete;

  //----------------------------------------------------------------------------
  //! Commit a batch in one transaction
  //!
  //! @throws ns::StoreError if any statement fails, nothing is applied then
  //----------------------------------------------------------------------------
  void commit(const CatalogBatch& batch);

  //----------------------------------------------------------------------------
  //! Load all catalog contents
  //!
  //! @throws ns::StoreError on read or parse failures
  //----------------------------------------------------------------------------
  CatalogState loadAll();

  //----------------------------------------------------------------------------
  //! Make the next commit fail after its statements ran, used to exercise
  //! the rollback path
  //----------------------------------------------------------------------------
  void injectCommitFailure(bool fail = true)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mInjectFailure = fail;
  }

  const std::string& getPath() const
  {
    return mPath;
  }

private:
  std::string mPath;
  sqlite3* mDb {nullptr};
  std::mutex mMutex;
  bool mInjectFailure {false};

  //----------------------------------------------------------------------------
  //! Execute a statement without result rows
  //!
  //! @return SQLITE_OK on success, otherwise the sqlite return code
  //----------------------------------------------------------------------------
  int execNoCallback(const char* stmt);

  //----------------------------------------------------------------------------
  //! Run one batch operation, caller holds the transaction
  //----------------------------------------------------------------------------
  int apply(const CatalogBatch::Op& op);
};

SCIDBREGISTRYNAMESPACE_END

#endif
