// ----------------------------------------------------------------------
// File: SqliteCatalog.cc
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

#include "registry/persistency/SqliteCatalog.hh"
#include "namespace/MDException.hh"

SCIDBREGISTRYNAMESPACE_BEGIN

namespace
{
const char* sCreateTables =
  "CREATE TABLE if not exists datasets ("
  " id TEXT PRIMARY KEY,"
  " upload_time INTEGER NOT NULL,"
  " record BLOB NOT NULL);"
  "CREATE TABLE if not exists permissions ("
  " dataset_id TEXT NOT NULL,"
  " kind TEXT NOT NULL,"
  " name TEXT NOT NULL,"
  " op TEXT NOT NULL,"
  " UNIQUE(dataset_id, kind, name, op));"
  "CREATE TABLE if not exists links ("
  " successor TEXT PRIMARY KEY,"
  " predecessor TEXT NOT NULL UNIQUE);";

//------------------------------------------------------------------------------
// Finalizes a prepared statement when going out of scope
//------------------------------------------------------------------------------
struct StmtHolder {
  sqlite3_stmt* stmt {nullptr};

  ~StmtHolder()
  {
    if (stmt) {
      sqlite3_finalize(stmt);
    }
  }
};

const char*
OpTag(Operation op)
{
  return (op == Operation::kRead) ? "r" : "w";
}

//------------------------------------------------------------------------------
// Bind text arguments and step a statement
//------------------------------------------------------------------------------
int
StepWithText(sqlite3* db, const char* sql, const std::vector<std::string>& args)
{
  StmtHolder holder;
  int rc = sqlite3_prepare_v2(db, sql, -1, &holder.stmt, nullptr);

  if (rc != SQLITE_OK) {
    return rc;
  }

  for (size_t i = 0; i < args.size(); ++i) {
    rc = sqlite3_bind_text(holder.stmt, i + 1, args[i].data(), args[i].size(),
                           SQLITE_TRANSIENT);

    if (rc != SQLITE_OK) {
      return rc;
    }
  }

  rc = sqlite3_step(holder.stmt);
  return (rc == SQLITE_DONE) ? SQLITE_OK : rc;
}

std::string
ColumnString(sqlite3_stmt* stmt, int col)
{
  const void* data = sqlite3_column_blob(stmt, col);
  int len = sqlite3_column_bytes(stmt, col);
  return (data && len) ? std::string(static_cast<const char*>(data), len) :
         std::string();
}
}

//------------------------------------------------------------------------------
// Batch building
//------------------------------------------------------------------------------
void
CatalogBatch::upsertDataset(const ns::DatasetMD& ds)
{
  Op op;
  op.type = OpType::kUpsertDataset;
  op.id = ds.getId();
  op.upload_time = ds.getUploadTime();

  if (!ds.SerializeToString(op.arg)) {
    throw_nsexception(ns::StoreError, "failed to serialize dataset "
                      << ds.getId());
  }

  mOps.push_back(std::move(op));
}

void
CatalogBatch::addPermission(const std::string& id, const Grant& grant)
{
  Op op;
  op.type = OpType::kAddPermission;
  op.id = id;
  op.grant = grant;
  mOps.push_back(std::move(op));
}

void
CatalogBatch::removePermission(const std::string& id, const Grant& grant)
{
  Op op;
  op.type = OpType::kRemovePermission;
  op.id = id;
  op.grant = grant;
  mOps.push_back(std::move(op));
}

void
CatalogBatch::addLink(const std::string& successor,
                      const std::string& predecessor)
{
  Op op;
  op.type = OpType::kAddLink;
  op.id = successor;
  op.arg = predecessor;
  mOps.push_back(std::move(op));
}

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
SqliteCatalog::SqliteCatalog(const std::string& path):
  mPath(path)
{
  SetLogId(nullptr, common::gLogging.gZeroVid, "catalog");
  int rc = sqlite3_open_v2(path.c_str(), &mDb,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                           SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = mDb ? sqlite3_errmsg(mDb) : sqlite3_errstr(rc);
    scidb_err("msg=\"failed to open sqlite3 database file\" path=%s err=\"%s\"",
              path.c_str(), msg.c_str());
    sqlite3_close(mDb);
    mDb = nullptr;
    throw_nsexception(ns::StoreError, "failed to open catalog " << path
                      << ": " << msg);
  }

  sqlite3_busy_timeout(mDb, 5000);

  if (execNoCallback(sCreateTables) != SQLITE_OK) {
    std::string msg = sqlite3_errmsg(mDb);
    sqlite3_close(mDb);
    mDb = nullptr;
    throw_nsexception(ns::StoreError, "failed to create catalog tables in "
                      << path << ": " << msg);
  }

  scidb_info("msg=\"opened catalog\" path=%s", path.c_str());
}

//------------------------------------------------------------------------------
// Destructor
//------------------------------------------------------------------------------
SqliteCatalog::~SqliteCatalog()
{
  if (mDb && (sqlite3_close(mDb) != SQLITE_OK)) {
    scidb_err("msg=\"failed to close catalog\" path=%s err=\"%s\"",
              mPath.c_str(), sqlite3_errmsg(mDb));
  }
}

//------------------------------------------------------------------------------
// Execute statement without callback
//------------------------------------------------------------------------------
int
SqliteCatalog::execNoCallback(const char* stmt)
{
  char* errstr = nullptr;
  int rc = sqlite3_exec(mDb, stmt, NULL, NULL, &errstr);

  if (rc != SQLITE_OK) {
    scidb_err("msg=\"sqlite statement failed\" rc=%d err=\"%s\" stmt=\"%.64s\"",
              rc, errstr ? errstr : "", stmt);
  }

  if (errstr != NULL) {
    sqlite3_free(errstr);
  }

  return rc;
}

//------------------------------------------------------------------------------
// Apply one operation
//------------------------------------------------------------------------------
int
SqliteCatalog::apply(const CatalogBatch::Op& op)
{
  switch (op.type) {
  case CatalogBatch::OpType::kUpsertDataset: {
    StmtHolder holder;
    int rc = sqlite3_prepare_v2(mDb, "INSERT OR REPLACE INTO datasets "
                                "(id, upload_time, record) VALUES (?, ?, ?);",
                                -1, &holder.stmt, nullptr);

    if (rc == SQLITE_OK) {
      rc = sqlite3_bind_text(holder.stmt, 1, op.id.data(), op.id.size(),
                             SQLITE_TRANSIENT);
    }

    if (rc == SQLITE_OK) {
      rc = sqlite3_bind_int64(holder.stmt, 2, op.upload_time);
    }

    if (rc == SQLITE_OK) {
      rc = sqlite3_bind_blob(holder.stmt, 3, op.arg.data(), op.arg.size(),
                             SQLITE_TRANSIENT);
    }

    if (rc == SQLITE_OK) {
      rc = sqlite3_step(holder.stmt);
      rc = (rc == SQLITE_DONE) ? SQLITE_OK : rc;
    }

    return rc;
  }

  case CatalogBatch::OpType::kAddPermission:
    return StepWithText(mDb, "INSERT OR IGNORE INTO permissions "
                        "(dataset_id, kind, name, op) VALUES (?, ?, ?, ?);",
    {op.id, op.grant.principal.tag(), op.grant.principal.name, OpTag(op.grant.op)});

  case CatalogBatch::OpType::kRemovePermission:
    return StepWithText(mDb, "DELETE FROM permissions WHERE dataset_id = ? "
                        "AND kind = ? AND name = ? AND op = ?;",
    {op.id, op.grant.principal.tag(), op.grant.principal.name, OpTag(op.grant.op)});

  case CatalogBatch::OpType::kAddLink:
    return StepWithText(mDb, "INSERT INTO links (successor, predecessor) "
                        "VALUES (?, ?);", {op.id, op.arg});
  }

  return SQLITE_MISUSE;
}

//------------------------------------------------------------------------------
// Commit a batch
//------------------------------------------------------------------------------
void
SqliteCatalog::commit(const CatalogBatch& batch)
{
  if (batch.empty()) {
    return;
  }

  std::lock_guard<std::mutex> lock(mMutex);

  if (execNoCallback("BEGIN IMMEDIATE TRANSACTION;") != SQLITE_OK) {
    throw_nsexception(ns::StoreError, "failed to begin catalog transaction: "
                      << sqlite3_errmsg(mDb));
  }

  int rc = SQLITE_OK;
  std::string err;

  for (const auto& op : batch.ops()) {
    rc = apply(op);

    if (rc != SQLITE_OK) {
      err = sqlite3_errmsg(mDb);
      scidb_err("msg=\"catalog operation failed\" id=%s rc=%d err=\"%s\"",
                op.id.c_str(), rc, err.c_str());
      break;
    }
  }

  if ((rc == SQLITE_OK) && mInjectFailure) {
    mInjectFailure = false;
    rc = SQLITE_IOERR;
    err = "injected failure";
  }

  if (rc == SQLITE_OK) {
    rc = execNoCallback("COMMIT TRANSACTION;");

    if (rc == SQLITE_OK) {
      return;
    }

    err = sqlite3_errmsg(mDb);
  }

  if (execNoCallback("ROLLBACK TRANSACTION;") != SQLITE_OK) {
    scidb_crit("msg=\"catalog rollback failed\" path=%s", mPath.c_str());
  }

  throw_nsexception(ns::StoreError, "catalog transaction failed rc=" << rc
                    << ": " << err);
}

//------------------------------------------------------------------------------
// Load all contents
//------------------------------------------------------------------------------
CatalogState
SqliteCatalog::loadAll()
{
  std::lock_guard<std::mutex> lock(mMutex);
  CatalogState state;
  int rc;
  {
    StmtHolder holder;
    rc = sqlite3_prepare_v2(mDb, "SELECT id, record FROM datasets;", -1,
                            &holder.stmt, nullptr);

    while ((rc == SQLITE_OK || rc == SQLITE_ROW) &&
           ((rc = sqlite3_step(holder.stmt)) == SQLITE_ROW)) {
      ns::DatasetMD ds;

      if (!ds.ParseFromString(ColumnString(holder.stmt, 1))) {
        throw_nsexception(ns::StoreError, "corrupted catalog record for dataset "
                          << ColumnString(holder.stmt, 0));
      }

      state.datasets.push_back(std::move(ds));
    }

    if (rc != SQLITE_DONE) {
      throw_nsexception(ns::StoreError, "failed to load datasets: "
                        << sqlite3_errmsg(mDb));
    }
  }
  {
    StmtHolder holder;
    rc = sqlite3_prepare_v2(mDb, "SELECT dataset_id, kind, name, op FROM "
                            "permissions;", -1, &holder.stmt, nullptr);

    while ((rc == SQLITE_OK || rc == SQLITE_ROW) &&
           ((rc = sqlite3_step(holder.stmt)) == SQLITE_ROW)) {
      std::string kind = ColumnString(holder.stmt, 1);
      std::string name = ColumnString(holder.stmt, 2);
      Grant grant;
      grant.principal = (kind == "g") ? Principal::Group(name) :
                        Principal::User(name);
      grant.op = (ColumnString(holder.stmt, 3) == "w") ? Operation::kWrite :
                 Operation::kRead;
      state.permissions.emplace_back(ColumnString(holder.stmt, 0), grant);
    }

    if (rc != SQLITE_DONE) {
      throw_nsexception(ns::StoreError, "failed to load permissions: "
                        << sqlite3_errmsg(mDb));
    }
  }
  {
    StmtHolder holder;
    rc = sqlite3_prepare_v2(mDb, "SELECT successor, predecessor FROM links;",
                            -1, &holder.stmt, nullptr);

    while ((rc == SQLITE_OK || rc == SQLITE_ROW) &&
           ((rc = sqlite3_step(holder.stmt)) == SQLITE_ROW)) {
      state.links.emplace_back(ColumnString(holder.stmt, 0),
                               ColumnString(holder.stmt, 1));
    }

    if (rc != SQLITE_DONE) {
      throw_nsexception(ns::StoreError, "failed to load links: "
                        << sqlite3_errmsg(mDb));
    }
  }
  scidb_info("msg=\"loaded catalog\" datasets=%lu permissions=%lu links=%lu",
             state.datasets.size(), state.permissions.size(), state.links.size());
  return state;
}

SCIDBREGISTRYNAMESPACE_END
