/*
    Emporium - economy and progression engine for games
    Copyright (C) 2020  Autonomous Worlds Ltd

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#include "database.hpp"

#include <glog/logging.h>

#include <sstream>

namespace emporium
{

namespace
{

/**
 * Builds the message for a DatabaseError from the connection's
 * last error.
 */
std::string
ErrorMessage (sqlite3* db, const int code, const std::string& what)
{
  std::ostringstream msg;
  msg << what << ": " << sqlite3_errstr (code);
  if (db != nullptr)
    msg << " (" << sqlite3_errmsg (db) << ")";
  return msg.str ();
}

} // anonymous namespace

DatabaseError::DatabaseError (const int c, const std::string& msg)
  : std::runtime_error(msg), code(c)
{}

bool
DatabaseError::IsTransient () const
{
  switch (code & 0xFF)
    {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
    case SQLITE_INTERRUPT:
      return true;

    default:
      return false;
    }
}

/* ************************************************************************** */

Database::Database (const std::string& file,
                    const std::chrono::milliseconds busyTimeout)
  : handle(nullptr)
{
  const int rc = sqlite3_open_v2 (file.c_str (), &handle,
                                  SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE
                                    | SQLITE_OPEN_NOMUTEX,
                                  nullptr);
  if (rc != SQLITE_OK)
    {
      const std::string msg = ErrorMessage (handle, rc, "opening " + file);
      sqlite3_close (handle);
      handle = nullptr;
      throw DatabaseError (rc, msg);
    }

  sqlite3_extended_result_codes (handle, 1);
  sqlite3_busy_timeout (handle, static_cast<int> (busyTimeout.count ()));

  Execute ("PRAGMA foreign_keys = ON");
  if (file != ":memory:")
    Execute ("PRAGMA journal_mode = WAL");

  LOG (INFO) << "Opened database " << file;
}

Database::~Database ()
{
  const int rc = sqlite3_close (handle);
  if (rc != SQLITE_OK)
    LOG (ERROR) << "Failed to close database: " << sqlite3_errstr (rc);
}

void
Database::Execute (const std::string& sql)
{
  VLOG (2) << "Executing SQL:\n" << sql;

  char* err = nullptr;
  const int rc = sqlite3_exec (handle, sql.c_str (), nullptr, nullptr, &err);
  if (rc != SQLITE_OK)
    {
      std::string msg = "executing SQL";
      if (err != nullptr)
        {
          msg += ": ";
          msg += err;
          sqlite3_free (err);
        }
      throw DatabaseError (rc, msg);
    }
}

Database::Statement
Database::Prepare (const std::string& sql)
{
  sqlite3_stmt* stmt = nullptr;
  const int rc = sqlite3_prepare_v2 (handle, sql.c_str (), -1, &stmt, nullptr);
  if (rc != SQLITE_OK)
    throw DatabaseError (rc, ErrorMessage (handle, rc, "preparing " + sql));

  return Statement (handle, stmt);
}

int64_t
Database::GetLastInsertId () const
{
  return sqlite3_last_insert_rowid (handle);
}

bool
Database::IsInTransaction () const
{
  return sqlite3_get_autocommit (handle) == 0;
}

/* ************************************************************************** */

Database::Statement::Statement (Statement&& o)
  : db(o.db), stmt(o.stmt)
{
  o.stmt = nullptr;
}

Database::Statement::~Statement ()
{
  if (stmt != nullptr)
    sqlite3_finalize (stmt);
}

void
Database::Statement::Bind (const int ind, const int64_t val)
{
  const int rc = sqlite3_bind_int64 (stmt, ind, val);
  if (rc != SQLITE_OK)
    throw DatabaseError (rc, ErrorMessage (db, rc, "binding integer"));
}

void
Database::Statement::Bind (const int ind, const std::string& val)
{
  const int rc = sqlite3_bind_text (stmt, ind, val.data (), val.size (),
                                    SQLITE_TRANSIENT);
  if (rc != SQLITE_OK)
    throw DatabaseError (rc, ErrorMessage (db, rc, "binding text"));
}

void
Database::Statement::BindNull (const int ind)
{
  const int rc = sqlite3_bind_null (stmt, ind);
  if (rc != SQLITE_OK)
    throw DatabaseError (rc, ErrorMessage (db, rc, "binding null"));
}

void
Database::Statement::BindBlob (const int ind, const std::string& data)
{
  const int rc = sqlite3_bind_blob (stmt, ind, data.data (), data.size (),
                                    SQLITE_TRANSIENT);
  if (rc != SQLITE_OK)
    throw DatabaseError (rc, ErrorMessage (db, rc, "binding blob"));
}

bool
Database::Statement::Step ()
{
  const int rc = sqlite3_step (stmt);
  switch (rc)
    {
    case SQLITE_ROW:
      return true;
    case SQLITE_DONE:
      return false;
    default:
      throw DatabaseError (rc, ErrorMessage (db, rc, "stepping statement"));
    }
}

void
Database::Statement::Execute ()
{
  CHECK (!Step ()) << "Statement returned a row:\n" << sqlite3_sql (stmt);
}

void
Database::Statement::Reset ()
{
  /* sqlite3_reset returns the error of the last step, which has been
     reported already from Step itself.  */
  sqlite3_reset (stmt);
  sqlite3_clear_bindings (stmt);
}

bool
Database::Statement::IsNull (const int ind) const
{
  return sqlite3_column_type (stmt, ind) == SQLITE_NULL;
}

template <>
  int64_t
  Database::Statement::Get<int64_t> (const int ind) const
{
  return sqlite3_column_int64 (stmt, ind);
}

template <>
  int
  Database::Statement::Get<int> (const int ind) const
{
  return sqlite3_column_int (stmt, ind);
}

template <>
  unsigned
  Database::Statement::Get<unsigned> (const int ind) const
{
  const int64_t val = Get<int64_t> (ind);
  CHECK_GE (val, 0);
  return static_cast<unsigned> (val);
}

template <>
  uint64_t
  Database::Statement::Get<uint64_t> (const int ind) const
{
  const int64_t val = Get<int64_t> (ind);
  CHECK_GE (val, 0);
  return static_cast<uint64_t> (val);
}

template <>
  bool
  Database::Statement::Get<bool> (const int ind) const
{
  return Get<int64_t> (ind) != 0;
}

template <>
  std::string
  Database::Statement::Get<std::string> (const int ind) const
{
  const auto* str
      = reinterpret_cast<const char*> (sqlite3_column_text (stmt, ind));
  if (str == nullptr)
    return "";

  return std::string (str, sqlite3_column_bytes (stmt, ind));
}

std::string
Database::Statement::GetBlob (const int ind) const
{
  const auto* data = static_cast<const char*> (sqlite3_column_blob (stmt, ind));
  if (data == nullptr)
    return "";

  return std::string (data, sqlite3_column_bytes (stmt, ind));
}

/* ************************************************************************** */

Transaction::Transaction (Database& d)
  : db(d), committed(false)
{
  CHECK (!db.IsInTransaction ()) << "Nested transactions are not supported";
  db.Execute ("BEGIN IMMEDIATE");
}

Transaction::~Transaction ()
{
  if (committed)
    return;

  VLOG (1) << "Rolling back transaction";
  try
    {
      db.Execute ("ROLLBACK");
    }
  catch (const DatabaseError& exc)
    {
      /* If the transaction has been aborted already by SQLite itself
         (e.g. on some I/O errors), ROLLBACK fails.  */
      LOG (ERROR) << "Rollback failed: " << exc.what ();
    }
}

void
Transaction::Commit ()
{
  CHECK (!committed);
  db.Execute ("COMMIT");
  committed = true;
}

} // namespace emporium
