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

#ifndef EMPORIUM_DATABASE_HPP
#define EMPORIUM_DATABASE_HPP

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace emporium
{

/**
 * Exception thrown when an SQLite call fails.  This is a "generic" failure
 * from the point of view of the domain logic.  Errors like a busy database
 * (lock timeout) are transient and may be retried by the caller.
 */
class DatabaseError : public std::runtime_error
{

private:

  /** The SQLite result code.  */
  const int code;

public:

  explicit DatabaseError (int c, const std::string& msg);

  int
  GetCode () const
  {
    return code;
  }

  /**
   * Returns true if the error is due to lock contention or a timeout,
   * i.e. retrying the whole operation later may succeed.
   */
  bool IsTransient () const;

};

/**
 * Handle to an SQLite database connection.  This is the store handle that
 * gets injected into all the components of the engine.  Instances are not
 * thread-safe; each thread (or the Engine with its lock) should use
 * its own connection.
 */
class Database
{

private:

  /** The underlying SQLite connection.  */
  sqlite3* handle;

public:

  class Statement;

  /**
   * Opens the database at the given file name (which may be ":memory:").
   * The busy timeout is how long a statement waits for a lock held by
   * another connection before failing.
   */
  explicit Database (const std::string& file,
                     std::chrono::milliseconds busyTimeout);

  ~Database ();

  Database () = delete;
  Database (const Database&) = delete;
  void operator= (const Database&) = delete;

  /**
   * Executes one or more SQL statements without bound parameters
   * or results.
   */
  void Execute (const std::string& sql);

  /**
   * Prepares a statement for execution.
   */
  Statement Prepare (const std::string& sql);

  /**
   * Returns the row ID of the last inserted row.
   */
  int64_t GetLastInsertId () const;

  /**
   * Returns true if a transaction is currently open on this connection.
   */
  bool IsInTransaction () const;

};

/**
 * A prepared statement.  Parameters are bound by their (1-based) index,
 * result columns are retrieved by (0-based) column index.
 */
class Database::Statement
{

private:

  /** The connection, used for error messages.  */
  sqlite3* db;

  /** The underlying statement.  */
  sqlite3_stmt* stmt;

  explicit Statement (sqlite3* d, sqlite3_stmt* s)
    : db(d), stmt(s)
  {}

  friend class Database;

public:

  Statement (Statement&& o);
  ~Statement ();

  Statement () = delete;
  Statement (const Statement&) = delete;
  void operator= (const Statement&) = delete;

  void Bind (int ind, int64_t val);
  void Bind (int ind, const std::string& val);
  void BindNull (int ind);

  /**
   * Binds a serialised protocol buffer (or other binary data) as blob.
   */
  void BindBlob (int ind, const std::string& data);

  /**
   * Steps the statement.  Returns true if there is a result row, and
   * false if the statement is done.
   */
  bool Step ();

  /**
   * Executes a statement that is not expected to return any rows.
   */
  void Execute ();

  /**
   * Resets the statement so it can be executed again with new bindings.
   */
  void Reset ();

  /**
   * Returns true if the given column of the current row is NULL.
   */
  bool IsNull (int ind) const;

  /**
   * Extracts the value of a column of the current row.
   */
  template <typename T>
    T Get (int ind) const;

  /**
   * Extracts a blob column as binary string.
   */
  std::string GetBlob (int ind) const;

};

template <>
  int64_t Database::Statement::Get<int64_t> (int ind) const;
template <>
  int Database::Statement::Get<int> (int ind) const;
template <>
  unsigned Database::Statement::Get<unsigned> (int ind) const;
template <>
  uint64_t Database::Statement::Get<uint64_t> (int ind) const;
template <>
  bool Database::Statement::Get<bool> (int ind) const;
template <>
  std::string Database::Statement::Get<std::string> (int ind) const;

/**
 * RAII scope for a write transaction.  It is started with BEGIN IMMEDIATE,
 * so that the database write lock is acquired before any of the reads done
 * inside the transaction.  That way all rows read can be treated as locked
 * for update until the transaction ends.
 *
 * If the instance is destructed without Commit having been called
 * (e.g. because an exception is propagating), the transaction is
 * rolled back.
 */
class Transaction
{

private:

  Database& db;

  /** Set to true once the transaction has been committed.  */
  bool committed;

public:

  explicit Transaction (Database& d);
  ~Transaction ();

  Transaction () = delete;
  Transaction (const Transaction&) = delete;
  void operator= (const Transaction&) = delete;

  /**
   * Commits the transaction.  Must be called at most once.
   */
  void Commit ();

};

} // namespace emporium

#endif // EMPORIUM_DATABASE_HPP
