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

#include "testutils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <string>

namespace emporium
{
namespace
{

using std::chrono::milliseconds;

class DatabaseTests : public testing::Test
{

protected:

  Database db;

  DatabaseTests ()
    : db(":memory:", milliseconds (100))
  {
    db.Execute (R"(
      CREATE TABLE `test` (
        `id` INTEGER NOT NULL PRIMARY KEY,
        `name` TEXT NULL,
        `data` BLOB NULL
      );
    )");
  }

  int64_t
  CountRows ()
  {
    auto stmt = db.Prepare ("SELECT COUNT(*) FROM `test`");
    CHECK (stmt.Step ());
    return stmt.Get<int64_t> (0);
  }

};

TEST_F (DatabaseTests, BindAndGet)
{
  auto stmt = db.Prepare (R"(
    INSERT INTO `test` (`id`, `name`, `data`) VALUES (?1, ?2, ?3)
  )");
  stmt.Bind (1, 42);
  stmt.Bind (2, "foo");
  stmt.BindBlob (3, std::string ("a\0b", 3));
  stmt.Execute ();
  stmt.Reset ();

  stmt.Bind (1, 43);
  stmt.BindNull (2);
  stmt.BindNull (3);
  stmt.Execute ();

  auto query = db.Prepare (R"(
    SELECT `id`, `name`, `data` FROM `test` ORDER BY `id`
  )");

  ASSERT_TRUE (query.Step ());
  EXPECT_EQ (query.Get<int64_t> (0), 42);
  EXPECT_EQ (query.Get<unsigned> (0), 42u);
  EXPECT_EQ (query.Get<std::string> (1), "foo");
  EXPECT_EQ (query.GetBlob (2), std::string ("a\0b", 3));
  EXPECT_FALSE (query.IsNull (1));

  ASSERT_TRUE (query.Step ());
  EXPECT_EQ (query.Get<int> (0), 43);
  EXPECT_TRUE (query.IsNull (1));
  EXPECT_TRUE (query.IsNull (2));

  EXPECT_FALSE (query.Step ());
}

TEST_F (DatabaseTests, LastInsertId)
{
  db.Execute ("INSERT INTO `test` (`name`) VALUES ('x')");
  const auto first = db.GetLastInsertId ();
  db.Execute ("INSERT INTO `test` (`name`) VALUES ('y')");
  EXPECT_EQ (db.GetLastInsertId (), first + 1);
}

TEST_F (DatabaseTests, InvalidSql)
{
  EXPECT_THROW (db.Execute ("INVALID SQL"), DatabaseError);
  EXPECT_THROW (db.Prepare ("SELECT * FROM `nonexistent`"), DatabaseError);

  try
    {
      db.Execute ("INVALID SQL");
      FAIL () << "no error thrown";
    }
  catch (const DatabaseError& exc)
    {
      EXPECT_FALSE (exc.IsTransient ());
    }
}

TEST_F (DatabaseTests, ConstraintViolation)
{
  db.Execute ("INSERT INTO `test` (`id`) VALUES (1)");
  auto stmt = db.Prepare ("INSERT INTO `test` (`id`) VALUES (1)");
  EXPECT_THROW (stmt.Step (), DatabaseError);
}

TEST_F (DatabaseTests, TransactionCommit)
{
  {
    Transaction tx(db);
    EXPECT_TRUE (db.IsInTransaction ());
    db.Execute ("INSERT INTO `test` (`id`) VALUES (1)");
    tx.Commit ();
  }

  EXPECT_FALSE (db.IsInTransaction ());
  EXPECT_EQ (CountRows (), 1);
}

TEST_F (DatabaseTests, TransactionRollback)
{
  {
    Transaction tx(db);
    db.Execute ("INSERT INTO `test` (`id`) VALUES (1)");
  }
  EXPECT_EQ (CountRows (), 0);

  try
    {
      Transaction tx(db);
      db.Execute ("INSERT INTO `test` (`id`) VALUES (2)");
      throw GameError (ErrorKind::INVALID_ARGUMENT, "abort");
    }
  catch (const GameError& exc)
    {}

  EXPECT_FALSE (db.IsInTransaction ());
  EXPECT_EQ (CountRows (), 0);
}

TEST_F (DatabaseTests, NestedTransactionDies)
{
  Transaction tx(db);
  EXPECT_DEATH (
    {
      Transaction inner(db);
    }, "Nested transactions");
}

TEST (DatabaseLockingTests, BusyIsTransient)
{
  const std::string file = testing::TempDir () + "emporium_locking.sqlite";
  std::remove (file.c_str ());

  Database first(file, milliseconds (10));
  Database second(file, milliseconds (10));
  first.Execute ("CREATE TABLE `test` (`id` INTEGER PRIMARY KEY)");

  Transaction tx(first);
  first.Execute ("INSERT INTO `test` (`id`) VALUES (1)");

  try
    {
      Transaction other(second);
      FAIL () << "second write transaction started";
    }
  catch (const DatabaseError& exc)
    {
      EXPECT_TRUE (exc.IsTransient ()) << exc.what ();
    }

  tx.Commit ();
  Transaction other(second);
  other.Commit ();
}

} // anonymous namespace
} // namespace emporium
