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

#include "private/ledger.hpp"

#include "errors.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <limits>
#include <map>
#include <vector>

namespace emporium
{

namespace
{

/** Columns selected for reading a currency transaction.  */
constexpr const char* TRANSACTION_COLUMNS = R"(
  `id`, `from_competitor`, `to_competitor`, `amount`, `reason`,
  `status`, `type`, `occurred_at`
)";

/**
 * Fills in a CurrencyTransaction proto from a result row with
 * the TRANSACTION_COLUMNS.
 */
proto::CurrencyTransaction
ReadTransaction (const Database::Statement& stmt)
{
  proto::CurrencyTransaction res;
  res.set_id (stmt.Get<uint64_t> (0));
  if (!stmt.IsNull (1))
    res.set_from_competitor (stmt.Get<std::string> (1));
  if (!stmt.IsNull (2))
    res.set_to_competitor (stmt.Get<std::string> (2));
  res.set_amount (stmt.Get<int64_t> (3));
  res.set_reason (stmt.Get<std::string> (4));

  proto::CurrencyTransaction::Status status;
  CHECK (proto::CurrencyTransaction::Status_Parse (stmt.Get<std::string> (5),
                                                   &status));
  res.set_status (status);

  proto::CurrencyTransaction::Type type;
  CHECK (proto::CurrencyTransaction::Type_Parse (stmt.Get<std::string> (6),
                                                 &type));
  res.set_type (type);

  res.set_occurred_at (stmt.Get<int64_t> (7));
  return res;
}

} // anonymous namespace

constexpr int64_t LedgerStore::MAX_HISTORY_LIMIT;

bool
LedgerStore::LockBalance (const std::string& competitor,
                          proto::CurrencyBalance& out)
{
  CHECK (db.IsInTransaction ());

  auto stmt = db.Prepare (R"(
    SELECT `game`, `balance`
      FROM `currency_balance`
      WHERE `competitor` = ?1
  )");
  stmt.Bind (1, competitor);

  if (!stmt.Step ())
    return false;

  out.Clear ();
  out.set_competitor (competitor);
  out.set_game (stmt.Get<std::string> (0));
  out.set_balance (stmt.Get<int64_t> (1));
  CHECK (!stmt.Step ());

  return true;
}

void
LedgerStore::AddToBalance (const std::string& competitor, const Amount delta)
{
  auto stmt = db.Prepare (R"(
    UPDATE `currency_balance`
      SET `balance` = `balance` + ?2
      WHERE `competitor` = ?1
  )");
  stmt.Bind (1, competitor);
  stmt.Bind (2, delta);
  stmt.Execute ();
}

proto::CurrencyBalance
LedgerStore::OpenAccount (const std::string& competitor,
                          const std::string& game)
{
  if (competitor.empty () || game.empty ())
    throw GameError (ErrorKind::INVALID_ARGUMENT,
                     "competitor and game must be set");

  proto::CurrencyBalance res;
  if (LockBalance (competitor, res))
    throw GameError (ErrorKind::ACCOUNT_EXISTS,
                     "account exists already for " + competitor);

  auto stmt = db.Prepare (R"(
    INSERT INTO `currency_balance`
      (`competitor`, `game`, `balance`)
      VALUES (?1, ?2, 0)
  )");
  stmt.Bind (1, competitor);
  stmt.Bind (2, game);
  stmt.Execute ();

  LOG (INFO) << "Opened currency account for " << competitor
             << " in game " << game;

  res.set_competitor (competitor);
  res.set_game (game);
  res.set_balance (0);
  return res;
}

bool
LedgerStore::GetBalance (const std::string& competitor,
                         proto::CurrencyBalance& out)
{
  return LockBalance (competitor, out);
}

proto::BalanceDetails
LedgerStore::GetDetails (const std::string& competitor)
{
  proto::BalanceDetails res;
  if (!LockBalance (competitor, *res.mutable_balance ()))
    throw GameError (ErrorKind::ACCOUNT_NOT_FOUND,
                     "no account for " + competitor);

  {
    auto stmt = db.Prepare (R"(
      SELECT
        (SELECT COALESCE (SUM (`amount`), 0)
          FROM `currency_transaction`
          WHERE `to_competitor` = ?1),
        (SELECT COALESCE (SUM (`amount`), 0)
          FROM `currency_transaction`
          WHERE `from_competitor` = ?1)
    )");
    stmt.Bind (1, competitor);
    CHECK (stmt.Step ());
    res.set_total_earned (stmt.Get<int64_t> (0));
    res.set_total_spent (stmt.Get<int64_t> (1));
  }

  auto stmt = db.Prepare (std::string ("SELECT ") + TRANSACTION_COLUMNS + R"(
      FROM `currency_transaction`
      WHERE `from_competitor` = ?1 OR `to_competitor` = ?1
      ORDER BY `id` DESC
      LIMIT 1
  )");
  stmt.Bind (1, competitor);
  if (stmt.Step ())
    *res.mutable_last_transaction () = ReadTransaction (stmt);

  return res;
}

std::vector<proto::CurrencyTransaction>
LedgerStore::GetHistory (const std::string& competitor, const int64_t limit,
                         const int64_t offset)
{
  if (limit < 1 || limit > MAX_HISTORY_LIMIT || offset < 0)
    throw GameError (ErrorKind::INVALID_ARGUMENT,
                     "invalid history page requested");

  proto::CurrencyBalance balance;
  if (!LockBalance (competitor, balance))
    throw GameError (ErrorKind::ACCOUNT_NOT_FOUND,
                     "no account for " + competitor);

  auto stmt = db.Prepare (std::string ("SELECT ") + TRANSACTION_COLUMNS + R"(
      FROM `currency_transaction`
      WHERE `from_competitor` = ?1 OR `to_competitor` = ?1
      ORDER BY `id` DESC
      LIMIT ?2 OFFSET ?3
  )");
  stmt.Bind (1, competitor);
  stmt.Bind (2, limit);
  stmt.Bind (3, offset);

  std::vector<proto::CurrencyTransaction> res;
  while (stmt.Step ())
    res.push_back (ReadTransaction (stmt));

  return res;
}

Amount
LedgerStore::GetTotalBalance (const std::string& game)
{
  auto stmt = db.Prepare (R"(
    SELECT COALESCE (SUM (`balance`), 0)
      FROM `currency_balance`
      WHERE ?1 = '' OR `game` = ?1
  )");
  stmt.Bind (1, game);
  CHECK (stmt.Step ());

  return stmt.Get<int64_t> (0);
}

void
LedgerStore::CheckFunds (const std::string& competitor, const Amount amount)
{
  proto::CurrencyBalance balance;
  if (!LockBalance (competitor, balance) || balance.balance () < amount)
    throw GameError (ErrorKind::INSUFFICIENT_FUNDS,
                     "insufficient funds for " + competitor);
}

proto::CurrencyTransaction
LedgerStore::ExecuteTransfer (const std::string* from, const std::string* to,
                              const Amount amount, const std::string& reason,
                              const proto::CurrencyTransaction::Type type)
{
  CHECK (db.IsInTransaction ()) << "Transfers require an active transaction";
  CHECK (from != nullptr || to != nullptr);

  if (amount <= 0)
    throw GameError (ErrorKind::INVALID_ARGUMENT,
                     "transfer amount must be positive");
  if (from != nullptr && to != nullptr && *from == *to)
    throw GameError (ErrorKind::INVALID_ARGUMENT,
                     "cannot transfer currency to oneself");

  /* Lock the involved balance rows in a fixed (ascending) order.  With the
     SQLite write lock held by the transaction, this is what two concurrent
     transfers in opposite directions would need to avoid deadlocks if
     the locks were per row.  */
  std::vector<std::string> order;
  if (from != nullptr)
    order.push_back (*from);
  if (to != nullptr)
    order.push_back (*to);
  std::sort (order.begin (), order.end ());

  std::map<std::string, proto::CurrencyBalance> locked;
  for (const auto& id : order)
    {
      proto::CurrencyBalance balance;
      if (LockBalance (id, balance))
        locked.emplace (id, std::move (balance));
    }

  if (from != nullptr)
    {
      const auto mit = locked.find (*from);
      if (mit == locked.end () || mit->second.balance () < amount)
        throw GameError (ErrorKind::INSUFFICIENT_FUNDS,
                         "insufficient funds for " + *from);
    }

  if (to != nullptr)
    {
      const auto mit = locked.find (*to);
      if (mit == locked.end ())
        throw GameError (ErrorKind::RECIPIENT_NOT_FOUND,
                         "recipient not found: " + *to);
      if (mit->second.balance () > std::numeric_limits<Amount>::max () - amount)
        throw GameError (ErrorKind::INVALID_ARGUMENT,
                         "balance overflow for " + *to);
    }

  /* All checks passed, now do the writes.  */

  if (from != nullptr)
    AddToBalance (*from, -amount);
  if (to != nullptr)
    AddToBalance (*to, amount);

  proto::CurrencyTransaction res;
  if (from != nullptr)
    res.set_from_competitor (*from);
  if (to != nullptr)
    res.set_to_competitor (*to);
  res.set_amount (amount);
  res.set_reason (reason);
  res.set_status (proto::CurrencyTransaction::COMPLETED);
  res.set_type (type);
  res.set_occurred_at (clock.GetCurrentTime ());

  auto stmt = db.Prepare (R"(
    INSERT INTO `currency_transaction`
      (`from_competitor`, `to_competitor`, `amount`, `reason`,
       `status`, `type`, `occurred_at`)
      VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)
  )");
  if (res.has_from_competitor ())
    stmt.Bind (1, res.from_competitor ());
  else
    stmt.BindNull (1);
  if (res.has_to_competitor ())
    stmt.Bind (2, res.to_competitor ());
  else
    stmt.BindNull (2);
  stmt.Bind (3, res.amount ());
  stmt.Bind (4, res.reason ());
  stmt.Bind (5, proto::CurrencyTransaction::Status_Name (res.status ()));
  stmt.Bind (6, proto::CurrencyTransaction::Type_Name (res.type ()));
  stmt.Bind (7, res.occurred_at ());
  stmt.Execute ();

  res.set_id (db.GetLastInsertId ());

  LOG (INFO)
      << "Currency " << proto::CurrencyTransaction::Type_Name (type)
      << " #" << res.id () << ": "
      << (from == nullptr ? "<mint>" : *from)
      << " -> " << (to == nullptr ? "<burn>" : *to)
      << ", amount " << amount << " (" << reason << ")";

  return res;
}

proto::CurrencyTransaction
LedgerStore::Transfer (const std::string& from, const std::string& to,
                       const Amount amount, const std::string& reason,
                       const proto::CurrencyTransaction::Type type)
{
  return ExecuteTransfer (&from, &to, amount, reason, type);
}

proto::CurrencyTransaction
LedgerStore::Mint (const std::string& to, const Amount amount,
                   const std::string& reason,
                   const proto::CurrencyTransaction::Type type)
{
  return ExecuteTransfer (nullptr, &to, amount, reason, type);
}

proto::CurrencyTransaction
LedgerStore::Burn (const std::string& from, const Amount amount,
                   const std::string& reason,
                   const proto::CurrencyTransaction::Type type)
{
  return ExecuteTransfer (&from, nullptr, amount, reason, type);
}

} // namespace emporium
