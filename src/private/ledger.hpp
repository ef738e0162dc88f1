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

#ifndef EMPORIUM_LEDGER_HPP
#define EMPORIUM_LEDGER_HPP

#include "clock.hpp"
#include "database.hpp"
#include "proto/economy.pb.h"

#include <cstdint>
#include <string>
#include <vector>

namespace emporium
{

/** An amount of currency or items.  */
using Amount = int64_t;

/**
 * The currency ledger:  Per-competitor balances and the append-only log
 * of transactions.  It implements the atomic transfer primitive that
 * everything else moving currency goes through.
 *
 * All methods must be called while a Transaction is active on the
 * database connection.
 */
class LedgerStore
{

private:

  Database& db;
  const Clock& clock;

  /**
   * Reads the balance row of a competitor.  Since the enclosing transaction
   * holds the write lock already, the row is locked for update from here
   * on.  Returns false if there is no such row.
   */
  bool LockBalance (const std::string& competitor,
                    proto::CurrencyBalance& out);

  /**
   * Adds a (possibly negative) delta to a competitor's balance.
   */
  void AddToBalance (const std::string& competitor, Amount delta);

  /**
   * The actual implementation of the atomic transfer.  A null from
   * means minting, a null to means burning.
   */
  proto::CurrencyTransaction ExecuteTransfer (
      const std::string* from, const std::string* to, Amount amount,
      const std::string& reason, proto::CurrencyTransaction::Type type);

public:

  /** Maximum page size for GetHistory.  */
  static constexpr int64_t MAX_HISTORY_LIMIT = 100;

  explicit LedgerStore (Database& d, const Clock& c)
    : db(d), clock(c)
  {}

  LedgerStore () = delete;
  LedgerStore (const LedgerStore&) = delete;
  void operator= (const LedgerStore&) = delete;

  /**
   * Creates a new zero-balance account for the given competitor.
   * Fails with ACCOUNT_EXISTS if there is one already.
   */
  proto::CurrencyBalance OpenAccount (const std::string& competitor,
                                      const std::string& game);

  /**
   * Looks up the balance of a competitor.  Returns false if the competitor
   * has no account.
   */
  bool GetBalance (const std::string& competitor,
                   proto::CurrencyBalance& out);

  /**
   * Returns the balance and transaction statistics for a competitor.
   * Fails with ACCOUNT_NOT_FOUND if there is no account.
   */
  proto::BalanceDetails GetDetails (const std::string& competitor);

  /**
   * Returns a page of the competitor's currency transactions (sent or
   * received), newest first.  Fails with ACCOUNT_NOT_FOUND if there is
   * no account, and with INVALID_ARGUMENT if limit is not in
   * [1, MAX_HISTORY_LIMIT] or offset is negative.
   */
  std::vector<proto::CurrencyTransaction> GetHistory (
      const std::string& competitor, int64_t limit, int64_t offset);

  /**
   * Returns the sum of all balances (optionally only within one game).
   */
  Amount GetTotalBalance (const std::string& game = "");

  /**
   * Verifies that the competitor has at least the given balance, and
   * throws INSUFFICIENT_FUNDS if not.  This is used to validate
   * multi-step operations before they write anything.
   */
  void CheckFunds (const std::string& competitor, Amount amount);

  /**
   * Transfers currency between two competitors.  The balance rows are
   * locked in ascending order of the competitor IDs and checked again
   * under the lock.  Fails with INSUFFICIENT_FUNDS or RECIPIENT_NOT_FOUND
   * before doing any writes.
   */
  proto::CurrencyTransaction Transfer (
      const std::string& from, const std::string& to, Amount amount,
      const std::string& reason,
      proto::CurrencyTransaction::Type type
          = proto::CurrencyTransaction::TRANSFER);

  /**
   * Creates new currency for a competitor (e.g. rewards).
   */
  proto::CurrencyTransaction Mint (const std::string& to, Amount amount,
                                   const std::string& reason,
                                   proto::CurrencyTransaction::Type type);

  /**
   * Removes currency from a competitor's balance (e.g. shop purchases).
   */
  proto::CurrencyTransaction Burn (const std::string& from, Amount amount,
                                   const std::string& reason,
                                   proto::CurrencyTransaction::Type type);

};

} // namespace emporium

#endif // EMPORIUM_LEDGER_HPP
