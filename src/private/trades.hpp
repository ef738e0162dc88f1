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

#ifndef EMPORIUM_TRADES_HPP
#define EMPORIUM_TRADES_HPP

#include "clock.hpp"
#include "database.hpp"
#include "private/inventory.hpp"
#include "private/ledger.hpp"
#include "proto/economy.pb.h"

#include <cstdint>
#include <string>
#include <vector>

namespace emporium
{

/**
 * The engine for peer-to-peer trades between competitors.  A trade offer
 * is created by one competitor (the "from" side) for another (the "to"
 * side) and lists items (and optionally currency) each side contributes.
 * Offers start as PENDING and transition exactly once into one of the
 * terminal states COMPLETED, REJECTED, CANCELLED or EXPIRED.
 *
 * Holdings are checked when an offer is created, but nothing is reserved.
 * When the offer is accepted, all holdings are validated again, and the
 * items are only moved (all together) if they are still sufficient.
 *
 * All methods must be called while a Transaction is active on the
 * database connection.
 */
class TradeEngine
{

private:

  Database& db;
  LedgerStore& ledger;
  InventoryStore& inventory;
  const Clock& clock;

  /** Duration (in seconds) after which new offers expire.  */
  const int64_t expirySeconds;

  /**
   * Reads an offer with its items from the database.  Returns false if
   * there is no offer with the given ID.  The state is returned as it
   * is stored, i.e. without taking expiry into account.
   */
  bool LookupOffer (uint64_t id, proto::TradeOffer& out);

  /**
   * Returns true if the offer is still pending and not yet expired.
   */
  bool IsOpen (const proto::TradeOffer& offer) const;

  /**
   * Turns a stored offer into its "public" form, i.e. reports pending
   * offers past their expiry as EXPIRED.
   */
  void ApplyExpiry (proto::TradeOffer& offer) const;

  /**
   * Updates the state of an offer in the database and in the proto.
   */
  void SetState (proto::TradeOffer& offer, proto::TradeOffer::State state);

  /**
   * Verifies that the contributing side(s) still hold all the items
   * they give in the trade.  Quantities of repeated items are summed up.
   * Throws INSUFFICIENT_QUANTITY for the first item that is not
   * sufficiently available.
   */
  void ValidateHoldings (const proto::TradeOffer& offer, bool onlyFromSide);

  /**
   * Validates (under lock) and executes the movement of all items and
   * currency of an accepted offer.
   */
  void Settle (const proto::TradeOffer& offer);

public:

  explicit TradeEngine (Database& d, LedgerStore& l, InventoryStore& i,
                        const Clock& c, const int64_t expiry)
    : db(d), ledger(l), inventory(i), clock(c), expirySeconds(expiry)
  {}

  TradeEngine () = delete;
  TradeEngine (const TradeEngine&) = delete;
  void operator= (const TradeEngine&) = delete;

  /**
   * Creates a new trade offer.  Fails with INSUFFICIENT_QUANTITY naming
   * the first item the creator does not hold enough of, and with
   * INSUFFICIENT_FUNDS if the offered currency exceeds their balance.
   * Either nothing or the full offer is created.
   */
  proto::TradeOffer CreateOffer (const std::string& from,
                                 const std::string& to,
                                 const std::vector<proto::TradeItem>& items,
                                 Amount offeredCurrency,
                                 Amount requestedCurrency);

  /**
   * Accepts or rejects an offer.  Only the recipient of a pending,
   * non-expired offer may respond, otherwise INVALID_TRADE is thrown.
   * If settlement of an accepted offer fails, the error is thrown and
   * the offer remains pending.
   */
  proto::TradeOffer Respond (uint64_t id, const std::string& responder,
                             bool accept);

  /**
   * Cancels a pending offer.  Only its creator may do that.
   */
  proto::TradeOffer Cancel (uint64_t id, const std::string& requester);

  /**
   * Returns an offer by ID.  Fails with INVALID_TRADE if there is none.
   */
  proto::TradeOffer GetOffer (uint64_t id);

  /**
   * Returns all offers a competitor is part of (on either side),
   * ordered by ID.
   */
  std::vector<proto::TradeOffer> ListOffers (const std::string& competitor,
                                             bool pendingOnly);

  /**
   * Marks all pending offers that are past their expiry time as EXPIRED.
   * This is not needed for correctness, but keeps queries efficient.
   * Returns the number of offers that were expired.
   */
  unsigned ExpireOffers ();

};

} // namespace emporium

#endif // EMPORIUM_TRADES_HPP
