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

#include "private/trades.hpp"

#include "errors.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <limits>
#include <map>
#include <sstream>
#include <utility>

namespace emporium
{

DEFINE_int32 (emporium_max_trade_items, 32,
              "Maximum number of item entries in a single trade offer");

namespace
{

/**
 * Returns a description of the trade for log and error messages.
 */
std::string
DescribeTrade (const uint64_t id)
{
  std::ostringstream out;
  out << "trade #" << id;
  return out.str ();
}

} // anonymous namespace

bool
TradeEngine::LookupOffer (const uint64_t id, proto::TradeOffer& out)
{
  CHECK (db.IsInTransaction ());

  {
    auto stmt = db.Prepare (R"(
      SELECT `from_competitor`, `to_competitor`, `state`,
             `offered_currency`, `requested_currency`,
             `created_at`, `expires_at`, `completed_at`
        FROM `trade_offer`
        WHERE `id` = ?1
    )");
    stmt.Bind (1, id);

    if (!stmt.Step ())
      return false;

    out.Clear ();
    out.set_id (id);
    out.set_from_competitor (stmt.Get<std::string> (0));
    out.set_to_competitor (stmt.Get<std::string> (1));

    proto::TradeOffer::State state;
    CHECK (proto::TradeOffer::State_Parse (stmt.Get<std::string> (2), &state));
    out.set_state (state);

    out.set_offered_currency (stmt.Get<int64_t> (3));
    out.set_requested_currency (stmt.Get<int64_t> (4));
    out.set_created_at (stmt.Get<int64_t> (5));
    out.set_expires_at (stmt.Get<int64_t> (6));
    if (!stmt.IsNull (7))
      out.set_completed_at (stmt.Get<int64_t> (7));
  }

  auto stmt = db.Prepare (R"(
    SELECT `item`, `quantity`, `from_competitor`
      FROM `trade_item`
      WHERE `trade` = ?1
      ORDER BY `position`
  )");
  stmt.Bind (1, id);

  while (stmt.Step ())
    {
      auto* item = out.add_items ();
      item->set_item (stmt.Get<std::string> (0));
      item->set_quantity (stmt.Get<int64_t> (1));
      item->set_from_competitor (stmt.Get<bool> (2));
    }

  return true;
}

bool
TradeEngine::IsOpen (const proto::TradeOffer& offer) const
{
  return offer.state () == proto::TradeOffer::PENDING
            && offer.expires_at () >= clock.GetCurrentTime ();
}

void
TradeEngine::ApplyExpiry (proto::TradeOffer& offer) const
{
  if (offer.state () == proto::TradeOffer::PENDING && !IsOpen (offer))
    offer.set_state (proto::TradeOffer::EXPIRED);
}

void
TradeEngine::SetState (proto::TradeOffer& offer,
                       const proto::TradeOffer::State state)
{
  CHECK_EQ (offer.state (), proto::TradeOffer::PENDING)
      << "Invalid state transition for " << DescribeTrade (offer.id ());

  offer.set_state (state);
  if (state == proto::TradeOffer::COMPLETED)
    offer.set_completed_at (clock.GetCurrentTime ());

  auto stmt = db.Prepare (R"(
    UPDATE `trade_offer`
      SET `state` = ?2, `completed_at` = ?3
      WHERE `id` = ?1 AND `state` = 'PENDING'
  )");
  stmt.Bind (1, offer.id ());
  stmt.Bind (2, proto::TradeOffer::State_Name (state));
  if (offer.has_completed_at ())
    stmt.Bind (3, offer.completed_at ());
  else
    stmt.BindNull (3);
  stmt.Execute ();

  LOG (INFO)
      << DescribeTrade (offer.id ()) << " is now "
      << proto::TradeOffer::State_Name (state);
}

void
TradeEngine::ValidateHoldings (const proto::TradeOffer& offer,
                               const bool onlyFromSide)
{
  /* Sum up the quantities per contributing side and item, but remember the
     order in which the items appear so that we report the first one.  */
  using Key = std::pair<bool, std::string>;
  std::map<Key, Amount> required;
  std::vector<Key> order;

  for (const auto& entry : offer.items ())
    {
      if (onlyFromSide && !entry.from_competitor ())
        continue;

      const Key key(entry.from_competitor (), entry.item ());
      auto mit = required.find (key);
      if (mit == required.end ())
        {
          required.emplace (key, entry.quantity ());
          order.push_back (key);
        }
      else
        {
          if (mit->second > std::numeric_limits<Amount>::max ()
                              - entry.quantity ())
            throw GameError (ErrorKind::INVALID_ARGUMENT,
                             "total quantity of " + entry.item ()
                               + " in trade overflows");
          mit->second += entry.quantity ();
        }
    }

  for (const auto& key : order)
    {
      const std::string& contributor = key.first
          ? offer.from_competitor ()
          : offer.to_competitor ();

      const Amount held = inventory.GetQuantity (contributor, key.second);
      if (held < required[key])
        throw GameError (ErrorKind::INSUFFICIENT_QUANTITY,
                         contributor + " has insufficient quantity of "
                           + key.second);
    }
}

void
TradeEngine::Settle (const proto::TradeOffer& offer)
{
  /* Holdings and balances may have changed since the offer was made, so
     everything is checked again now that we hold the lock.  Nothing is
     written before all checks passed.  */
  ValidateHoldings (offer, false);
  if (offer.offered_currency () > 0)
    ledger.CheckFunds (offer.from_competitor (), offer.offered_currency ());
  if (offer.requested_currency () > 0)
    ledger.CheckFunds (offer.to_competitor (), offer.requested_currency ());

  for (const auto& entry : offer.items ())
    {
      const std::string* giver = &offer.from_competitor ();
      const std::string* receiver = &offer.to_competitor ();
      if (!entry.from_competitor ())
        std::swap (giver, receiver);

      inventory.Remove (*giver, entry.item (), entry.quantity ());
      inventory.Acquire (*receiver, entry.item (), entry.quantity (), "trade");
    }

  const std::string reason = DescribeTrade (offer.id ());
  if (offer.offered_currency () > 0)
    ledger.Transfer (offer.from_competitor (), offer.to_competitor (),
                     offer.offered_currency (), reason,
                     proto::CurrencyTransaction::TRADE);
  if (offer.requested_currency () > 0)
    ledger.Transfer (offer.to_competitor (), offer.from_competitor (),
                     offer.requested_currency (), reason,
                     proto::CurrencyTransaction::TRADE);
}

proto::TradeOffer
TradeEngine::CreateOffer (const std::string& from, const std::string& to,
                          const std::vector<proto::TradeItem>& items,
                          const Amount offeredCurrency,
                          const Amount requestedCurrency)
{
  CHECK (db.IsInTransaction ());

  if (from.empty () || to.empty ())
    throw GameError (ErrorKind::INVALID_ARGUMENT,
                     "both trade parties must be set");
  if (from == to)
    throw GameError (ErrorKind::INVALID_TRADE, "cannot trade with oneself");

  if (items.size () > static_cast<size_t> (FLAGS_emporium_max_trade_items))
    throw GameError (ErrorKind::INVALID_ARGUMENT, "too many items in trade");
  for (const auto& entry : items)
    if (entry.item ().empty () || entry.quantity () <= 0)
      throw GameError (ErrorKind::INVALID_ARGUMENT,
                       "invalid item entry in trade");

  if (offeredCurrency < 0 || requestedCurrency < 0)
    throw GameError (ErrorKind::INVALID_ARGUMENT,
                     "currency amounts must not be negative");
  if (items.empty () && offeredCurrency == 0 && requestedCurrency == 0)
    throw GameError (ErrorKind::INVALID_ARGUMENT, "empty trade");

  proto::CurrencyBalance balance;
  if (!ledger.GetBalance (from, balance))
    throw GameError (ErrorKind::ACCOUNT_NOT_FOUND, "no account for " + from);
  if (!ledger.GetBalance (to, balance))
    throw GameError (ErrorKind::RECIPIENT_NOT_FOUND,
                     "recipient not found: " + to);

  proto::TradeOffer res;
  res.set_from_competitor (from);
  res.set_to_competitor (to);
  res.set_state (proto::TradeOffer::PENDING);
  for (const auto& entry : items)
    *res.add_items () = entry;
  res.set_offered_currency (offeredCurrency);
  res.set_requested_currency (requestedCurrency);

  ValidateHoldings (res, true);
  if (offeredCurrency > 0)
    ledger.CheckFunds (from, offeredCurrency);

  res.set_created_at (clock.GetCurrentTime ());
  res.set_expires_at (res.created_at () + expirySeconds);

  {
    auto stmt = db.Prepare (R"(
      INSERT INTO `trade_offer`
        (`from_competitor`, `to_competitor`, `state`,
         `offered_currency`, `requested_currency`,
         `created_at`, `expires_at`)
        VALUES (?1, ?2, 'PENDING', ?3, ?4, ?5, ?6)
    )");
    stmt.Bind (1, from);
    stmt.Bind (2, to);
    stmt.Bind (3, offeredCurrency);
    stmt.Bind (4, requestedCurrency);
    stmt.Bind (5, res.created_at ());
    stmt.Bind (6, res.expires_at ());
    stmt.Execute ();
  }
  res.set_id (db.GetLastInsertId ());

  auto stmt = db.Prepare (R"(
    INSERT INTO `trade_item`
      (`trade`, `position`, `item`, `quantity`, `from_competitor`)
      VALUES (?1, ?2, ?3, ?4, ?5)
  )");
  for (int i = 0; i < res.items_size (); ++i)
    {
      const auto& entry = res.items (i);
      stmt.Bind (1, res.id ());
      stmt.Bind (2, i);
      stmt.Bind (3, entry.item ());
      stmt.Bind (4, entry.quantity ());
      stmt.Bind (5, entry.from_competitor ());
      stmt.Execute ();
      stmt.Reset ();
    }

  LOG (INFO)
      << "Created " << DescribeTrade (res.id ()) << " from " << from
      << " to " << to << " with " << res.items_size () << " items";
  VLOG (1) << "Trade offer:\n" << res.DebugString ();

  return res;
}

proto::TradeOffer
TradeEngine::Respond (const uint64_t id, const std::string& responder,
                      const bool accept)
{
  proto::TradeOffer offer;
  if (!LookupOffer (id, offer))
    throw GameError (ErrorKind::INVALID_TRADE,
                     DescribeTrade (id) + " does not exist");
  if (offer.to_competitor () != responder)
    throw GameError (ErrorKind::INVALID_TRADE,
                     responder + " cannot respond to " + DescribeTrade (id));
  if (!IsOpen (offer))
    throw GameError (ErrorKind::INVALID_TRADE,
                     DescribeTrade (id) + " is not pending");

  if (!accept)
    {
      SetState (offer, proto::TradeOffer::REJECTED);
      return offer;
    }

  Settle (offer);
  SetState (offer, proto::TradeOffer::COMPLETED);

  return offer;
}

proto::TradeOffer
TradeEngine::Cancel (const uint64_t id, const std::string& requester)
{
  proto::TradeOffer offer;
  if (!LookupOffer (id, offer))
    throw GameError (ErrorKind::INVALID_TRADE,
                     DescribeTrade (id) + " does not exist");
  if (offer.from_competitor () != requester)
    throw GameError (ErrorKind::INVALID_TRADE,
                     requester + " cannot cancel " + DescribeTrade (id));
  if (!IsOpen (offer))
    throw GameError (ErrorKind::INVALID_TRADE,
                     DescribeTrade (id) + " is not pending");

  SetState (offer, proto::TradeOffer::CANCELLED);
  return offer;
}

proto::TradeOffer
TradeEngine::GetOffer (const uint64_t id)
{
  proto::TradeOffer res;
  if (!LookupOffer (id, res))
    throw GameError (ErrorKind::INVALID_TRADE,
                     DescribeTrade (id) + " does not exist");

  ApplyExpiry (res);
  return res;
}

std::vector<proto::TradeOffer>
TradeEngine::ListOffers (const std::string& competitor,
                         const bool pendingOnly)
{
  std::vector<uint64_t> ids;
  {
    auto stmt = db.Prepare (R"(
      SELECT `id`
        FROM `trade_offer`
        WHERE (`from_competitor` = ?1 OR `to_competitor` = ?1)
          AND (NOT ?2 OR (`state` = 'PENDING' AND `expires_at` >= ?3))
        ORDER BY `id`
    )");
    stmt.Bind (1, competitor);
    stmt.Bind (2, pendingOnly);
    stmt.Bind (3, clock.GetCurrentTime ());

    while (stmt.Step ())
      ids.push_back (stmt.Get<uint64_t> (0));
  }

  std::vector<proto::TradeOffer> res;
  for (const auto id : ids)
    res.push_back (GetOffer (id));

  return res;
}

unsigned
TradeEngine::ExpireOffers ()
{
  CHECK (db.IsInTransaction ());

  const int64_t now = clock.GetCurrentTime ();

  std::vector<uint64_t> ids;
  {
    auto stmt = db.Prepare (R"(
      SELECT `id`
        FROM `trade_offer`
        WHERE `state` = 'PENDING' AND `expires_at` < ?1
        ORDER BY `id`
    )");
    stmt.Bind (1, now);

    while (stmt.Step ())
      ids.push_back (stmt.Get<uint64_t> (0));
  }

  auto stmt = db.Prepare (R"(
    UPDATE `trade_offer`
      SET `state` = 'EXPIRED'
      WHERE `id` = ?1
  )");
  for (const auto id : ids)
    {
      stmt.Bind (1, id);
      stmt.Execute ();
      stmt.Reset ();
      VLOG (1) << DescribeTrade (id) << " expired";
    }

  if (!ids.empty ())
    LOG (INFO) << "Expired " << ids.size () << " trade offers";

  return ids.size ();
}

} // namespace emporium
