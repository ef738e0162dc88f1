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

#include "engine.hpp"

#include "errors.hpp"
#include "json.hpp"
#include "private/dailyrewards.hpp"
#include "private/inventory.hpp"
#include "private/ledger.hpp"
#include "private/seasons.hpp"
#include "private/shop.hpp"
#include "private/trades.hpp"

#include <glog/logging.h>

#include <mutex>

namespace emporium
{

/* ************************************************************************** */

/**
 * Actual implementation of the engine.  It holds all the components, which
 * share the database connection.
 */
class Engine::Impl
{

private:

  Database& db;
  const proto::Config config;
  EventSink& events;

  /** Lock for the database connection.  */
  std::mutex mut;

  LedgerStore ledger;
  InventoryStore inventory;
  TradeEngine trades;
  SeasonEngine seasons;
  ShopEngine shop;
  DailyRewards daily;

  /**
   * Runs an operation inside a transaction (holding the lock), and
   * commits it if it returns normally.
   */
  template <typename Fcn>
    auto Run (const std::string& name, const Fcn& op) -> decltype (op ());

  /**
   * Informs the event sink about something.  Failures are logged but
   * do not affect the (already committed) operation.
   */
  template <typename Fcn>
    void Announce (const Fcn& fcn);

  friend class Engine;

public:

  explicit Impl (Database& d, const proto::Config& cfg, EventSink& e,
                 const Clock& clock);

  Impl () = delete;
  Impl (const Impl&) = delete;
  void operator= (const Impl&) = delete;

};

Engine::Impl::Impl (Database& d, const proto::Config& cfg, EventSink& e,
                    const Clock& clock)
  : db(d), config(cfg), events(e),
    ledger(db, clock), inventory(db, clock),
    trades(db, ledger, inventory, clock, config.trade_expiry_seconds ()),
    seasons(db, ledger, inventory, clock,
            config.default_battle_pass_price ()),
    shop(db, ledger, inventory, clock),
    daily(db, ledger, clock, config.daily_reward_amount ())
{}

template <typename Fcn>
  auto
  Engine::Impl::Run (const std::string& name, const Fcn& op)
      -> decltype (op ())
{
  std::lock_guard<std::mutex> lock(mut);
  VLOG (1) << "Running operation " << name;

  Transaction tx(db);
  auto res = op ();
  tx.Commit ();

  return res;
}

template <typename Fcn>
  void
  Engine::Impl::Announce (const Fcn& fcn)
{
  try
    {
      fcn (events);
    }
  catch (const std::exception& exc)
    {
      LOG (WARNING) << "Event sink failed: " << exc.what ();
    }
}

namespace
{

std::string
BalanceResource (const std::string& competitor)
{
  return "balance:" + competitor;
}

std::string
InventoryResource (const std::string& competitor)
{
  return "inventory:" + competitor;
}

std::string
SeasonResource (const std::string& competitor, const std::string& season)
{
  return "season:" + season + ":" + competitor;
}

/**
 * Returns the name used for notifications about a trade in the
 * given state.
 */
std::string
TradeEvent (const proto::TradeOffer::State state)
{
  switch (state)
    {
    case proto::TradeOffer::PENDING:
      return "trade_offer_received";
    case proto::TradeOffer::COMPLETED:
      return "trade_offer_accepted";
    case proto::TradeOffer::REJECTED:
      return "trade_offer_rejected";
    case proto::TradeOffer::CANCELLED:
      return "trade_offer_cancelled";
    case proto::TradeOffer::EXPIRED:
      return "trade_offer_expired";
    default:
      LOG (FATAL) << "Unexpected trade state: " << state;
    }
}

} // anonymous namespace

/* ************************************************************************** */

Engine::Engine (Database& db, const proto::Config& config,
                EventSink& events, const Clock& clock)
  : impl(std::make_unique<Impl> (db, config, events, clock))
{}

Engine::~Engine () = default;

const proto::Config&
Engine::GetConfig () const
{
  return impl->config;
}

proto::CurrencyBalance
Engine::OpenAccount (const std::string& competitor, const std::string& game,
                     const int64_t initialBalance)
{
  if (initialBalance < 0)
    throw GameError (ErrorKind::INVALID_ARGUMENT,
                     "initial balance must not be negative");

  const auto res = impl->Run ("openaccount", [&] ()
    {
      auto account = impl->ledger.OpenAccount (competitor, game);
      if (initialBalance > 0)
        {
          impl->ledger.Mint (competitor, initialBalance, "initial balance",
                             proto::CurrencyTransaction::REWARD);
          account.set_balance (initialBalance);
        }
      return account;
    });

  impl->Announce ([&] (EventSink& s)
    {
      s.RecordAudit (competitor, "open_account", ProtoToJson (res));
      s.InvalidateCache (BalanceResource (competitor));
    });

  return res;
}

proto::BalanceDetails
Engine::GetBalance (const std::string& competitor)
{
  return impl->Run ("getbalance", [&] ()
    {
      return impl->ledger.GetDetails (competitor);
    });
}

std::vector<proto::CurrencyTransaction>
Engine::GetCurrencyHistory (const std::string& competitor, const int64_t limit,
                            const int64_t offset)
{
  return impl->Run ("getcurrencyhistory", [&] ()
    {
      return impl->ledger.GetHistory (competitor, limit, offset);
    });
}

proto::CurrencyTransaction
Engine::Transfer (const std::string& from, const std::string& to,
                  const int64_t amount, const std::string& reason)
{
  const auto res = impl->Run ("transfer", [&] ()
    {
      return impl->ledger.Transfer (from, to, amount, reason);
    });

  impl->Announce ([&] (EventSink& s)
    {
      const auto data = ProtoToJson (res);
      s.RecordAudit (from, "transfer", data);
      s.InvalidateCache (BalanceResource (from));
      s.InvalidateCache (BalanceResource (to));
      s.Notify (to, "currency_received", data);
    });

  return res;
}

std::vector<proto::InventoryEntry>
Engine::GetInventory (const std::string& competitor, const bool includeEmpty)
{
  return impl->Run ("getinventory", [&] ()
    {
      return impl->inventory.GetInventory (competitor, includeEmpty);
    });
}

proto::ItemUse
Engine::UseItem (const std::string& competitor, const std::string& item,
                 const int64_t quantity)
{
  const auto res = impl->Run ("useitem", [&] ()
    {
      return impl->inventory.Use (competitor, item, quantity);
    });

  impl->Announce ([&] (EventSink& s)
    {
      s.RecordAudit (competitor, "use_item", ProtoToJson (res.usage ()));
      s.InvalidateCache (InventoryResource (competitor));
    });

  return res;
}

proto::ShopPurchase
Engine::PurchaseShopItem (const std::string& competitor,
                          const std::string& item, const int64_t quantity)
{
  const auto res = impl->Run ("purchaseitem", [&] ()
    {
      return impl->shop.Purchase (competitor, item, quantity);
    });

  impl->Announce ([&] (EventSink& s)
    {
      const auto data = ProtoToJson (res);
      s.RecordAudit (competitor, "purchase_item", data);
      s.InvalidateCache (BalanceResource (competitor));
      s.InvalidateCache (InventoryResource (competitor));
      s.Notify (competitor, "purchase_completed", data);
    });

  return res;
}

proto::TradeOffer
Engine::CreateTradeOffer (const std::string& from, const std::string& to,
                          const std::vector<proto::TradeItem>& items,
                          const int64_t offeredCurrency,
                          const int64_t requestedCurrency)
{
  const auto res = impl->Run ("createtrade", [&] ()
    {
      return impl->trades.CreateOffer (from, to, items,
                                       offeredCurrency, requestedCurrency);
    });

  impl->Announce ([&] (EventSink& s)
    {
      const auto data = ProtoToJson (res);
      s.RecordAudit (from, "create_trade", data);
      s.Notify (to, TradeEvent (res.state ()), data);
    });

  return res;
}

proto::TradeOffer
Engine::RespondToTrade (const uint64_t id, const std::string& responder,
                        const bool accept)
{
  const auto res = impl->Run ("respondtotrade", [&] ()
    {
      return impl->trades.Respond (id, responder, accept);
    });

  impl->Announce ([&] (EventSink& s)
    {
      const auto data = ProtoToJson (res);
      s.RecordAudit (responder, accept ? "accept_trade" : "reject_trade",
                     data);
      if (res.state () == proto::TradeOffer::COMPLETED)
        for (const auto* c : {&res.from_competitor (), &res.to_competitor ()})
          {
            s.InvalidateCache (BalanceResource (*c));
            s.InvalidateCache (InventoryResource (*c));
          }
      s.Notify (res.from_competitor (), TradeEvent (res.state ()), data);
    });

  return res;
}

proto::TradeOffer
Engine::CancelTrade (const uint64_t id, const std::string& requester)
{
  const auto res = impl->Run ("canceltrade", [&] ()
    {
      return impl->trades.Cancel (id, requester);
    });

  impl->Announce ([&] (EventSink& s)
    {
      const auto data = ProtoToJson (res);
      s.RecordAudit (requester, "cancel_trade", data);
      s.Notify (res.to_competitor (), TradeEvent (res.state ()), data);
    });

  return res;
}

proto::TradeOffer
Engine::GetTrade (const uint64_t id)
{
  return impl->Run ("gettrade", [&] ()
    {
      return impl->trades.GetOffer (id);
    });
}

std::vector<proto::TradeOffer>
Engine::ListTrades (const std::string& competitor, const bool pendingOnly)
{
  return impl->Run ("listtrades", [&] ()
    {
      return impl->trades.ListOffers (competitor, pendingOnly);
    });
}

unsigned
Engine::ExpireTrades ()
{
  return impl->Run ("expiretrades", [&] ()
    {
      return impl->trades.ExpireOffers ();
    });
}

proto::XpAward
Engine::AwardSeasonXp (const std::string& competitor,
                       const std::string& season, const int64_t amount,
                       const std::string& source)
{
  const auto res = impl->Run ("awardseasonxp", [&] ()
    {
      return impl->seasons.AwardXp (competitor, season, amount, source);
    });

  impl->Announce ([&] (EventSink& s)
    {
      s.InvalidateCache (SeasonResource (competitor, season));
      if (res.tiered_up ())
        s.Notify (competitor, "tier_up", ProtoToJson (res));
    });

  return res;
}

proto::ClaimedReward
Engine::ClaimSeasonReward (const std::string& competitor,
                           const std::string& season, const uint32_t tier)
{
  const auto res = impl->Run ("claimseasonreward", [&] ()
    {
      return impl->seasons.ClaimReward (competitor, season, tier);
    });

  impl->Announce ([&] (EventSink& s)
    {
      const auto data = ProtoToJson (res);
      s.RecordAudit (competitor, "claim_season_reward", data);
      s.InvalidateCache (SeasonResource (competitor, season));
      if (res.tier ().reward_type () == proto::SeasonTier::ITEM)
        s.InvalidateCache (InventoryResource (competitor));
      else
        s.InvalidateCache (BalanceResource (competitor));
      s.Notify (competitor, "reward_claimed", data);
    });

  return res;
}

proto::BattlePass
Engine::PurchaseBattlePass (const std::string& competitor,
                            const std::string& season, const int64_t price)
{
  const auto res = impl->Run ("purchasebattlepass", [&] ()
    {
      return impl->seasons.PurchaseBattlePass (competitor, season, price);
    });

  impl->Announce ([&] (EventSink& s)
    {
      const auto data = ProtoToJson (res);
      s.RecordAudit (competitor, "purchase_battle_pass", data);
      s.InvalidateCache (BalanceResource (competitor));
      s.InvalidateCache (SeasonResource (competitor, season));
      s.Notify (competitor, "battle_pass_purchased", data);
    });

  return res;
}

proto::ProgressionDetails
Engine::GetSeasonProgression (const std::string& competitor,
                              const std::string& season)
{
  return impl->Run ("getseasonprogression", [&] ()
    {
      return impl->seasons.GetProgression (competitor, season);
    });
}

proto::DailyReward
Engine::ClaimDailyReward (const std::string& competitor)
{
  const auto res = impl->Run ("claimdailyreward", [&] ()
    {
      return impl->daily.Claim (competitor);
    });

  impl->Announce ([&] (EventSink& s)
    {
      s.RecordAudit (competitor, "claim_daily_reward", ProtoToJson (res));
      s.InvalidateCache (BalanceResource (competitor));
    });

  return res;
}

} // namespace emporium
