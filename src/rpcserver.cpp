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

#include "rpcserver.hpp"

#include "database.hpp"
#include "errors.hpp"
#include "json.hpp"

#include <glog/logging.h>

#include <utility>
#include <vector>

namespace emporium
{

namespace
{

/**
 * Builds the error part of a response envelope.
 */
Json::Value
ErrorToJson (const std::string& code, const std::string& message,
             const int status)
{
  Json::Value res(Json::objectValue);
  res["code"] = code;
  res["message"] = message;
  res["status"] = status;

  return res;
}

/**
 * Converts a list of protos to a JSON array.
 */
template <typename Proto>
  Json::Value
  ListToJson (const std::vector<Proto>& list)
{
  Json::Value res(Json::arrayValue);
  for (const auto& entry : list)
    res.append (ProtoToJson (entry));

  return res;
}

/**
 * Checks that an ID or tier number passed in is not negative.
 */
void
CheckNonNegative (const int val, const std::string& what)
{
  if (val < 0)
    throw GameError (ErrorKind::INVALID_ARGUMENT,
                     what + " must not be negative");
}

} // anonymous namespace

template <typename Fcn>
  Json::Value
  RpcServer::Envelope (const std::string& method, const Fcn& fcn)
{
  Json::Value res(Json::objectValue);
  res["success"] = false;
  res["data"] = Json::Value ();
  res["error"] = Json::Value ();

  try
    {
      res["data"] = fcn ();
      res["success"] = true;
    }
  catch (const GameError& exc)
    {
      VLOG (1) << method << " failed: " << exc.what ();
      res["error"] = ErrorToJson (exc.GetCode (), exc.what (),
                                  ErrorStatus (exc.GetKind ()));
    }
  catch (const DatabaseError& exc)
    {
      LOG (WARNING) << method << " failed with database error: " << exc.what ();
      if (exc.IsTransient ())
        res["error"] = ErrorToJson ("DATABASE_BUSY", exc.what (), 503);
      else
        res["error"] = ErrorToJson ("DATABASE_ERROR", exc.what (), 500);
    }
  catch (const std::exception& exc)
    {
      LOG (ERROR) << method << " failed: " << exc.what ();
      res["error"] = ErrorToJson ("INTERNAL_ERROR", exc.what (), 500);
    }

  return res;
}

void
RpcServer::Run ()
{
  std::unique_lock<std::mutex> lock(mutStop);
  shouldStop = false;

  StartListening ();

  while (!shouldStop)
    cvStop.wait (lock);

  StopListening ();
}

void
RpcServer::stop ()
{
  LOG (INFO) << "RPC method called: stop";

  std::lock_guard<std::mutex> lock(mutStop);
  shouldStop = true;
  cvStop.notify_all ();
}

Json::Value
RpcServer::getstatus ()
{
  LOG (INFO) << "RPC method called: getstatus";
  return Envelope ("getstatus", [this] ()
    {
      const auto& config = engine.GetConfig ();

      Json::Value seasons(Json::arrayValue);
      for (const auto& s : config.seasons ())
        seasons.append (s.id ());

      Json::Value items(Json::arrayValue);
      for (const auto& i : config.shop_items ())
        items.append (i.id ());

      Json::Value res(Json::objectValue);
      res["trade_expiry_seconds"]
          = static_cast<Json::Int64> (config.trade_expiry_seconds ());
      res["seasons"] = seasons;
      res["shop_items"] = items;

      return res;
    });
}

Json::Value
RpcServer::openaccount (const std::string& competitor,
                        const std::string& game, const int initialBalance)
{
  LOG (INFO)
      << "RPC method called: openaccount " << competitor << " " << game
      << " " << initialBalance;
  return Envelope ("openaccount", [&] ()
    {
      return ProtoToJson (engine.OpenAccount (competitor, game,
                                              initialBalance));
    });
}

Json::Value
RpcServer::getbalance (const std::string& competitor)
{
  VLOG (1) << "RPC method called: getbalance " << competitor;
  return Envelope ("getbalance", [&] ()
    {
      return ProtoToJson (engine.GetBalance (competitor));
    });
}

Json::Value
RpcServer::getcurrencyhistory (const std::string& competitor,
                               const int limit, const int offset)
{
  VLOG (1)
      << "RPC method called: getcurrencyhistory " << competitor
      << " " << limit << " " << offset;
  return Envelope ("getcurrencyhistory", [&] ()
    {
      return ListToJson (engine.GetCurrencyHistory (competitor, limit,
                                                    offset));
    });
}

Json::Value
RpcServer::transfer (const std::string& from, const std::string& to,
                     const int amount, const std::string& reason)
{
  LOG (INFO)
      << "RPC method called: transfer " << from << " " << to
      << " " << amount;
  return Envelope ("transfer", [&] ()
    {
      return ProtoToJson (engine.Transfer (from, to, amount, reason));
    });
}

Json::Value
RpcServer::getinventory (const std::string& competitor,
                         const bool includeEmpty)
{
  VLOG (1) << "RPC method called: getinventory " << competitor;
  return Envelope ("getinventory", [&] ()
    {
      return ListToJson (engine.GetInventory (competitor, includeEmpty));
    });
}

Json::Value
RpcServer::useitem (const std::string& competitor, const std::string& item,
                    const int quantity)
{
  LOG (INFO)
      << "RPC method called: useitem " << competitor << " " << item
      << " " << quantity;
  return Envelope ("useitem", [&] ()
    {
      return ProtoToJson (engine.UseItem (competitor, item, quantity));
    });
}

Json::Value
RpcServer::purchaseitem (const std::string& competitor,
                         const std::string& item, const int quantity)
{
  LOG (INFO)
      << "RPC method called: purchaseitem " << competitor << " " << item
      << " " << quantity;
  return Envelope ("purchaseitem", [&] ()
    {
      return ProtoToJson (engine.PurchaseShopItem (competitor, item,
                                                   quantity));
    });
}

Json::Value
RpcServer::createtrade (const std::string& from, const std::string& to,
                        const Json::Value& items, const int offeredCurrency,
                        const int requestedCurrency)
{
  LOG (INFO)
      << "RPC method called: createtrade " << from << " " << to << "\n"
      << items;
  return Envelope ("createtrade", [&] ()
    {
      if (!items.isArray ())
        throw GameError (ErrorKind::INVALID_ARGUMENT,
                         "trade items must be an array");

      std::vector<proto::TradeItem> parsed;
      for (const auto& entry : items)
        {
          proto::TradeItem cur;
          if (!ProtoFromJson (entry, cur))
            throw GameError (ErrorKind::INVALID_ARGUMENT,
                             "invalid trade item");
          parsed.push_back (std::move (cur));
        }

      return ProtoToJson (engine.CreateTradeOffer (from, to, parsed,
                                                   offeredCurrency,
                                                   requestedCurrency));
    });
}

Json::Value
RpcServer::respondtotrade (const int id, const std::string& responder,
                           const bool accept)
{
  LOG (INFO)
      << "RPC method called: respondtotrade " << id << " " << responder
      << " " << accept;
  return Envelope ("respondtotrade", [&] ()
    {
      CheckNonNegative (id, "trade ID");
      return ProtoToJson (engine.RespondToTrade (id, responder, accept));
    });
}

Json::Value
RpcServer::canceltrade (const int id, const std::string& requester)
{
  LOG (INFO)
      << "RPC method called: canceltrade " << id << " " << requester;
  return Envelope ("canceltrade", [&] ()
    {
      CheckNonNegative (id, "trade ID");
      return ProtoToJson (engine.CancelTrade (id, requester));
    });
}

Json::Value
RpcServer::gettrade (const int id)
{
  VLOG (1) << "RPC method called: gettrade " << id;
  return Envelope ("gettrade", [&] ()
    {
      CheckNonNegative (id, "trade ID");
      return ProtoToJson (engine.GetTrade (id));
    });
}

Json::Value
RpcServer::listtrades (const std::string& competitor, const bool pendingOnly)
{
  VLOG (1) << "RPC method called: listtrades " << competitor;
  return Envelope ("listtrades", [&] ()
    {
      return ListToJson (engine.ListTrades (competitor, pendingOnly));
    });
}

Json::Value
RpcServer::awardseasonxp (const std::string& competitor,
                          const std::string& season, const int amount,
                          const std::string& source)
{
  LOG (INFO)
      << "RPC method called: awardseasonxp " << competitor << " " << season
      << " " << amount;
  return Envelope ("awardseasonxp", [&] ()
    {
      return ProtoToJson (engine.AwardSeasonXp (competitor, season, amount,
                                                source));
    });
}

Json::Value
RpcServer::claimseasonreward (const std::string& competitor,
                              const std::string& season, const int tier)
{
  LOG (INFO)
      << "RPC method called: claimseasonreward " << competitor << " "
      << season << " " << tier;
  return Envelope ("claimseasonreward", [&] ()
    {
      CheckNonNegative (tier, "tier");
      return ProtoToJson (engine.ClaimSeasonReward (competitor, season,
                                                    tier));
    });
}

Json::Value
RpcServer::purchasebattlepass (const std::string& competitor,
                               const std::string& season, const int price)
{
  LOG (INFO)
      << "RPC method called: purchasebattlepass " << competitor << " "
      << season;
  return Envelope ("purchasebattlepass", [&] ()
    {
      return ProtoToJson (engine.PurchaseBattlePass (competitor, season,
                                                     price));
    });
}

Json::Value
RpcServer::getseasonprogression (const std::string& competitor,
                                 const std::string& season)
{
  VLOG (1)
      << "RPC method called: getseasonprogression " << competitor << " "
      << season;
  return Envelope ("getseasonprogression", [&] ()
    {
      return ProtoToJson (engine.GetSeasonProgression (competitor, season));
    });
}

Json::Value
RpcServer::claimdailyreward (const std::string& competitor)
{
  LOG (INFO) << "RPC method called: claimdailyreward " << competitor;
  return Envelope ("claimdailyreward", [&] ()
    {
      return ProtoToJson (engine.ClaimDailyReward (competitor));
    });
}

} // namespace emporium
