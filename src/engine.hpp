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

#ifndef EMPORIUM_ENGINE_HPP
#define EMPORIUM_ENGINE_HPP

#include "clock.hpp"
#include "database.hpp"
#include "eventsink.hpp"
#include "proto/config.pb.h"
#include "proto/economy.pb.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace emporium
{

/**
 * The main entry point into the economy and progression engine.  Each
 * operation runs inside exactly one database transaction, which is either
 * committed as a whole or (if the operation throws) rolled back.  Only
 * after the commit, the event sink is informed.
 *
 * Operations fail with GameError for domain errors and DatabaseError
 * if the database is unavailable (e.g. locked by another connection
 * for longer than the busy timeout).
 *
 * Calls are thread-safe; they are serialised on the underlying
 * database connection.
 */
class Engine
{

private:

  class Impl;

  /**
   * The actual implementation, whose definition is hidden in the .cpp
   * file to decouple the public interface from internal stuff.
   */
  std::unique_ptr<Impl> impl;

public:

  explicit Engine (Database& db, const proto::Config& config,
                   EventSink& events, const Clock& clock);

  ~Engine ();

  Engine () = delete;
  Engine (const Engine&) = delete;
  void operator= (const Engine&) = delete;

  /**
   * Returns the config this engine is running with.
   */
  const proto::Config& GetConfig () const;

  /**
   * Opens a currency account for a competitor in a game, optionally
   * minting some starting balance.
   */
  proto::CurrencyBalance OpenAccount (const std::string& competitor,
                                      const std::string& game,
                                      int64_t initialBalance);

  /**
   * Returns the balance of a competitor with their transaction stats.
   */
  proto::BalanceDetails GetBalance (const std::string& competitor);

  /**
   * Returns a page of a competitor's currency transactions, newest first.
   */
  std::vector<proto::CurrencyTransaction> GetCurrencyHistory (
      const std::string& competitor, int64_t limit, int64_t offset);

  /**
   * Transfers currency from one competitor to another.
   */
  proto::CurrencyTransaction Transfer (const std::string& from,
                                       const std::string& to,
                                       int64_t amount,
                                       const std::string& reason);

  std::vector<proto::InventoryEntry> GetInventory (
      const std::string& competitor, bool includeEmpty);

  proto::ItemUse UseItem (const std::string& competitor,
                          const std::string& item, int64_t quantity);

  proto::ShopPurchase PurchaseShopItem (const std::string& competitor,
                                        const std::string& item,
                                        int64_t quantity);

  proto::TradeOffer CreateTradeOffer (
      const std::string& from, const std::string& to,
      const std::vector<proto::TradeItem>& items,
      int64_t offeredCurrency, int64_t requestedCurrency);

  proto::TradeOffer RespondToTrade (uint64_t id, const std::string& responder,
                                    bool accept);

  proto::TradeOffer CancelTrade (uint64_t id, const std::string& requester);

  proto::TradeOffer GetTrade (uint64_t id);

  std::vector<proto::TradeOffer> ListTrades (const std::string& competitor,
                                             bool pendingOnly);

  /**
   * Marks all pending trade offers that are past their expiry as expired.
   * Returns the number of offers changed.
   */
  unsigned ExpireTrades ();

  proto::XpAward AwardSeasonXp (const std::string& competitor,
                                const std::string& season, int64_t amount,
                                const std::string& source);

  proto::ClaimedReward ClaimSeasonReward (const std::string& competitor,
                                          const std::string& season,
                                          uint32_t tier);

  /**
   * Buys the battle pass for a season.  A non-positive price means that
   * the configured price is used.
   */
  proto::BattlePass PurchaseBattlePass (const std::string& competitor,
                                        const std::string& season,
                                        int64_t price);

  proto::ProgressionDetails GetSeasonProgression (
      const std::string& competitor, const std::string& season);

  proto::DailyReward ClaimDailyReward (const std::string& competitor);

};

} // namespace emporium

#endif // EMPORIUM_ENGINE_HPP
