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

#ifndef EMPORIUM_SEASONS_HPP
#define EMPORIUM_SEASONS_HPP

#include "clock.hpp"
#include "database.hpp"
#include "private/inventory.hpp"
#include "private/ledger.hpp"
#include "proto/config.pb.h"
#include "proto/economy.pb.h"

#include <cstdint>
#include <string>
#include <vector>

namespace emporium
{

/**
 * Seasonal progression of competitors:  XP awards with tier rollover,
 * battle passes and the claiming of tier rewards.  The seasons and their
 * tiers themselves are read from the catalog tables.
 *
 * All methods must be called while a Transaction is active on the
 * database connection.
 */
class SeasonEngine
{

private:

  Database& db;
  LedgerStore& ledger;
  InventoryStore& inventory;
  const Clock& clock;

  /** Battle-pass price for seasons without their own.  */
  const Amount defaultPassPrice;

  /**
   * Looks up a season (without its tiers).  Returns false if it
   * does not exist.
   */
  bool LookupSeason (const std::string& id, proto::Season& out);

  /**
   * Looks up a catalog tier.  Returns false if there is no such tier.
   */
  bool LookupTier (const std::string& season, uint32_t tier,
                   proto::SeasonTier& out);

  /**
   * Reads the progression of a competitor in a season, returning false
   * if there is none yet.
   */
  bool LookupProgression (const std::string& competitor,
                          const std::string& season,
                          proto::SeasonProgression& out);

  /**
   * Returns the progression of a competitor, creating it at tier zero
   * if it does not exist yet.
   */
  proto::SeasonProgression EnsureProgression (const std::string& competitor,
                                              const std::string& season);

  /**
   * Writes back tier, XP and battle-pass flag of a progression.
   */
  void UpdateProgression (const proto::SeasonProgression& progression);

  /**
   * Returns true if the reward for the given tier has been claimed
   * already as part of the given progression.
   */
  bool IsClaimed (uint64_t progression, uint32_t tier);

  /**
   * Returns true if the competitor bought a battle pass for the season.
   */
  bool HasBattlePass (const std::string& competitor,
                      const std::string& season);

public:

  explicit SeasonEngine (Database& d, LedgerStore& l, InventoryStore& i,
                         const Clock& c, const Amount passPrice)
    : db(d), ledger(l), inventory(i), clock(c), defaultPassPrice(passPrice)
  {}

  SeasonEngine () = delete;
  SeasonEngine (const SeasonEngine&) = delete;
  void operator= (const SeasonEngine&) = delete;

  /**
   * Awards XP to a competitor.  XP exceeding the requirement of the next
   * tier rolls over into the tier after it, so that a single award may
   * advance several tiers.  Once the last tier is reached, further XP
   * is discarded.
   */
  proto::XpAward AwardXp (const std::string& competitor,
                          const std::string& season, Amount amount,
                          const std::string& source);

  /**
   * Claims the reward of a tier.  Each reward can be claimed at most
   * once per competitor and season.
   */
  proto::ClaimedReward ClaimReward (const std::string& competitor,
                                    const std::string& season,
                                    uint32_t tier);

  /**
   * Buys the battle pass for a season.  If price is not positive, the
   * configured price of the season (or the global default) is charged.
   */
  proto::BattlePass PurchaseBattlePass (const std::string& competitor,
                                        const std::string& season,
                                        Amount price);

  /**
   * Returns the progression of a competitor together with the reward
   * status of the tiers up to a few beyond the current one.  This does
   * not create a progression if there is none.
   */
  proto::ProgressionDetails GetProgression (const std::string& competitor,
                                            const std::string& season);

  /**
   * Returns all tiers of a season in order.
   */
  std::vector<proto::SeasonTier> GetTiers (const std::string& season);

};

} // namespace emporium

#endif // EMPORIUM_SEASONS_HPP
