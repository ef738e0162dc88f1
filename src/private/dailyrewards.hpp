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

#ifndef EMPORIUM_DAILYREWARDS_HPP
#define EMPORIUM_DAILYREWARDS_HPP

#include "clock.hpp"
#include "database.hpp"
#include "private/ledger.hpp"
#include "proto/economy.pb.h"

#include <string>

namespace emporium
{

/**
 * The daily currency reward each competitor may claim once per UTC day.
 */
class DailyRewards
{

private:

  Database& db;
  LedgerStore& ledger;
  const Clock& clock;

  /** Currency minted per claim.  */
  const Amount amount;

public:

  /** Length of a day in seconds.  */
  static constexpr int64_t SECONDS_PER_DAY = 86'400;

  explicit DailyRewards (Database& d, LedgerStore& l, const Clock& c,
                         const Amount a)
    : db(d), ledger(l), clock(c), amount(a)
  {}

  DailyRewards () = delete;
  DailyRewards (const DailyRewards&) = delete;
  void operator= (const DailyRewards&) = delete;

  /**
   * Claims today's reward.  Throws ALREADY_CLAIMED if the competitor
   * did so already.
   */
  proto::DailyReward Claim (const std::string& competitor);

};

} // namespace emporium

#endif // EMPORIUM_DAILYREWARDS_HPP
