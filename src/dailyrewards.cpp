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

#include "private/dailyrewards.hpp"

#include "errors.hpp"

#include <glog/logging.h>

namespace emporium
{

constexpr int64_t DailyRewards::SECONDS_PER_DAY;

proto::DailyReward
DailyRewards::Claim (const std::string& competitor)
{
  CHECK (db.IsInTransaction ());

  proto::DailyReward res;
  res.set_competitor (competitor);
  res.set_day (clock.GetCurrentTime () / SECONDS_PER_DAY);
  res.set_amount (amount);

  {
    auto stmt = db.Prepare (R"(
      SELECT COUNT(*)
        FROM `daily_reward`
        WHERE `competitor` = ?1 AND `day` = ?2
    )");
    stmt.Bind (1, competitor);
    stmt.Bind (2, res.day ());
    CHECK (stmt.Step ());
    if (stmt.Get<int64_t> (0) > 0)
      throw GameError (ErrorKind::ALREADY_CLAIMED,
                       competitor + " already claimed today's reward");
  }

  *res.mutable_transaction ()
      = ledger.Mint (competitor, amount, "daily reward",
                     proto::CurrencyTransaction::REWARD);

  auto stmt = db.Prepare (R"(
    INSERT INTO `daily_reward`
      (`competitor`, `day`, `amount`, `transaction`)
      VALUES (?1, ?2, ?3, ?4)
  )");
  stmt.Bind (1, competitor);
  stmt.Bind (2, res.day ());
  stmt.Bind (3, amount);
  stmt.Bind (4, res.transaction ().id ());
  stmt.Execute ();

  LOG (INFO)
      << competitor << " claimed the daily reward of " << amount
      << " for day " << res.day ();

  return res;
}

} // namespace emporium
