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

#include "expiryjob.hpp"

#include "schema.hpp"
#include "testutils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

namespace emporium
{
namespace
{

using std::chrono::milliseconds;

class ExpiryJobTests : public testing::Test
{

protected:

  Database db;
  TestClock clock;
  LoggingEventSink events;
  Engine engine;

  ExpiryJobTests ()
    : db(":memory:", milliseconds (100)),
      engine(db, ParseTextProto<proto::Config> ("trade_expiry_seconds: 10"),
             events, clock)
  {
    SetupSchema (db);
    engine.OpenAccount ("alice", "game", 100);
    engine.OpenAccount ("bob", "game", 0);
  }

  /**
   * Waits until the job has done at least the given number of sweeps.
   */
  static void
  WaitForSweeps (ExpiryJob& job, const unsigned num)
  {
    while (job.GetNumSweeps () < num)
      std::this_thread::sleep_for (milliseconds (1));
  }

  /**
   * Returns the state of a trade as stored in the database.
   */
  std::string
  GetStoredState (const uint64_t id)
  {
    auto stmt = db.Prepare (R"(
      SELECT `state`
        FROM `trade_offer`
        WHERE `id` = ?1
    )");
    stmt.Bind (1, static_cast<int64_t> (id));
    CHECK (stmt.Step ());
    return stmt.Get<std::string> (0);
  }

};

TEST_F (ExpiryJobTests, ExpiresOldOffers)
{
  const std::vector<proto::TradeItem> none;
  const auto old = engine.CreateTradeOffer ("alice", "bob", none, 10, 0);
  clock.Advance (20);
  const auto fresh = engine.CreateTradeOffer ("alice", "bob", none, 20, 0);

  {
    ExpiryJob job(engine, milliseconds (10));
    WaitForSweeps (job, 1);
  }

  EXPECT_EQ (GetStoredState (old.id ()), "EXPIRED");
  EXPECT_EQ (GetStoredState (fresh.id ()), "PENDING");
}

TEST_F (ExpiryJobTests, RepeatedSweeps)
{
  ExpiryJob job(engine, milliseconds (1));
  WaitForSweeps (job, 5);
}

TEST_F (ExpiryJobTests, StopsWithoutWaitingForInterval)
{
  const auto start = std::chrono::steady_clock::now ();
  {
    ExpiryJob job(engine, std::chrono::hours (1));
    WaitForSweeps (job, 1);
  }
  EXPECT_LT (std::chrono::steady_clock::now () - start,
             std::chrono::seconds (10));
}

} // anonymous namespace
} // namespace emporium
