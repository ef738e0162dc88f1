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

#include "catalog.hpp"
#include "schema.hpp"
#include "testutils.hpp"

#include <jsonrpccpp/server/connectors/httpserver.h>

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

namespace emporium
{
namespace
{

class RpcServerTests : public testing::Test
{

private:

  /** Port for the HTTP server.  It is only bound in the Run test.  */
  static constexpr int PORT = 29'838;

  jsonrpc::HttpServer httpServer;

protected:

  Database db;
  TestClock clock;
  LoggingEventSink events;
  Engine engine;

  RpcServer server;

  RpcServerTests ()
    : httpServer(PORT),
      db(":memory:", std::chrono::milliseconds (100)),
      engine(db, ParseTextProto<proto::Config> (R"(
        trade_expiry_seconds: 60
        seasons: { id: "s1" game: "game" }
        shop_items: { id: "potion" game: "game" price: 10 }
      )"), events, clock),
      server(engine, httpServer)
  {
    SetupSchema (db);
    LoadCatalog (db, engine.GetConfig ());
  }

  /**
   * Expects that a response envelope is successful and returns its data.
   */
  static Json::Value
  ExpectSuccess (const Json::Value& response)
  {
    EXPECT_TRUE (response["success"].asBool ()) << response;
    EXPECT_TRUE (response["error"].isNull ());
    return response["data"];
  }

  /**
   * Expects that a response envelope is an error with the given code
   * and HTTP-like status.
   */
  static void
  ExpectFailure (const Json::Value& response, const std::string& code,
                 const int status)
  {
    EXPECT_FALSE (response["success"].asBool ()) << response;
    EXPECT_TRUE (response["data"].isNull ());
    EXPECT_EQ (response["error"]["code"].asString (), code);
    EXPECT_EQ (response["error"]["status"].asInt (), status);
    EXPECT_TRUE (response["error"]["message"].isString ());
  }

};

TEST_F (RpcServerTests, GetStatus)
{
  EXPECT_EQ (ExpectSuccess (server.getstatus ()), ParseJson (R"({
    "trade_expiry_seconds": 60,
    "seasons": ["s1"],
    "shop_items": ["potion"]
  })"));
}

TEST_F (RpcServerTests, Accounts)
{
  EXPECT_EQ (ExpectSuccess (server.openaccount ("alice", "game", 100)),
             ParseJson (R"({
               "competitor": "alice",
               "game": "game",
               "balance": 100
             })"));
  ExpectSuccess (server.openaccount ("bob", "game", 0));
  ExpectFailure (server.openaccount ("bob", "game", 0),
                 "ACCOUNT_EXISTS", 409);

  const auto tx = ExpectSuccess (server.transfer ("alice", "bob", 30, "gift"));
  EXPECT_EQ (tx["from"].asString (), "alice");
  EXPECT_EQ (tx["to"].asString (), "bob");
  EXPECT_EQ (tx["type"].asString (), "transfer");
  EXPECT_EQ (tx["status"].asString (), "completed");

  const auto balance = ExpectSuccess (server.getbalance ("bob"));
  EXPECT_EQ (balance["balance"].asInt64 (), 30);
  EXPECT_EQ (balance["total_earned"].asInt64 (), 30);
  EXPECT_EQ (balance["last_transaction"]["id"], tx["id"]);

  const auto history = ExpectSuccess (server.getcurrencyhistory ("alice",
                                                                 10, 0));
  ASSERT_EQ (history.size (), 2u);
  EXPECT_EQ (history[0], tx);
  EXPECT_EQ (history[1]["reason"].asString (), "initial balance");
  ExpectFailure (server.getcurrencyhistory ("alice", 0, 0),
                 "INVALID_ARGUMENT", 400);
  ExpectFailure (server.getcurrencyhistory ("carol", 10, 0),
                 "ACCOUNT_NOT_FOUND", 404);

  ExpectFailure (server.transfer ("alice", "bob", 1'000, "too much"),
                 "INSUFFICIENT_FUNDS", 400);
  ExpectFailure (server.getbalance ("carol"), "ACCOUNT_NOT_FOUND", 404);
}

TEST_F (RpcServerTests, ShopAndInventory)
{
  ExpectSuccess (server.openaccount ("alice", "game", 100));

  const auto purchase = ExpectSuccess (server.purchaseitem ("alice", "potion",
                                                            2));
  EXPECT_EQ (purchase["transaction"]["to"], Json::Value ());
  EXPECT_EQ (purchase["inventory"]["quantity"].asInt64 (), 2);

  const auto used = ExpectSuccess (server.useitem ("alice", "potion", 2));
  EXPECT_EQ (used["inventory"]["quantity"].asInt64 (), 0);

  EXPECT_EQ (ExpectSuccess (server.getinventory ("alice", false)).size (), 0u);
  EXPECT_EQ (ExpectSuccess (server.getinventory ("alice", true)).size (), 1u);

  ExpectFailure (server.useitem ("alice", "potion", 1),
                 "INSUFFICIENT_QUANTITY", 400);
  ExpectFailure (server.purchaseitem ("alice", "sword", 1),
                 "ITEM_NOT_FOUND", 404);
}

TEST_F (RpcServerTests, Trades)
{
  ExpectSuccess (server.openaccount ("alice", "game", 100));
  ExpectSuccess (server.openaccount ("bob", "game", 100));
  ExpectSuccess (server.purchaseitem ("bob", "potion", 1));

  const auto offer = ExpectSuccess (server.createtrade ("alice", "bob",
      ParseJson (R"([
        {"item": "potion", "quantity": 1, "from_competitor": false}
      ])"), 15, 0));
  EXPECT_EQ (offer["state"].asString (), "pending");
  EXPECT_EQ (offer["expires_at"].asInt64 (), TestClock::START + 60);
  EXPECT_FALSE (offer.isMember ("completed_at"));

  const int id = offer["id"].asInt ();
  EXPECT_EQ (ExpectSuccess (server.gettrade (id)), offer);
  EXPECT_EQ (ExpectSuccess (server.listtrades ("bob", true)).size (), 1u);

  ExpectFailure (server.respondtotrade (id, "alice", true),
                 "INVALID_TRADE", 400);
  const auto done = ExpectSuccess (server.respondtotrade (id, "bob", true));
  EXPECT_EQ (done["state"].asString (), "completed");
  EXPECT_EQ (done["completed_at"].asInt64 (), TestClock::START);

  ExpectFailure (server.canceltrade (id, "alice"), "INVALID_TRADE", 400);
  ExpectFailure (server.gettrade (-1), "INVALID_ARGUMENT", 400);
  ExpectFailure (server.gettrade (42), "INVALID_TRADE", 400);
}

TEST_F (RpcServerTests, InvalidTradeItems)
{
  ExpectSuccess (server.openaccount ("alice", "game", 100));
  ExpectSuccess (server.openaccount ("bob", "game", 100));

  ExpectFailure (server.createtrade ("alice", "bob", ParseJson ("{}"), 1, 0),
                 "INVALID_ARGUMENT", 400);
  ExpectFailure (server.createtrade ("alice", "bob",
                                     ParseJson (R"([{"item": "potion"}])"),
                                     1, 0),
                 "INVALID_ARGUMENT", 400);
  ExpectFailure (server.createtrade ("alice", "bob",
                                     ParseJson (R"([
                                       {"item": 5, "quantity": 1}
                                     ])"), 1, 0),
                 "INVALID_ARGUMENT", 400);
}

TEST_F (RpcServerTests, Seasons)
{
  ExpectSuccess (server.openaccount ("alice", "game", 2'000));

  const auto award = ExpectSuccess (server.awardseasonxp ("alice", "s1",
                                                          1'000, "match"));
  EXPECT_TRUE (award["tiered_up"].asBool ());
  EXPECT_EQ (award["progression"]["tier"].asInt (), 1);
  EXPECT_EQ (award["rewards"].size (), 1u);

  const auto claimed = ExpectSuccess (server.claimseasonreward ("alice", "s1",
                                                                1));
  EXPECT_EQ (claimed["tier"]["reward_amount"].asInt64 (), 5);
  ExpectFailure (server.claimseasonreward ("alice", "s1", 1),
                 "ALREADY_CLAIMED", 409);
  ExpectFailure (server.claimseasonreward ("alice", "s1", -1),
                 "INVALID_ARGUMENT", 400);

  const auto pass = ExpectSuccess (server.purchasebattlepass ("alice", "s1",
                                                              0));
  EXPECT_EQ (pass["price_paid"].asInt64 (), 1'000);
  EXPECT_TRUE (pass["progression"]["battle_pass"].asBool ());

  const auto progress = ExpectSuccess (server.getseasonprogression ("alice",
                                                                    "s1"));
  EXPECT_EQ (progress["next_tier_xp"].asInt64 (), 1'050);
  EXPECT_EQ (progress["rewards"].size (), 6u);
  EXPECT_TRUE (progress["rewards"][0]["claimed"].asBool ());

  ExpectFailure (server.getseasonprogression ("alice", "s2"),
                 "SEASON_NOT_FOUND", 404);
}

TEST_F (RpcServerTests, DailyReward)
{
  ExpectSuccess (server.openaccount ("alice", "game", 0));

  const auto reward = ExpectSuccess (server.claimdailyreward ("alice"));
  EXPECT_EQ (reward["amount"].asInt64 (), 100);
  ExpectFailure (server.claimdailyreward ("alice"), "ALREADY_CLAIMED", 409);
}

TEST_F (RpcServerTests, DatabaseError)
{
  ExpectSuccess (server.openaccount ("alice", "game", 0));
  db.Execute ("DROP TABLE `daily_reward`");

  ExpectFailure (server.claimdailyreward ("alice"), "DATABASE_ERROR", 500);
  EXPECT_EQ (ExpectSuccess (server.getbalance ("alice"))["balance"].asInt64 (),
             0);
}

TEST_F (RpcServerTests, RunAndStop)
{
  std::thread runner([this] ()
    {
      server.Run ();
    });

  std::this_thread::sleep_for (std::chrono::milliseconds (100));
  server.stop ();
  runner.join ();
}

} // anonymous namespace
} // namespace emporium
