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

#ifndef EMPORIUM_TESTUTILS_HPP
#define EMPORIUM_TESTUTILS_HPP

#include "clock.hpp"
#include "database.hpp"
#include "errors.hpp"
#include "eventsink.hpp"
#include "private/inventory.hpp"
#include "private/ledger.hpp"
#include "proto/config.pb.h"
#include "proto/economy.pb.h"

#include <json/json.h>

#include <glog/logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <google/protobuf/text_format.h>
#include <google/protobuf/util/message_differencer.h>

#include <string>

namespace emporium
{

/**
 * Clock that returns a fake time, which can be set by tests.
 */
class TestClock : public Clock
{

private:

  int64_t now;

public:

  /** The time all tests start at.  */
  static constexpr int64_t START = 1'600'000'000;

  TestClock ()
    : now(START)
  {}

  void
  SetTime (const int64_t t)
  {
    now = t;
  }

  void
  Advance (const int64_t seconds)
  {
    now += seconds;
  }

  int64_t
  GetCurrentTime () const override
  {
    return now;
  }

};

/**
 * Parses a string to JSON.
 */
Json::Value ParseJson (const std::string& str);

/**
 * Parses a protocol buffer from text format.
 */
template <typename Proto>
  Proto
  ParseTextProto (const std::string& str)
{
  Proto res;
  CHECK (google::protobuf::TextFormat::ParseFromString (str, &res));
  return res;
}

#define DEFINE_PROTO_MATCHER(name, type) \
  MATCHER_P (name, str, "") \
  { \
    const auto expected = ParseTextProto<proto::type> (str);\
    if (google::protobuf::util::MessageDifferencer::Equals (arg, expected)) \
      return true; \
    *result_listener << "actual: " << arg.DebugString (); \
    return false; \
  }

DEFINE_PROTO_MATCHER (EqualsBalance, CurrencyBalance)
DEFINE_PROTO_MATCHER (EqualsTransaction, CurrencyTransaction)
DEFINE_PROTO_MATCHER (EqualsInventoryEntry, InventoryEntry)
DEFINE_PROTO_MATCHER (EqualsTradeOffer, TradeOffer)
DEFINE_PROTO_MATCHER (EqualsProgression, SeasonProgression)
DEFINE_PROTO_MATCHER (EqualsTier, SeasonTier)

/**
 * Event sink mock, which by default expects no calls at all.
 */
class MockEventSink : public EventSink
{

public:

  MockEventSink ();

  MOCK_METHOD3 (RecordAudit, void (const std::string& actor,
                                   const std::string& action,
                                   const Json::Value& details));
  MOCK_METHOD1 (InvalidateCache, void (const std::string& resource));
  MOCK_METHOD3 (Notify, void (const std::string& recipient,
                              const std::string& event,
                              const Json::Value& payload));

};

/**
 * Test fixture with an in-memory database that has the schema set up,
 * a fake clock and the basic ledger and inventory stores.
 */
class DBTest : public testing::Test
{

protected:

  /** The game used for test accounts.  */
  static constexpr const char* GAME = "game";

  Database db;
  TestClock clock;

  LedgerStore ledger;
  InventoryStore inventory;

  DBTest ();

  /**
   * Runs some function inside a transaction and commits it.
   */
  template <typename Fcn>
    auto
    Run (const Fcn& fcn) -> decltype (fcn ())
  {
    Transaction tx(db);
    auto res = fcn ();
    tx.Commit ();
    return res;
  }

  /**
   * Runs some function inside a transaction and expects that it
   * fails with the given error.  The transaction is rolled back.
   */
  template <typename Fcn>
    void
    ExpectError (const ErrorKind kind, const Fcn& fcn)
  {
    Transaction tx(db);
    try
      {
        fcn ();
        ADD_FAILURE () << "expected error " << ErrorCode (kind);
      }
    catch (const GameError& exc)
      {
        EXPECT_EQ (exc.GetCode (), ErrorCode (kind)) << exc.what ();
      }
  }

  /**
   * Opens an account in GAME for a competitor with the given balance.
   */
  void SetupAccount (const std::string& competitor, Amount balance);

  /**
   * Gives items to a competitor.
   */
  void SetupItem (const std::string& competitor, const std::string& item,
                  Amount quantity);

  /**
   * Returns the current balance of a competitor, which must have
   * an account.
   */
  Amount GetBalance (const std::string& competitor);

  /**
   * Returns the quantity of an item held by a competitor.
   */
  Amount GetQuantity (const std::string& competitor, const std::string& item);

  /**
   * Returns the total currency across all accounts.
   */
  Amount GetTotalBalance ();

  /**
   * Returns the number of rows in a table.
   */
  int64_t CountRows (const std::string& table);

};

} // namespace emporium

#endif // EMPORIUM_TESTUTILS_HPP
