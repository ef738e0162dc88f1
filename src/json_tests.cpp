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

#include "json.hpp"

#include "proto/economy.pb.h"
#include "testutils.hpp"

#include <gtest/gtest.h>

#include <google/protobuf/util/message_differencer.h>

namespace emporium
{
namespace
{

using google::protobuf::util::MessageDifferencer;

class JsonTests : public testing::Test
{

protected:

  /**
   * Expects that the given text proto converted to JSON equals
   * the given JSON string.
   */
  template <typename Proto>
    static void
    ExpectProtoToJson (const std::string& pb, const std::string& expectedJson)
  {
    const auto obj = ParseTextProto<Proto> (pb);
    ASSERT_EQ (ProtoToJson (obj), ParseJson (expectedJson));
  }

  /**
   * Expects that a given JSON value (parsed from string) can be parsed
   * as proto of the template type, and equals to the expected value (given
   * as text proto).
   */
  template <typename Proto>
    static void
    ExpectProtoFromJson (const std::string& str, const std::string& expectedPb)
  {
    Proto actual;
    ASSERT_TRUE (ProtoFromJson (ParseJson (str), actual));

    const auto expected = ParseTextProto<Proto> (expectedPb);
    EXPECT_TRUE (MessageDifferencer::Equals (actual, expected))
        << "Actual: " << actual.DebugString ()
        << "\nExpected: " << expected.DebugString ();
  }

};

TEST_F (JsonTests, CurrencyTransaction)
{
  ExpectProtoToJson<proto::CurrencyTransaction> (R"(
    id: 5
    from_competitor: "alice"
    to_competitor: "bob"
    amount: 30
    reason: "gift"
    status: COMPLETED
    type: TRANSFER
    occurred_at: 1000
  )", R"({
    "id": 5,
    "from": "alice",
    "to": "bob",
    "amount": 30,
    "reason": "gift",
    "status": "completed",
    "type": "transfer",
    "occurred_at": 1000
  })");

  ExpectProtoToJson<proto::CurrencyTransaction> (R"(
    id: 6
    to_competitor: "bob"
    amount: 10
    reason: "daily reward"
    status: COMPLETED
    type: REWARD
    occurred_at: 1000
  )", R"({
    "id": 6,
    "from": null,
    "to": "bob",
    "amount": 10,
    "reason": "daily reward",
    "status": "completed",
    "type": "reward",
    "occurred_at": 1000
  })");
}

TEST_F (JsonTests, BalanceDetails)
{
  ExpectProtoToJson<proto::BalanceDetails> (R"(
    balance: { competitor: "alice" game: "g" balance: 70 }
    total_earned: 100
    total_spent: 30
  )", R"({
    "competitor": "alice",
    "game": "g",
    "balance": 70,
    "total_earned": 100,
    "total_spent": 30,
    "last_transaction": null
  })");
}

TEST_F (JsonTests, InventoryEntry)
{
  ExpectProtoToJson<proto::InventoryEntry> (R"(
    competitor: "alice"
    item: "sword"
    quantity: 2
    use_count: 1
    last_acquired_at: 10
  )", R"({
    "competitor": "alice",
    "item": "sword",
    "quantity": 2,
    "use_count": 1,
    "last_acquired_at": 10
  })");
}

TEST_F (JsonTests, TradeOffer)
{
  ExpectProtoToJson<proto::TradeOffer> (R"(
    id: 1
    from_competitor: "alice"
    to_competitor: "bob"
    state: PENDING
    items: { item: "sword" quantity: 1 from_competitor: true }
    items: { item: "shield" quantity: 2 from_competitor: false }
    offered_currency: 10
    requested_currency: 0
    created_at: 100
    expires_at: 200
  )", R"({
    "id": 1,
    "from": "alice",
    "to": "bob",
    "state": "pending",
    "items":
      [
        {"item": "sword", "quantity": 1, "from_competitor": true},
        {"item": "shield", "quantity": 2, "from_competitor": false}
      ],
    "offered_currency": 10,
    "requested_currency": 0,
    "created_at": 100,
    "expires_at": 200
  })");
}

TEST_F (JsonTests, ProgressionDetails)
{
  ExpectProtoToJson<proto::ProgressionDetails> (R"(
    progression:
      {
        competitor: "alice"
        season: "s1"
        current_tier: 1
        current_xp: 20
        has_battle_pass: false
      }
    next_tier_xp: 150
    rewards:
      {
        tier:
          {
            season: "s1"
            tier_number: 2
            xp_required: 150
            reward_type: ITEM
            reward_amount: 1
            reward_item: "hat"
            is_premium: true
          }
        is_claimed: false
        is_available: false
      }
  )", R"({
    "competitor": "alice",
    "season": "s1",
    "tier": 1,
    "xp": 20,
    "battle_pass": false,
    "next_tier_xp": 150,
    "rewards":
      [
        {
          "season": "s1",
          "tier": 2,
          "xp_required": 150,
          "reward_type": "item",
          "reward_amount": 1,
          "reward_item": "hat",
          "premium": true,
          "claimed": false,
          "available": false
        }
      ]
  })");

  ExpectProtoToJson<proto::ProgressionDetails> (R"(
    progression:
      {
        competitor: "alice"
        season: "s1"
        current_tier: 3
        current_xp: 0
        has_battle_pass: true
      }
  )", R"({
    "competitor": "alice",
    "season": "s1",
    "tier": 3,
    "xp": 0,
    "battle_pass": true,
    "next_tier_xp": null,
    "rewards": []
  })");
}

TEST_F (JsonTests, TradeItemFromJson)
{
  ExpectProtoFromJson<proto::TradeItem> (R"({
    "item": "sword",
    "quantity": 2
  })", R"(
    item: "sword"
    quantity: 2
    from_competitor: true
  )");

  ExpectProtoFromJson<proto::TradeItem> (R"({
    "item": "shield",
    "quantity": 1,
    "from_competitor": false
  })", R"(
    item: "shield"
    quantity: 1
    from_competitor: false
  )");
}

TEST_F (JsonTests, InvalidTradeItemFromJson)
{
  for (const std::string str : {
          "[]",
          "\"sword\"",
          R"({"quantity": 1})",
          R"({"item": "sword"})",
          R"({"item": "sword", "quantity": "1"})",
          R"({"item": "sword", "quantity": 1.5})",
          R"({"item": "sword", "quantity": 0})",
          R"({"item": "sword", "quantity": -3})",
          R"({"item": "sword", "quantity": 1, "from_competitor": 1})",
      })
    {
      proto::TradeItem pb;
      EXPECT_FALSE (ProtoFromJson (ParseJson (str), pb)) << str;
    }
}

} // anonymous namespace
} // namespace emporium
