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

#include <glog/logging.h>

#include <google/protobuf/repeated_field.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace emporium
{

namespace
{

using google::protobuf::RepeatedPtrField;

/**
 * Converts an integer to JSON, making sure to do it with the proper
 * signed JSON int64 type.
 */
Json::Value
IntToJson (const int64_t val)
{
  return static_cast<Json::Int64> (val);
}

/**
 * Converts the name of an enum value (like "PENDING") to the lower-case
 * form used in JSON.
 */
Json::Value
EnumToJson (std::string name)
{
  CHECK (!name.empty ());
  std::transform (name.begin (), name.end (), name.begin (),
                  [] (const unsigned char c)
                    {
                      return static_cast<char> (std::tolower (c));
                    });
  return name;
}

/**
 * Converts a list of protos to a JSON array.
 */
template <typename Proto>
  Json::Value
  ListToJson (const RepeatedPtrField<Proto>& list)
{
  Json::Value res(Json::arrayValue);
  for (const auto& entry : list)
    res.append (ProtoToJson (entry));

  return res;
}

} // anonymous namespace

/* ************************************************************************** */

template <>
  Json::Value
  ProtoToJson<proto::CurrencyBalance> (const proto::CurrencyBalance& pb)
{
  Json::Value res(Json::objectValue);
  res["competitor"] = pb.competitor ();
  res["game"] = pb.game ();
  res["balance"] = IntToJson (pb.balance ());

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::CurrencyTransaction> (
      const proto::CurrencyTransaction& pb)
{
  Json::Value res(Json::objectValue);
  res["id"] = IntToJson (pb.id ());

  /* Mints and burns have no sender or recipient, which is reported
     as JSON null.  */
  if (pb.has_from_competitor ())
    res["from"] = pb.from_competitor ();
  else
    res["from"] = Json::Value ();
  if (pb.has_to_competitor ())
    res["to"] = pb.to_competitor ();
  else
    res["to"] = Json::Value ();

  res["amount"] = IntToJson (pb.amount ());
  res["reason"] = pb.reason ();
  res["status"]
      = EnumToJson (proto::CurrencyTransaction::Status_Name (pb.status ()));
  res["type"]
      = EnumToJson (proto::CurrencyTransaction::Type_Name (pb.type ()));
  res["occurred_at"] = IntToJson (pb.occurred_at ());

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::BalanceDetails> (const proto::BalanceDetails& pb)
{
  Json::Value res = ProtoToJson (pb.balance ());
  res["total_earned"] = IntToJson (pb.total_earned ());
  res["total_spent"] = IntToJson (pb.total_spent ());

  if (pb.has_last_transaction ())
    res["last_transaction"] = ProtoToJson (pb.last_transaction ());
  else
    res["last_transaction"] = Json::Value ();

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::DailyReward> (const proto::DailyReward& pb)
{
  Json::Value res(Json::objectValue);
  res["competitor"] = pb.competitor ();
  res["day"] = IntToJson (pb.day ());
  res["amount"] = IntToJson (pb.amount ());
  res["transaction"] = ProtoToJson (pb.transaction ());

  return res;
}

/* ************************************************************************** */

template <>
  Json::Value
  ProtoToJson<proto::InventoryEntry> (const proto::InventoryEntry& pb)
{
  Json::Value res(Json::objectValue);
  res["competitor"] = pb.competitor ();
  res["item"] = pb.item ();
  res["quantity"] = IntToJson (pb.quantity ());
  res["use_count"] = IntToJson (pb.use_count ());

  if (pb.has_last_acquired_at ())
    res["last_acquired_at"] = IntToJson (pb.last_acquired_at ());
  if (pb.has_last_used_at ())
    res["last_used_at"] = IntToJson (pb.last_used_at ());

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::ItemUsage> (const proto::ItemUsage& pb)
{
  Json::Value res(Json::objectValue);
  res["id"] = IntToJson (pb.id ());
  res["competitor"] = pb.competitor ();
  res["item"] = pb.item ();
  res["quantity"] = IntToJson (pb.quantity ());
  res["used_at"] = IntToJson (pb.used_at ());

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::ItemUse> (const proto::ItemUse& pb)
{
  Json::Value res(Json::objectValue);
  res["inventory"] = ProtoToJson (pb.inventory ());
  res["usage"] = ProtoToJson (pb.usage ());

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::ShopPurchase> (const proto::ShopPurchase& pb)
{
  Json::Value res(Json::objectValue);
  res["id"] = IntToJson (pb.id ());
  res["competitor"] = pb.competitor ();
  res["item"] = pb.item ();
  res["quantity"] = IntToJson (pb.quantity ());
  res["price_per_unit"] = IntToJson (pb.price_per_unit ());
  res["transaction"] = ProtoToJson (pb.transaction ());
  res["inventory"] = ProtoToJson (pb.inventory ());

  return res;
}

/* ************************************************************************** */

template <>
  Json::Value
  ProtoToJson<proto::TradeItem> (const proto::TradeItem& pb)
{
  Json::Value res(Json::objectValue);
  res["item"] = pb.item ();
  res["quantity"] = IntToJson (pb.quantity ());
  res["from_competitor"] = pb.from_competitor ();

  return res;
}

template <>
  bool
  ProtoFromJson<proto::TradeItem> (const Json::Value& val,
                                   proto::TradeItem& pb)
{
  pb.Clear ();

  if (!val.isObject ())
    return false;

  if (!val["item"].isString ())
    return false;
  pb.set_item (val["item"].asString ());

  if (!val["quantity"].isInt64 () || val["quantity"].asInt64 () <= 0)
    return false;
  pb.set_quantity (val["quantity"].asInt64 ());

  if (val.isMember ("from_competitor"))
    {
      if (!val["from_competitor"].isBool ())
        return false;
      pb.set_from_competitor (val["from_competitor"].asBool ());
    }
  else
    pb.set_from_competitor (true);

  return true;
}

template <>
  Json::Value
  ProtoToJson<proto::TradeOffer> (const proto::TradeOffer& pb)
{
  Json::Value res(Json::objectValue);
  res["id"] = IntToJson (pb.id ());
  res["from"] = pb.from_competitor ();
  res["to"] = pb.to_competitor ();
  res["state"] = EnumToJson (proto::TradeOffer::State_Name (pb.state ()));
  res["items"] = ListToJson (pb.items ());
  res["offered_currency"] = IntToJson (pb.offered_currency ());
  res["requested_currency"] = IntToJson (pb.requested_currency ());
  res["created_at"] = IntToJson (pb.created_at ());
  res["expires_at"] = IntToJson (pb.expires_at ());

  if (pb.has_completed_at ())
    res["completed_at"] = IntToJson (pb.completed_at ());

  return res;
}

/* ************************************************************************** */

template <>
  Json::Value
  ProtoToJson<proto::SeasonTier> (const proto::SeasonTier& pb)
{
  Json::Value res(Json::objectValue);
  res["season"] = pb.season ();
  res["tier"] = IntToJson (pb.tier_number ());
  res["xp_required"] = IntToJson (pb.xp_required ());
  res["reward_type"]
      = EnumToJson (proto::SeasonTier::RewardType_Name (pb.reward_type ()));
  res["reward_amount"] = IntToJson (pb.reward_amount ());
  if (pb.has_reward_item ())
    res["reward_item"] = pb.reward_item ();
  res["premium"] = pb.is_premium ();

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::SeasonProgression> (const proto::SeasonProgression& pb)
{
  Json::Value res(Json::objectValue);
  res["competitor"] = pb.competitor ();
  res["season"] = pb.season ();
  res["tier"] = IntToJson (pb.current_tier ());
  res["xp"] = IntToJson (pb.current_xp ());
  res["battle_pass"] = pb.has_battle_pass ();

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::XpAward> (const proto::XpAward& pb)
{
  Json::Value res(Json::objectValue);
  res["progression"] = ProtoToJson (pb.progression ());
  res["tiered_up"] = pb.tiered_up ();
  res["rewards"] = ListToJson (pb.tier_up_rewards ());

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::ClaimedReward> (const proto::ClaimedReward& pb)
{
  Json::Value res(Json::objectValue);
  res["tier"] = ProtoToJson (pb.tier ());
  res["claimed_at"] = IntToJson (pb.claimed_at ());

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::BattlePass> (const proto::BattlePass& pb)
{
  Json::Value res(Json::objectValue);
  res["competitor"] = pb.competitor ();
  res["season"] = pb.season ();
  res["price_paid"] = IntToJson (pb.price_paid ());
  res["purchased_at"] = IntToJson (pb.purchased_at ());
  res["progression"] = ProtoToJson (pb.progression ());

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::RewardStatus> (const proto::RewardStatus& pb)
{
  Json::Value res = ProtoToJson (pb.tier ());
  res["claimed"] = pb.is_claimed ();
  res["available"] = pb.is_available ();

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::ProgressionDetails> (
      const proto::ProgressionDetails& pb)
{
  Json::Value res = ProtoToJson (pb.progression ());

  if (pb.has_next_tier_xp ())
    res["next_tier_xp"] = IntToJson (pb.next_tier_xp ());
  else
    res["next_tier_xp"] = Json::Value ();

  res["rewards"] = ListToJson (pb.rewards ());

  return res;
}

} // namespace emporium
