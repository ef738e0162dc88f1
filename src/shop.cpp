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

#include "private/shop.hpp"

#include "errors.hpp"
#include "private/rules.hpp"

#include <glog/logging.h>

#include <limits>

namespace emporium
{

bool
ShopEngine::LookupItem (const std::string& id, proto::ShopItem& out)
{
  auto stmt = db.Prepare (R"(
    SELECT `game`, `name`, `price`, `stock`, `available`, `rules`
      FROM `shop_item`
      WHERE `id` = ?1
  )");
  stmt.Bind (1, id);

  if (!stmt.Step ())
    return false;

  out.Clear ();
  out.set_id (id);
  out.set_game (stmt.Get<std::string> (0));
  out.set_name (stmt.Get<std::string> (1));
  out.set_price (stmt.Get<int64_t> (2));
  if (!stmt.IsNull (3))
    out.set_stock (stmt.Get<int64_t> (3));
  out.set_available (stmt.Get<bool> (4));

  if (!stmt.IsNull (5))
    {
      proto::RuleSet rules;
      CHECK (rules.ParseFromString (stmt.GetBlob (5)))
          << "Invalid purchase rules stored for shop item " << id;
      out.mutable_purchase_rules ()->Swap (rules.mutable_rules ());
    }

  return true;
}

proto::ShopItem
ShopEngine::GetItem (const std::string& id)
{
  proto::ShopItem res;
  if (!LookupItem (id, res))
    throw GameError (ErrorKind::ITEM_NOT_FOUND, "unknown shop item: " + id);

  return res;
}

proto::ShopPurchase
ShopEngine::Purchase (const std::string& competitor, const std::string& item,
                      const Amount quantity)
{
  CHECK (db.IsInTransaction ());

  if (quantity <= 0)
    throw GameError (ErrorKind::INVALID_ARGUMENT,
                     "purchase quantity must be positive");

  proto::CurrencyBalance balance;
  if (!ledger.GetBalance (competitor, balance))
    throw GameError (ErrorKind::ACCOUNT_NOT_FOUND,
                     "no account for " + competitor);

  proto::ShopItem data;
  if (!LookupItem (item, data) || data.game () != balance.game ())
    throw GameError (ErrorKind::ITEM_NOT_FOUND, "unknown shop item: " + item);

  if (!data.available ())
    throw GameError (ErrorKind::ITEM_NOT_AVAILABLE,
                     "shop item is not available: " + item);
  if (data.has_stock () && data.stock () < quantity)
    throw GameError (ErrorKind::ITEM_OUT_OF_STOCK,
                     "not enough stock of " + item);

  if (data.price () > std::numeric_limits<Amount>::max () / quantity)
    throw GameError (ErrorKind::INVALID_ARGUMENT, "total price overflows");
  const Amount total = data.price () * quantity;

  RuleContext ctx;
  ctx.Set ("quantity", quantity);
  ctx.Set ("price", data.price ());
  ctx.Set ("total_price", total);
  ctx.Set ("balance", balance.balance ());
  ctx.Set ("owned", inventory.GetQuantity (competitor, item));

  proto::RuleSet rules;
  *rules.mutable_rules () = data.purchase_rules ();
  CheckRules (rules, ctx);

  proto::ShopPurchase res;
  *res.mutable_transaction ()
      = ledger.Burn (competitor, total, "purchase of " + item,
                     proto::CurrencyTransaction::PURCHASE);

  if (data.has_stock ())
    {
      auto stmt = db.Prepare (R"(
        UPDATE `shop_item`
          SET `stock` = `stock` - ?2
          WHERE `id` = ?1
      )");
      stmt.Bind (1, item);
      stmt.Bind (2, quantity);
      stmt.Execute ();
    }

  *res.mutable_inventory ()
      = inventory.Acquire (competitor, item, quantity, "purchase");

  res.set_competitor (competitor);
  res.set_item (item);
  res.set_quantity (quantity);
  res.set_price_per_unit (data.price ());

  auto stmt = db.Prepare (R"(
    INSERT INTO `shop_transaction`
      (`competitor`, `item`, `quantity`, `price_per_unit`, `transaction`,
       `occurred_at`)
      VALUES (?1, ?2, ?3, ?4, ?5, ?6)
  )");
  stmt.Bind (1, competitor);
  stmt.Bind (2, item);
  stmt.Bind (3, quantity);
  stmt.Bind (4, data.price ());
  stmt.Bind (5, res.transaction ().id ());
  stmt.Bind (6, clock.GetCurrentTime ());
  stmt.Execute ();
  res.set_id (db.GetLastInsertId ());

  LOG (INFO)
      << competitor << " bought " << quantity << " " << item
      << " for " << total;

  return res;
}

} // namespace emporium
