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

#ifndef EMPORIUM_SHOP_HPP
#define EMPORIUM_SHOP_HPP

#include "clock.hpp"
#include "database.hpp"
#include "private/inventory.hpp"
#include "private/ledger.hpp"
#include "proto/config.pb.h"
#include "proto/economy.pb.h"

#include <string>

namespace emporium
{

/**
 * Purchases of catalog items.  A purchase burns the price from the
 * buyer's balance and adds the items to their inventory, all within the
 * enclosing transaction.
 *
 * All methods must be called while a Transaction is active on the
 * database connection.
 */
class ShopEngine
{

private:

  Database& db;
  LedgerStore& ledger;
  InventoryStore& inventory;
  const Clock& clock;

  /**
   * Looks up a shop item including its purchase rules.  Returns false
   * if there is no such item.
   */
  bool LookupItem (const std::string& id, proto::ShopItem& out);

public:

  explicit ShopEngine (Database& d, LedgerStore& l, InventoryStore& i,
                       const Clock& c)
    : db(d), ledger(l), inventory(i), clock(c)
  {}

  ShopEngine () = delete;
  ShopEngine (const ShopEngine&) = delete;
  void operator= (const ShopEngine&) = delete;

  /**
   * Returns a catalog item.  Throws ITEM_NOT_FOUND if it does not exist.
   */
  proto::ShopItem GetItem (const std::string& id);

  /**
   * Buys some quantity of an item.  The item must belong to the game
   * of the buyer's account, be available and in stock, and all its
   * purchase rules must pass.
   */
  proto::ShopPurchase Purchase (const std::string& competitor,
                                const std::string& item, Amount quantity);

};

} // namespace emporium

#endif // EMPORIUM_SHOP_HPP
