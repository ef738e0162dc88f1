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

#ifndef EMPORIUM_INVENTORY_HPP
#define EMPORIUM_INVENTORY_HPP

#include "clock.hpp"
#include "database.hpp"
#include "private/ledger.hpp"
#include "proto/economy.pb.h"

#include <string>
#include <vector>

namespace emporium
{

/**
 * Per-competitor item holdings, together with the append-only logs
 * of item usage and acquisition.
 *
 * All methods must be called while a Transaction is active on the
 * database connection.
 */
class InventoryStore
{

private:

  Database& db;
  const Clock& clock;

public:

  explicit InventoryStore (Database& d, const Clock& c)
    : db(d), clock(c)
  {}

  InventoryStore () = delete;
  InventoryStore (const InventoryStore&) = delete;
  void operator= (const InventoryStore&) = delete;

  /**
   * Looks up (and thus locks) the inventory entry of a competitor for
   * an item.  Returns false if there is none.
   */
  bool GetEntry (const std::string& competitor, const std::string& item,
                 proto::InventoryEntry& out);

  /**
   * Returns the quantity held of some item, which is zero if there
   * is no entry at all.
   */
  Amount GetQuantity (const std::string& competitor, const std::string& item);

  /**
   * Returns all inventory entries of a competitor, ordered by item.
   * Entries with zero quantity are only returned if includeEmpty is set.
   */
  std::vector<proto::InventoryEntry> GetInventory (
      const std::string& competitor, bool includeEmpty);

  /**
   * Adds items to a competitor's inventory, creating the entry if
   * necessary.  The acquisition is logged with the given source.
   */
  proto::InventoryEntry Acquire (const std::string& competitor,
                                 const std::string& item, Amount quantity,
                                 const std::string& source);

  /**
   * Removes items from a competitor's inventory (e.g. because they are
   * given away in a trade).  The caller must have verified the quantity
   * already, this is CHECK'ed.
   */
  void Remove (const std::string& competitor, const std::string& item,
               Amount quantity);

  /**
   * Uses up items.  Fails with ITEM_NOT_FOUND if the competitor never
   * held the item, and with INSUFFICIENT_QUANTITY if they do not have
   * enough of them.
   */
  proto::ItemUse Use (const std::string& competitor, const std::string& item,
                      Amount quantity);

};

} // namespace emporium

#endif // EMPORIUM_INVENTORY_HPP
