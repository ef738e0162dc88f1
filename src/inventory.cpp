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

#include "private/inventory.hpp"

#include "errors.hpp"

#include <glog/logging.h>

#include <limits>

namespace emporium
{

namespace
{

/** Columns selected for reading an inventory entry.  */
constexpr const char* ENTRY_COLUMNS = R"(
  `competitor`, `item`, `quantity`, `use_count`,
  `last_acquired_at`, `last_used_at`
)";

proto::InventoryEntry
ReadEntry (const Database::Statement& stmt)
{
  proto::InventoryEntry res;
  res.set_competitor (stmt.Get<std::string> (0));
  res.set_item (stmt.Get<std::string> (1));
  res.set_quantity (stmt.Get<int64_t> (2));
  res.set_use_count (stmt.Get<int64_t> (3));
  if (!stmt.IsNull (4))
    res.set_last_acquired_at (stmt.Get<int64_t> (4));
  if (!stmt.IsNull (5))
    res.set_last_used_at (stmt.Get<int64_t> (5));
  return res;
}

} // anonymous namespace

bool
InventoryStore::GetEntry (const std::string& competitor,
                          const std::string& item, proto::InventoryEntry& out)
{
  CHECK (db.IsInTransaction ());

  auto stmt = db.Prepare (std::string ("SELECT ") + ENTRY_COLUMNS + R"(
      FROM `inventory`
      WHERE `competitor` = ?1 AND `item` = ?2
  )");
  stmt.Bind (1, competitor);
  stmt.Bind (2, item);

  if (!stmt.Step ())
    return false;

  out = ReadEntry (stmt);
  CHECK (!stmt.Step ());
  return true;
}

Amount
InventoryStore::GetQuantity (const std::string& competitor,
                             const std::string& item)
{
  proto::InventoryEntry entry;
  if (!GetEntry (competitor, item, entry))
    return 0;
  return entry.quantity ();
}

std::vector<proto::InventoryEntry>
InventoryStore::GetInventory (const std::string& competitor,
                              const bool includeEmpty)
{
  auto stmt = db.Prepare (std::string ("SELECT ") + ENTRY_COLUMNS + R"(
      FROM `inventory`
      WHERE `competitor` = ?1 AND (?2 OR `quantity` > 0)
      ORDER BY `item`
  )");
  stmt.Bind (1, competitor);
  stmt.Bind (2, includeEmpty);

  std::vector<proto::InventoryEntry> res;
  while (stmt.Step ())
    res.push_back (ReadEntry (stmt));

  return res;
}

proto::InventoryEntry
InventoryStore::Acquire (const std::string& competitor,
                         const std::string& item, const Amount quantity,
                         const std::string& source)
{
  CHECK (db.IsInTransaction ());
  CHECK_GT (quantity, 0);

  const int64_t now = clock.GetCurrentTime ();

  proto::InventoryEntry res;
  if (GetEntry (competitor, item, res))
    {
      if (res.quantity () > std::numeric_limits<Amount>::max () - quantity)
        throw GameError (ErrorKind::INVALID_ARGUMENT,
                         "item quantity overflow for " + item);

      auto stmt = db.Prepare (R"(
        UPDATE `inventory`
          SET `quantity` = `quantity` + ?3,
              `last_acquired_at` = ?4
          WHERE `competitor` = ?1 AND `item` = ?2
      )");
      stmt.Bind (1, competitor);
      stmt.Bind (2, item);
      stmt.Bind (3, quantity);
      stmt.Bind (4, now);
      stmt.Execute ();

      res.set_quantity (res.quantity () + quantity);
    }
  else
    {
      auto stmt = db.Prepare (R"(
        INSERT INTO `inventory`
          (`competitor`, `item`, `quantity`, `use_count`, `last_acquired_at`)
          VALUES (?1, ?2, ?3, 0, ?4)
      )");
      stmt.Bind (1, competitor);
      stmt.Bind (2, item);
      stmt.Bind (3, quantity);
      stmt.Bind (4, now);
      stmt.Execute ();

      res.set_competitor (competitor);
      res.set_item (item);
      res.set_quantity (quantity);
      res.set_use_count (0);
    }
  res.set_last_acquired_at (now);

  auto stmt = db.Prepare (R"(
    INSERT INTO `item_acquisition`
      (`competitor`, `item`, `quantity`, `source`, `acquired_at`)
      VALUES (?1, ?2, ?3, ?4, ?5)
  )");
  stmt.Bind (1, competitor);
  stmt.Bind (2, item);
  stmt.Bind (3, quantity);
  stmt.Bind (4, source);
  stmt.Bind (5, now);
  stmt.Execute ();

  VLOG (1)
      << competitor << " acquired " << quantity << "x " << item
      << " (" << source << "), now holding " << res.quantity ();

  return res;
}

void
InventoryStore::Remove (const std::string& competitor,
                        const std::string& item, const Amount quantity)
{
  CHECK_GT (quantity, 0);
  CHECK_GE (GetQuantity (competitor, item), quantity)
      << "Removing more " << item << " than " << competitor << " holds";

  auto stmt = db.Prepare (R"(
    UPDATE `inventory`
      SET `quantity` = `quantity` - ?3
      WHERE `competitor` = ?1 AND `item` = ?2
  )");
  stmt.Bind (1, competitor);
  stmt.Bind (2, item);
  stmt.Bind (3, quantity);
  stmt.Execute ();

  VLOG (1) << "Removed " << quantity << "x " << item << " from " << competitor;
}

proto::ItemUse
InventoryStore::Use (const std::string& competitor, const std::string& item,
                     const Amount quantity)
{
  if (quantity <= 0)
    throw GameError (ErrorKind::INVALID_ARGUMENT,
                     "quantity must be positive");

  proto::ItemUse res;
  auto& entry = *res.mutable_inventory ();
  if (!GetEntry (competitor, item, entry))
    throw GameError (ErrorKind::ITEM_NOT_FOUND,
                     "item not found in inventory: " + item);
  if (entry.quantity () < quantity)
    throw GameError (ErrorKind::INSUFFICIENT_QUANTITY,
                     "insufficient quantity of " + item);

  const int64_t now = clock.GetCurrentTime ();

  {
    auto stmt = db.Prepare (R"(
      UPDATE `inventory`
        SET `quantity` = `quantity` - ?3,
            `use_count` = `use_count` + 1,
            `last_used_at` = ?4
        WHERE `competitor` = ?1 AND `item` = ?2
    )");
    stmt.Bind (1, competitor);
    stmt.Bind (2, item);
    stmt.Bind (3, quantity);
    stmt.Bind (4, now);
    stmt.Execute ();
  }

  entry.set_quantity (entry.quantity () - quantity);
  entry.set_use_count (entry.use_count () + 1);
  entry.set_last_used_at (now);

  auto stmt = db.Prepare (R"(
    INSERT INTO `item_usage`
      (`competitor`, `item`, `quantity`, `used_at`)
      VALUES (?1, ?2, ?3, ?4)
  )");
  stmt.Bind (1, competitor);
  stmt.Bind (2, item);
  stmt.Bind (3, quantity);
  stmt.Bind (4, now);
  stmt.Execute ();

  auto& usage = *res.mutable_usage ();
  usage.set_id (db.GetLastInsertId ());
  usage.set_competitor (competitor);
  usage.set_item (item);
  usage.set_quantity (quantity);
  usage.set_used_at (now);

  LOG (INFO)
      << competitor << " used " << quantity << "x " << item
      << ", " << entry.quantity () << " left";

  return res;
}

} // namespace emporium
