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

#include "testutils.hpp"

#include "schema.hpp"

#include <chrono>
#include <sstream>

namespace emporium
{

constexpr int64_t TestClock::START;

Json::Value
ParseJson (const std::string& str)
{
  std::istringstream in(str);
  Json::Value res;
  in >> res;
  return res;
}

MockEventSink::MockEventSink ()
{
  EXPECT_CALL (*this, RecordAudit (testing::_, testing::_, testing::_))
      .Times (0);
  EXPECT_CALL (*this, InvalidateCache (testing::_)).Times (0);
  EXPECT_CALL (*this, Notify (testing::_, testing::_, testing::_)).Times (0);
}

constexpr const char* DBTest::GAME;

DBTest::DBTest ()
  : db(":memory:", std::chrono::milliseconds (100)),
    ledger(db, clock), inventory(db, clock)
{
  SetupSchema (db);
}

void
DBTest::SetupAccount (const std::string& competitor, const Amount balance)
{
  Transaction tx(db);
  ledger.OpenAccount (competitor, GAME);
  if (balance > 0)
    ledger.Mint (competitor, balance, "setup",
                 proto::CurrencyTransaction::REWARD);
  tx.Commit ();
}

void
DBTest::SetupItem (const std::string& competitor, const std::string& item,
                   const Amount quantity)
{
  Transaction tx(db);
  inventory.Acquire (competitor, item, quantity, "setup");
  tx.Commit ();
}

Amount
DBTest::GetBalance (const std::string& competitor)
{
  return Run ([&] ()
    {
      proto::CurrencyBalance res;
      CHECK (ledger.GetBalance (competitor, res))
          << "No account for " << competitor;
      return res.balance ();
    });
}

Amount
DBTest::GetQuantity (const std::string& competitor, const std::string& item)
{
  return Run ([&] ()
    {
      return inventory.GetQuantity (competitor, item);
    });
}

Amount
DBTest::GetTotalBalance ()
{
  return Run ([this] ()
    {
      return ledger.GetTotalBalance ();
    });
}

int64_t
DBTest::CountRows (const std::string& table)
{
  auto stmt = db.Prepare ("SELECT COUNT(*) FROM `" + table + "`");
  CHECK (stmt.Step ());
  return stmt.Get<int64_t> (0);
}

} // namespace emporium
