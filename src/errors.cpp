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

#include "errors.hpp"

#include <glog/logging.h>

namespace emporium
{

std::string
ErrorCode (const ErrorKind kind)
{
  switch (kind)
    {
    case ErrorKind::INSUFFICIENT_FUNDS:
      return "INSUFFICIENT_FUNDS";
    case ErrorKind::RECIPIENT_NOT_FOUND:
      return "RECIPIENT_NOT_FOUND";
    case ErrorKind::ACCOUNT_NOT_FOUND:
      return "ACCOUNT_NOT_FOUND";
    case ErrorKind::ACCOUNT_EXISTS:
      return "ACCOUNT_EXISTS";
    case ErrorKind::INSUFFICIENT_QUANTITY:
      return "INSUFFICIENT_QUANTITY";
    case ErrorKind::ITEM_NOT_FOUND:
      return "ITEM_NOT_FOUND";
    case ErrorKind::ITEM_NOT_AVAILABLE:
      return "ITEM_NOT_AVAILABLE";
    case ErrorKind::ITEM_OUT_OF_STOCK:
      return "ITEM_OUT_OF_STOCK";
    case ErrorKind::RULE_VALIDATION_FAILED:
      return "RULE_VALIDATION_FAILED";
    case ErrorKind::INVALID_TRADE:
      return "INVALID_TRADE";
    case ErrorKind::SEASON_NOT_FOUND:
      return "SEASON_NOT_FOUND";
    case ErrorKind::TIER_NOT_FOUND:
      return "TIER_NOT_FOUND";
    case ErrorKind::TIER_NOT_REACHED:
      return "TIER_NOT_REACHED";
    case ErrorKind::BATTLE_PASS_REQUIRED:
      return "BATTLE_PASS_REQUIRED";
    case ErrorKind::ALREADY_CLAIMED:
      return "ALREADY_CLAIMED";
    case ErrorKind::ALREADY_PURCHASED:
      return "ALREADY_PURCHASED";
    case ErrorKind::INVALID_ARGUMENT:
      return "INVALID_ARGUMENT";
    }

  LOG (FATAL) << "Invalid error kind: " << static_cast<int> (kind);
}

int
ErrorStatus (const ErrorKind kind)
{
  switch (kind)
    {
    case ErrorKind::RECIPIENT_NOT_FOUND:
    case ErrorKind::ACCOUNT_NOT_FOUND:
    case ErrorKind::ITEM_NOT_FOUND:
    case ErrorKind::SEASON_NOT_FOUND:
    case ErrorKind::TIER_NOT_FOUND:
      return 404;

    case ErrorKind::ACCOUNT_EXISTS:
    case ErrorKind::ALREADY_CLAIMED:
    case ErrorKind::ALREADY_PURCHASED:
      return 409;

    default:
      return 400;
    }
}

} // namespace emporium
