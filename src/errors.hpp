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

#ifndef EMPORIUM_ERRORS_HPP
#define EMPORIUM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace emporium
{

/**
 * The kinds of domain errors that operations of the engine can fail with.
 * Each of them is detected before the operation writes anything, and
 * none of them will go away by just retrying the operation.
 */
enum class ErrorKind
{
  INSUFFICIENT_FUNDS,
  RECIPIENT_NOT_FOUND,
  ACCOUNT_NOT_FOUND,
  ACCOUNT_EXISTS,
  INSUFFICIENT_QUANTITY,
  ITEM_NOT_FOUND,
  ITEM_NOT_AVAILABLE,
  ITEM_OUT_OF_STOCK,
  RULE_VALIDATION_FAILED,
  INVALID_TRADE,
  SEASON_NOT_FOUND,
  TIER_NOT_FOUND,
  TIER_NOT_REACHED,
  BATTLE_PASS_REQUIRED,
  ALREADY_CLAIMED,
  ALREADY_PURCHASED,
  INVALID_ARGUMENT,
};

/**
 * Returns the stable code string (e.g. "INSUFFICIENT_FUNDS") for
 * an error kind.
 */
std::string ErrorCode (ErrorKind kind);

/**
 * Returns the HTTP-like status code (4xx) that corresponds to an
 * error kind.
 */
int ErrorStatus (ErrorKind kind);

/**
 * Exception thrown for domain errors.  Throwing it out of an operation
 * unwinds the enclosing Transaction, so that nothing is committed.
 */
class GameError : public std::runtime_error
{

private:

  const ErrorKind kind;

public:

  explicit GameError (const ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind(k)
  {}

  ErrorKind
  GetKind () const
  {
    return kind;
  }

  std::string
  GetCode () const
  {
    return ErrorCode (kind);
  }

};

} // namespace emporium

#endif // EMPORIUM_ERRORS_HPP
