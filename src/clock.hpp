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

#ifndef EMPORIUM_CLOCK_HPP
#define EMPORIUM_CLOCK_HPP

#include <chrono>
#include <cstdint>

namespace emporium
{

/**
 * Source of the current time used for timestamps, trade expiry and
 * daily rewards.  The default implementation uses the system clock;
 * tests override it to return a fake time instead.
 */
class Clock
{

public:

  Clock () = default;
  virtual ~Clock () = default;

  Clock (const Clock&) = delete;
  void operator= (const Clock&) = delete;

  /**
   * Returns the current time as UNIX timestamp (in seconds).  Since
   * C++20, std::system_clock is guaranteed to use the UNIX epoch;
   * before that, it is the de-facto standard.
   */
  virtual int64_t
  GetCurrentTime () const
  {
    using std::chrono::system_clock;
    return std::chrono::duration_cast<std::chrono::seconds> (
        system_clock::now ().time_since_epoch ()).count ();
  }

};

} // namespace emporium

#endif // EMPORIUM_CLOCK_HPP
