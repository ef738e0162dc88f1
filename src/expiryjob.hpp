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

#ifndef EMPORIUM_EXPIRYJOB_HPP
#define EMPORIUM_EXPIRYJOB_HPP

#include "engine.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace emporium
{

/**
 * Background thread that periodically marks expired trade offers as such.
 * Expiry is also applied whenever an offer is read, so this is only
 * needed to keep the stored states up-to-date.
 *
 * The first sweep is done right when the job is started.  The thread
 * is stopped when the instance is destructed.
 */
class ExpiryJob
{

private:

  Engine& engine;

  /** The interval between sweeps.  */
  const std::chrono::milliseconds intv;

  /** Mutex for this instance and its condition variable.  */
  std::mutex mut;

  /** Set to true to signal that the worker thread should stop.  */
  bool stop;

  /** Number of sweeps done so far (successful or not).  */
  unsigned sweeps;

  /**
   * Used to wake up the worker when it should stop, without waiting for
   * the end of the current interval.
   */
  std::condition_variable cv;

  /** The worker thread.  */
  std::thread worker;

  /**
   * Performs one sweep.  Database errors (e.g. if the database is busy)
   * are logged, and the next sweep is just tried as normal.
   */
  void Sweep ();

public:

  explicit ExpiryJob (Engine& e, std::chrono::milliseconds i);
  ~ExpiryJob ();

  ExpiryJob () = delete;
  ExpiryJob (const ExpiryJob&) = delete;
  void operator= (const ExpiryJob&) = delete;

  /**
   * Returns the number of sweeps done so far.
   */
  unsigned GetNumSweeps ();

};

} // namespace emporium

#endif // EMPORIUM_EXPIRYJOB_HPP
