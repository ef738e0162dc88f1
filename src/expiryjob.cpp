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

#include "expiryjob.hpp"

#include "database.hpp"

#include <glog/logging.h>

namespace emporium
{

ExpiryJob::ExpiryJob (Engine& e, const std::chrono::milliseconds i)
  : engine(e), intv(i), stop(false), sweeps(0)
{
  CHECK_GT (intv.count (), 0) << "Invalid expiry sweep interval";

  std::lock_guard<std::mutex> lock(mut);
  worker = std::thread ([this] ()
    {
      std::unique_lock<std::mutex> lock(mut);
      while (!stop)
        {
          /* The engine has its own locking, so we do not need to hold
             our lock while it runs.  */
          lock.unlock ();
          Sweep ();
          lock.lock ();

          ++sweeps;

          if (!stop)
            cv.wait_for (lock, intv);
        }
    });

  LOG (INFO)
      << "Started trade expiry sweep every " << intv.count () << " ms";
}

ExpiryJob::~ExpiryJob ()
{
  {
    std::lock_guard<std::mutex> lock(mut);
    stop = true;
    cv.notify_all ();
  }

  worker.join ();
}

void
ExpiryJob::Sweep ()
{
  try
    {
      const unsigned expired = engine.ExpireTrades ();
      VLOG (1) << "Expiry sweep marked " << expired << " offers";
    }
  catch (const DatabaseError& exc)
    {
      LOG (WARNING) << "Expiry sweep failed: " << exc.what ();
    }
}

unsigned
ExpiryJob::GetNumSweeps ()
{
  std::lock_guard<std::mutex> lock(mut);
  return sweeps;
}

} // namespace emporium
