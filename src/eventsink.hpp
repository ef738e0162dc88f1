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

#ifndef EMPORIUM_EVENTSINK_HPP
#define EMPORIUM_EVENTSINK_HPP

#include <json/json.h>

#include <string>

namespace emporium
{

/**
 * Interface for the collaborators that get informed about completed
 * operations:  The audit log, cache invalidation and real-time
 * notifications to competitors.  The Engine calls into them only after
 * the operation's transaction has been committed.  Implementations
 * should not block; exceptions they throw are logged and ignored.
 */
class EventSink
{

public:

  EventSink () = default;
  virtual ~EventSink () = default;

  EventSink (const EventSink&) = delete;
  void operator= (const EventSink&) = delete;

  /**
   * Records an audit log entry for an action taken by some actor.
   */
  virtual void RecordAudit (const std::string& actor,
                            const std::string& action,
                            const Json::Value& details) = 0;

  /**
   * Signals that cached data for the given resource (e.g. "balance:alice")
   * is stale now.
   */
  virtual void InvalidateCache (const std::string& resource) = 0;

  /**
   * Sends a real-time notification about some event to a competitor.
   */
  virtual void Notify (const std::string& recipient, const std::string& event,
                       const Json::Value& payload) = 0;

};

/**
 * Event sink that just writes all events to the log.
 */
class LoggingEventSink : public EventSink
{

public:

  LoggingEventSink () = default;

  void RecordAudit (const std::string& actor, const std::string& action,
                    const Json::Value& details) override;
  void InvalidateCache (const std::string& resource) override;
  void Notify (const std::string& recipient, const std::string& event,
               const Json::Value& payload) override;

};

} // namespace emporium

#endif // EMPORIUM_EVENTSINK_HPP
