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

#include "eventsink.hpp"

#include <glog/logging.h>

namespace emporium
{

void
LoggingEventSink::RecordAudit (const std::string& actor,
                               const std::string& action,
                               const Json::Value& details)
{
  LOG (INFO) << "Audit: " << actor << " " << action << "\n" << details;
}

void
LoggingEventSink::InvalidateCache (const std::string& resource)
{
  VLOG (1) << "Cache invalidated: " << resource;
}

void
LoggingEventSink::Notify (const std::string& recipient,
                          const std::string& event,
                          const Json::Value& payload)
{
  VLOG (1) << "Notification for " << recipient << ": " << event
           << "\n" << payload;
}

} // namespace emporium
