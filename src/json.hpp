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

#ifndef EMPORIUM_JSON_HPP
#define EMPORIUM_JSON_HPP

#include <json/json.h>

namespace emporium
{

/**
 * Converts one of the Emporium protocol buffers into a JSON form.
 * This is implemented for the protos that are returned from Engine,
 * and is used for the JSON-RPC interface and the event payloads.
 */
template <typename Proto>
  Json::Value ProtoToJson (const Proto& pb);

/**
 * Tries to convert a JSON representation into the corresponding protocol
 * buffer message.  This is implemented for protos that are used as inputs
 * into Engine, e.g. TradeItem.
 *
 * The method returns true on success (the JSON format was valid) and fills
 * in the output proto.
 */
template <typename Proto>
  bool ProtoFromJson (const Json::Value& val, Proto& pb);

} // namespace emporium

#endif // EMPORIUM_JSON_HPP
