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

#ifndef EMPORIUM_SCHEMA_HPP
#define EMPORIUM_SCHEMA_HPP

#include "database.hpp"

namespace emporium
{

/**
 * Sets up the database schema (all tables and indices) if it does not
 * exist yet.  This is safe to call on an already initialised database.
 */
void SetupSchema (Database& db);

} // namespace emporium

#endif // EMPORIUM_SCHEMA_HPP
