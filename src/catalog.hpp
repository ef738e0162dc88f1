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

#ifndef EMPORIUM_CATALOG_HPP
#define EMPORIUM_CATALOG_HPP

#include "database.hpp"
#include "proto/config.pb.h"
#include "proto/economy.pb.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace emporium
{

/**
 * Exception thrown if the catalog in the configuration is invalid.
 */
class CatalogError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * Returns the default tier curve for a season that does not define
 * its own tiers.
 */
std::vector<proto::SeasonTier> GenerateDefaultTiers (const std::string& season);

/**
 * Writes the seasons (with their tiers) and shop items from the config
 * into the catalog tables.  Existing entries are updated, except for the
 * remaining stock of shop items, which is only initialised once.
 */
void LoadCatalog (Database& db, const proto::Config& config);

} // namespace emporium

#endif // EMPORIUM_CATALOG_HPP
