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

#ifndef EMPORIUM_RULES_HPP
#define EMPORIUM_RULES_HPP

#include "proto/config.pb.h"

#include <cstdint>
#include <map>
#include <string>

namespace emporium
{

/**
 * The data a rule is evaluated against:  A set of named integer fields
 * describing the operation (e.g. "quantity" or "balance").
 */
class RuleContext
{

private:

  std::map<std::string, int64_t> fields;

public:

  RuleContext () = default;

  void
  Set (const std::string& name, const int64_t val)
  {
    fields[name] = val;
  }

  /**
   * Looks up a field.  Returns false if it is not defined.
   */
  bool Get (const std::string& name, int64_t& val) const;

};

/**
 * Evaluates a single rule.  Rules are a closed set of typed predicates
 * (comparisons and range checks); a rule that has no predicate or
 * references an unknown field does not pass.
 */
bool EvaluateRule (const proto::Rule& rule, const RuleContext& ctx);

/**
 * Evaluates all rules in a set and throws a RULE_VALIDATION_FAILED error
 * naming the first rule that does not pass.
 */
void CheckRules (const proto::RuleSet& rules, const RuleContext& ctx);

} // namespace emporium

#endif // EMPORIUM_RULES_HPP
