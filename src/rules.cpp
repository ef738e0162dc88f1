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

#include "private/rules.hpp"

#include "errors.hpp"

#include <glog/logging.h>

namespace emporium
{

bool
RuleContext::Get (const std::string& name, int64_t& val) const
{
  const auto mit = fields.find (name);
  if (mit == fields.end ())
    return false;

  val = mit->second;
  return true;
}

namespace
{

bool
EvaluateComparison (const proto::FieldComparison& cmp, const RuleContext& ctx)
{
  int64_t val;
  if (!ctx.Get (cmp.field (), val))
    {
      VLOG (1) << "Unknown field in rule: " << cmp.field ();
      return false;
    }

  switch (cmp.op ())
    {
    case proto::FieldComparison::EQ:
      return val == cmp.value ();
    case proto::FieldComparison::NE:
      return val != cmp.value ();
    case proto::FieldComparison::LT:
      return val < cmp.value ();
    case proto::FieldComparison::LE:
      return val <= cmp.value ();
    case proto::FieldComparison::GT:
      return val > cmp.value ();
    case proto::FieldComparison::GE:
      return val >= cmp.value ();
    default:
      LOG (WARNING) << "Invalid comparison operator: " << cmp.op ();
      return false;
    }
}

bool
EvaluateRange (const proto::RangeCheck& range, const RuleContext& ctx)
{
  int64_t val;
  if (!ctx.Get (range.field (), val))
    {
      VLOG (1) << "Unknown field in rule: " << range.field ();
      return false;
    }

  if (range.has_min () && val < range.min ())
    return false;
  if (range.has_max () && val > range.max ())
    return false;

  return true;
}

} // anonymous namespace

bool
EvaluateRule (const proto::Rule& rule, const RuleContext& ctx)
{
  switch (rule.predicate_case ())
    {
    case proto::Rule::kComparison:
      return EvaluateComparison (rule.comparison (), ctx);
    case proto::Rule::kRange:
      return EvaluateRange (rule.range (), ctx);
    case proto::Rule::PREDICATE_NOT_SET:
      LOG (WARNING) << "Rule without predicate: " << rule.id ();
      return false;
    }

  LOG (FATAL) << "Unexpected predicate case: " << rule.predicate_case ();
}

void
CheckRules (const proto::RuleSet& rules, const RuleContext& ctx)
{
  for (const auto& r : rules.rules ())
    if (!EvaluateRule (r, ctx))
      throw GameError (ErrorKind::RULE_VALIDATION_FAILED,
                       "validation failed for rule: " + r.id ());
}

} // namespace emporium
