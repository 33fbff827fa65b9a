/*
 * horn - Logic programming with Horn clauses
 * Copyright (C) 2025  Ivan Pidhurskyi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#include "horn/query.hpp"
#include "horn/logging.hpp"
#include "horn/substitution.hpp"
#include "horn/utilities/execution_timer.hpp"

#include <format>
#include <sstream>
#include <stdexcept>


horn::value
horn::solution::at(std::string_view name) const
{
  for (const auto &[varname, val] : m_bindings)
  {
    if (varname == name)
      return val;
  }
  throw std::out_of_range {std::format("no variable {} in solution", name)};
}


bool
horn::solution::contains(std::string_view name) const noexcept
{
  for (const auto &[varname, _] : m_bindings)
  {
    if (varname == name)
      return true;
  }
  return false;
}


std::string
horn::solution::to_string() const
{
  std::ostringstream buf;
  write(buf, *this);
  return buf.str();
}


void
horn::write(std::ostream &os, const solution &sol)
{
  bool first = true;
  for (const auto &[name, val] : sol)
  {
    if (not first)
      os << "; ";
    os << name << ": " << val;
    first = false;
  }
}


horn::solutions::solutions(std::shared_ptr<const database> db,
                           compiled_goal query, goal g,
                           stl::vector<value> vars,
                           std::vector<std::string> names,
                           std::optional<size_t> limit)
: m_state {root_ptr<state>::make(std::move(db), std::move(query),
                                 answer_stream {g},
                                 std::move(vars), std::move(names), limit,
                                 size_t {0})}
{ }


std::optional<horn::solution>
horn::solutions::next()
{
  HORN_FUNCTION_BENCHMARK

  state &st = *m_state;
  if (st.limit and st.count >= *st.limit)
    return std::nullopt;

  while (not st.stream.exhausted())
  {
    const std::optional<substitution> s = st.stream.pull();
    if (not s)
      continue;

    // Every variable is reified on its own, numbering unbound ones from _.0
    solution result;
    for (size_t i = 0; i < st.vars.size(); ++i)
      result.add(st.names[i], reify(st.vars[i], *s));
    st.count += 1;

    if (global_flags.contains("DebugQuery"))
      debug("solution #{} after {} steps: {}", st.count, st.stream.steps(),
            result.to_string());
    return result;
  }
  return std::nullopt;
}


std::vector<horn::solution>
horn::solutions::to_vector()
{
  std::vector<solution> result;
  while (std::optional<solution> sol = next())
    result.push_back(std::move(*sol));
  return result;
}
