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


#include "horn/compiler.hpp"
#include "horn/database.hpp"
#include "horn/logging.hpp"

#include <format>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>


static horn::free_variables
_union(std::span<const horn::free_variables> sets)
{
  horn::free_variables result;
  for (const horn::free_variables &fvs : sets)
    result.insert(fvs.begin(), fvs.end());
  return result;
}


horn::environment
horn::fresh_environment(const free_variables &fvs)
{
  environment env;
  env.reserve(fvs.size());
  for (const std::string &name : fvs)
    env.emplace(global_string(name), var(name));
  return env;
}


horn::compiled_term
horn::make_variable(std::string_view name)
{
  const std::string_view gname = global_string(name);
  return {
    .fvs = {std::string {name}},
    .ev = [gname](const database&, arguments, environment &env) -> value {
      const auto it = env.find(gname);
      if (it == env.end())
        throw std::logic_error {
            std::format("variable {} is missing from the environment", gname)};
      return it->second;
    },
  };
}


horn::compiled_term
horn::make_anonymous(std::string_view name)
{
  const std::string_view gname = global_string(name);
  return {
    .fvs = {},
    .ev = [gname](const database&, arguments, environment&) -> value {
      return var(gname);
    },
  };
}


horn::compiled_term
horn::make_literal(long number)
{
  return {
    .fvs = {},
    .ev = [number](const database&, arguments, environment&) -> value {
      return num(number);
    },
  };
}


horn::compiled_term
horn::make_literal(std::string_view string)
{
  return {
    .fvs = {},
    .ev = [string = std::string {string}](const database&, arguments,
                                          environment&) -> value {
      return str(string);
    },
  };
}


horn::compiled_term
horn::make_compound(std::string_view symbol, compiled_terms args)
{
  const std::string_view gsymbol = global_string(symbol);
  return {
    .fvs = args.fvs,
    .ev = [gsymbol, args = std::move(args.ev)](const database &db,
                                               arguments params,
                                               environment &env) -> value {
      return compound(gsymbol, args(db, params, env));
    },
  };
}


horn::compiled_term
horn::make_list(compiled_terms elements)
{
  return {
    .fvs = elements.fvs,
    .ev = [elements = std::move(elements.ev)](const database &db,
                                              arguments params,
                                              environment &env) -> value {
      return make_list(elements(db, params, env));
    },
  };
}


horn::compiled_terms
horn::collect(std::span<const compiled_term> terms)
{
  std::vector<free_variables> sets;
  std::vector<evaluator<value>> evs;
  sets.reserve(terms.size());
  evs.reserve(terms.size());
  for (const compiled_term &term : terms)
  {
    sets.push_back(term.fvs);
    evs.push_back(term.ev);
  }

  return {
    .fvs = _union(sets),
    .ev = [evs = std::move(evs)](const database &db, arguments params,
                                 environment &env) {
      stl::vector<value> result;
      result.reserve(evs.size());
      for (const evaluator<value> &ev : evs)
        result.push_back(ev(db, params, env));
      return result;
    },
  };
}


////////////////////////////////////////////////////////////////////////////////
//
//                                Calls
//
horn::goal
horn::call_thunk::force() const
{
  if (global_flags.contains("DebugCall"))
  {
    std::ostringstream buf;
    describe(buf);
    debug("call {}", buf.str());
  }
  return m_db->invoke(m_symbol, args(), m_location);
}


void
horn::call_thunk::describe(std::ostream &os) const
{
  os << '(' << m_symbol;
  for (const value x : args())
    os << ' ' << x;
  os << ')';
}


horn::compiled_goal
horn::make_call(std::string_view symbol, compiled_terms args,
                std::optional<source_location> location)
{
  const std::string_view gsymbol = global_string(symbol);
  std::shared_ptr<const source_location> where;
  if (location)
    where = std::make_shared<const source_location>(std::move(*location));

  return {
    .fvs = args.fvs,
    .ev = [gsymbol, args = std::move(args.ev), where](
              const database &db, arguments params, environment &env) -> goal {
      const stl::vector<value> vals = args(db, params, env);
      value *argv = nullptr;
      if (not vals.empty())
      {
        argv = static_cast<value*>(allocate(vals.size() * sizeof(value)));
        std::uninitialized_copy(vals.begin(), vals.end(), argv);
      }
      return suspend(make<call_thunk>(&db, gsymbol, argv, vals.size(),
                                      where.get()));
    },
  };
}


horn::compiled_goal
horn::make_calls(std::span<const compiled_goal> calls)
{
  std::vector<free_variables> sets;
  std::vector<evaluator<goal>> evs;
  sets.reserve(calls.size());
  evs.reserve(calls.size());
  for (const compiled_goal &call : calls)
  {
    sets.push_back(call.fvs);
    evs.push_back(call.ev);
  }

  return {
    .fvs = _union(sets),
    .ev = [evs = std::move(evs)](const database &db, arguments params,
                                 environment &env) -> goal {
      stl::vector<goal> goals;
      goals.reserve(evs.size());
      for (const evaluator<goal> &ev : evs)
        goals.push_back(ev(db, params, env));
      return conj_all(goals);
    },
  };
}
