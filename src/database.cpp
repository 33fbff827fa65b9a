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


#include "horn/database.hpp"
#include "horn/logging.hpp"

#include <format>


horn::undefined_relation::undefined_relation(std::string_view symbol)
: bad_code {std::format("undefined relation: {}", symbol)},
  m_symbol {symbol}
{ }


horn::undefined_relation::undefined_relation(std::string_view symbol,
                                             const source_location &location)
: bad_code {std::format("undefined relation: {}", symbol), location},
  m_symbol {symbol}
{ }


horn::goal
horn::relation::operator () (const database &db, arguments args) const
{
  stl::vector<goal> alternatives;
  alternatives.reserve(m_clauses.size());
  for (const clause &c : m_clauses)
  {
    environment env = fresh_environment(c.fvs);
    alternatives.push_back(evaluate(c, db, args, env));
  }
  return disj_all(alternatives);
}


horn::database::database(std::span<const rule_definition> definitions)
{
  for (const rule_definition &def : definitions)
  {
    auto it = m_relations.find(def.symbol);
    if (it == m_relations.end())
      it = m_relations.emplace(def.symbol, relation {def.symbol}).first;
    it->second.add_clause(def.body);
  }
}


const horn::relation*
horn::database::find(std::string_view symbol) const noexcept
{
  const auto it = m_relations.find(symbol);
  return it == m_relations.end() ? nullptr : &it->second;
}


horn::goal
horn::database::invoke(std::string_view symbol, arguments args,
                       const source_location *location) const
{
  const relation *rel = find(symbol);
  if (rel == nullptr)
  {
    if (location)
      throw undefined_relation {symbol, *location};
    throw undefined_relation {symbol};
  }
  return (*rel)(*this, args);
}


std::vector<std::string>
horn::database::symbols() const
{
  std::vector<std::string> result;
  result.reserve(m_relations.size());
  for (const auto &[symbol, _] : m_relations)
    result.push_back(symbol);
  return result;
}


void
horn::database::for_each(const std::function<void(const relation&)> &f) const
{
  for (const auto &[_, rel] : m_relations)
    f(rel);
}
