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


#pragma once

#include "horn/clause.hpp"
#include "horn/exceptions.hpp"

#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file database.hpp
 * Predicate database
 *
 * \ingroup compiler
 */


namespace horn {

/**
 * Call of a predicate that has no clauses
 *
 * \ingroup compiler
 */
struct undefined_relation: public bad_code {
  explicit undefined_relation(std::string_view symbol);
  undefined_relation(std::string_view symbol, const source_location &location);

  const std::string&
  symbol() const noexcept
  { return m_symbol; }

  private:
  std::string m_symbol;
}; // struct horn::undefined_relation


/**
 * All clauses of one predicate in declaration order
 *
 * \ingroup compiler
 */
class relation {
  public:
  explicit relation(std::string_view symbol): m_symbol {symbol} { }

  const std::string&
  symbol() const noexcept
  { return m_symbol; }

  const std::vector<clause>&
  clauses() const noexcept
  { return m_clauses; }

  void
  add_clause(clause c)
  { m_clauses.emplace_back(std::move(c)); }

  /**
   * Goal solving the predicate for arguments \p args
   *
   * Every clause gets its own fresh environment; clause goals are combined by
   * disjunction in declaration order.
   */
  [[nodiscard]] goal
  operator () (const database &db, arguments args) const;

  private:
  std::string m_symbol;
  std::vector<clause> m_clauses;
}; // class horn::relation


/**
 * Mapping of predicate names to relations
 *
 * Built once, immutable afterwards.
 *
 * \ingroup compiler
 */
class database {
  public:
  database() = default;

  /**
   * Build database from rule definitions, grouping them by symbol
   */
  explicit database(std::span<const rule_definition> definitions);

  database(const database&) = delete;
  void operator = (const database&) = delete;

  /**
   * Find relation by name
   *
   * \return Pointer to the relation or nullptr
   */
  const relation*
  find(std::string_view symbol) const noexcept;

  /**
   * Goal invoking a relation
   *
   * \throws undefined_relation if there is no relation named \p symbol
   */
  [[nodiscard]] goal
  invoke(std::string_view symbol, arguments args,
         const source_location *location = nullptr) const;

  size_t
  size() const noexcept
  { return m_relations.size(); }

  /**
   * Names of all relations in lexicographical order
   */
  std::vector<std::string>
  symbols() const;

  /**
   * Iterate over all relations in lexicographical order of their names
   */
  void
  for_each(const std::function<void(const relation&)> &f) const;

  private:
  std::map<std::string, relation, std::less<>> m_relations;
}; // class horn::database

} // namespace horn
