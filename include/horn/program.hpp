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
#include "horn/database.hpp"
#include "horn/query.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file program.hpp
 * Compiled programs and their queries
 *
 * Usage example:
 * ```
 * const horn::program prog = horn::program::load(R"(
 *   Member x (Cons x _).
 *   Member x (Cons _ rest) <- Member x rest.
 * )");
 * for (const horn::solution &sol : prog.query("Member x [5, 7]"))
 *   std::cout << sol.to_string() << std::endl;
 * ```
 *
 * \ingroup query
 */


namespace horn {

/**
 * Immutable predicate database with the query interface
 *
 * Copies share the database. Every query gets its own variables, so queries
 * never observe each other's bindings.
 *
 * \ingroup query
 */
class program {
  public:
  /**
   * Program without predicates
   */
  program();

  /**
   * Build program from rule definitions in declaration order
   */
  explicit program(std::span<const rule_definition> rules);

  /**
   * Parse and compile program text
   *
   * \throws syntax_error
   */
  static program
  load(std::string_view text, std::string_view source = "<string>");

  /**
   * Parse and compile a program file
   *
   * \throws std::runtime_error if the file can not be read
   * \throws syntax_error
   */
  static program
  load_file(const std::filesystem::path &path);

  /**
   * Run a query
   *
   * \param text Query text: comma-separated calls
   * \param vars Variables to report; all variables of the query in
   * lexicographical order by default
   * \param limit Maximal number of solutions
   * \return Lazy sequence of solutions
   *
   * \throws syntax_error
   * \throws undefined_relation if the query calls an undefined relation
   */
  [[nodiscard]] solutions
  query(std::string_view text,
        std::optional<std::vector<std::string>> vars = std::nullopt,
        std::optional<size_t> limit = std::nullopt) const;

  /**
   * Run a query reporting whitespace-separated variables \p vars
   */
  [[nodiscard]] solutions
  query(std::string_view text, std::string_view vars,
        std::optional<size_t> limit = std::nullopt) const;

  /**
   * Run a query and write every solution on its own line
   *
   * \return Number of solutions written
   */
  size_t
  print_query(std::ostream &os, std::string_view text,
              std::optional<std::vector<std::string>> vars = std::nullopt,
              std::optional<size_t> limit = std::nullopt) const;

  const database&
  db() const noexcept
  { return *m_db; }

  /**
   * Names of all predicates in lexicographical order
   */
  std::vector<std::string>
  symbols() const
  { return m_db->symbols(); }

  private:
  std::shared_ptr<const database> m_db;
}; // class horn::program


/**
 * Split a whitespace-separated list of variable names
 *
 * \ingroup query
 */
[[nodiscard]] std::vector<std::string>
split_variables(std::string_view vars);

} // namespace horn
