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

#include "horn/term.hpp"
#include "horn/search.hpp"
#include "horn/source_location.hpp"
#include "horn/stl/vector.hpp"
#include "horn/stl/unordered_map.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>

/**
 * \file compiler.hpp
 * Compilation of terms and calls into evaluators
 *
 * Every syntactic term or call is compiled into a pair of the set of variable
 * names it mentions and an evaluator. Evaluators are ordinary functions of the
 * predicate database, the arguments of the current invocation and the variable
 * environment of the current clause activation. The constructors below are
 * used as semantic actions by the parser.
 *
 * Evaluators never capture terms: all terms are created when the evaluator
 * runs, so compiled code may live in memory the collector does not scan.
 *
 * \ingroup compiler
 */


namespace horn {

class database;


/**
 * Names of source variables referenced by a piece of code
 *
 * \ingroup compiler
 */
using free_variables = std::set<std::string>;

/**
 * Arguments of a predicate invocation
 *
 * \ingroup compiler
 */
using arguments = std::span<const value>;

/**
 * Mapping of source variable names to logic variables of one activation
 *
 * \ingroup compiler
 */
using environment = stl::unordered_map<std::string_view, value>;

template <typename Result>
using evaluator =
    std::function<Result(const database&, arguments, environment&)>;

/**
 * Result of compilation: free variables and the evaluator
 *
 * \ingroup compiler
 */
template <typename Result>
struct compiled {
  free_variables fvs;
  evaluator<Result> ev;

  Result
  operator () (const database &db, arguments args, environment &env) const
  { return ev(db, args, env); }
}; // struct horn::compiled

using compiled_term = compiled<value>;
using compiled_terms = compiled<stl::vector<value>>;
using compiled_goal = compiled<goal>;


/**
 * Create an environment with a fresh logic variable for every name in \p fvs
 *
 * \ingroup compiler
 */
[[nodiscard]] environment
fresh_environment(const free_variables &fvs);


/**
 * \name Term compilation
 * \{
 */

/**
 * Named variable; all occurrences within one activation are the same variable
 *
 * \ingroup compiler
 */
[[nodiscard]] compiled_term
make_variable(std::string_view name);

/**
 * Anonymous variable; a new variable on every evaluation
 *
 * \ingroup compiler
 */
[[nodiscard]] compiled_term
make_anonymous(std::string_view name);

/**
 * Integer literal
 *
 * \ingroup compiler
 */
[[nodiscard]] compiled_term
make_literal(long number);

/**
 * String literal
 *
 * \ingroup compiler
 */
[[nodiscard]] compiled_term
make_literal(std::string_view string);

/**
 * Compound term (or atom when \p args is empty); arguments are evaluated left
 * to right
 *
 * \ingroup compiler
 */
[[nodiscard]] compiled_term
make_compound(std::string_view symbol, compiled_terms args);

/**
 * List literal desugared into `Cons` pairs ending in `Nil`
 *
 * \ingroup compiler
 */
[[nodiscard]] compiled_term
make_list(compiled_terms elements);

/**
 * Combine several compiled terms into one producing all their values in order
 *
 * \ingroup compiler
 */
[[nodiscard]] compiled_terms
collect(std::span<const compiled_term> terms);

/** \} */


/**
 * \name Goal compilation
 * \{
 */

/**
 * Suspended invocation of a relation
 *
 * Created by the evaluator of a call; the relation is looked up and invoked
 * only when the search driver forces the suspension.
 *
 * \ingroup compiler
 */
class call_thunk: public thunk {
  public:
  call_thunk(const database *db, std::string_view symbol, const value *args,
             size_t nargs, const source_location *location)
  : m_db {db},
    m_symbol {symbol},
    m_args {args},
    m_nargs {nargs},
    m_location {location}
  { }

  goal
  force() const override;

  void
  describe(std::ostream &os) const override;

  /** Name of the called relation (interned, see `global_string()`) */
  std::string_view
  symbol() const noexcept
  { return m_symbol; }

  /** Arguments of the call */
  arguments
  args() const noexcept
  { return {m_args, m_nargs}; }

  /** Location of the call in the source text, if known */
  const source_location*
  location() const noexcept
  { return m_location; }

  private:
  const database *m_db;
  std::string_view m_symbol;
  const value *m_args;
  size_t m_nargs;
  const source_location *m_location;
}; // class horn::call_thunk


/**
 * Call of a relation with the given arguments
 *
 * \ingroup compiler
 */
[[nodiscard]] compiled_goal
make_call(std::string_view symbol, compiled_terms args,
          std::optional<source_location> location = std::nullopt);

/**
 * Conjunction of calls, folded right with `succeed()`
 *
 * \ingroup compiler
 */
[[nodiscard]] compiled_goal
make_calls(std::span<const compiled_goal> calls);

/** \} */

} // namespace horn
