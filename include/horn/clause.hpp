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

#include "horn/compiler.hpp"
#include "horn/source_location.hpp"

#include <string>
#include <variant>

/**
 * \file clause.hpp
 * Facts and rules
 *
 * \ingroup compiler
 */


namespace horn {

/**
 * Clause without a body
 *
 * \ingroup compiler
 */
struct fact {
  compiled_terms head;
}; // struct horn::fact

/**
 * Clause with a body, a conjunction of calls
 *
 * \ingroup compiler
 */
struct rule {
  compiled_terms head;
  compiled_goal body;
}; // struct horn::rule


/**
 * Single clause of a predicate
 *
 * \ingroup compiler
 */
struct clause {
  free_variables fvs; ///< All variables of the head and the body
  std::variant<fact, rule> form;
}; // struct horn::clause


/**
 * Clause from a head
 *
 * \ingroup compiler
 */
[[nodiscard]] clause
make_fact(compiled_terms head);

/**
 * Clause from a head and a body
 *
 * \ingroup compiler
 */
[[nodiscard]] clause
make_rule(compiled_terms head, compiled_goal body);


/**
 * Goal solving clause \p c for invocation with arguments \p args
 *
 * The arguments are unified with the head first; the body is only evaluated
 * in states where that succeeded. An arity mismatch is an ordinary failure.
 *
 * \param c Clause to evaluate
 * \param db Database to resolve calls of the body in
 * \param args Arguments of the invocation
 * \param env Environment holding every variable in `c.fvs`
 *
 * \ingroup compiler
 */
[[nodiscard]] goal
evaluate(const clause &c, const database &db, arguments args,
         environment &env);


/**
 * Clause together with the name of its predicate, as produced by the parser
 *
 * \ingroup compiler
 */
struct rule_definition {
  std::string symbol;
  clause body;
  source_location location;
}; // struct horn::rule_definition

} // namespace horn
