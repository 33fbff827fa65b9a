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


#include "horn/clause.hpp"


horn::clause
horn::make_fact(compiled_terms head)
{
  free_variables fvs = head.fvs;
  return clause {std::move(fvs), fact {std::move(head)}};
}


horn::clause
horn::make_rule(compiled_terms head, compiled_goal body)
{
  free_variables fvs = head.fvs;
  fvs.insert(body.fvs.begin(), body.fvs.end());
  return clause {std::move(fvs), rule {std::move(head), std::move(body)}};
}


// Unify invocation arguments with the evaluated head as two lists, so that an
// arity mismatch simply fails
static horn::goal
_match_head(const horn::compiled_terms &head, const horn::database &db,
            horn::arguments args, horn::environment &env)
{
  using namespace horn;
  return eq(make_list(args), make_list(head(db, args, env)));
}


horn::goal
horn::evaluate(const clause &c, const database &db, arguments args,
               environment &env)
{
  struct visitor {
    const database &db;
    arguments args;
    environment &env;

    goal
    operator () (const fact &f) const
    { return _match_head(f.head, db, args, env); }

    goal
    operator () (const rule &r) const
    {
      const goal head = _match_head(r.head, db, args, env);
      return conj(head, r.body(db, args, env));
    }
  };

  return std::visit(visitor {db, args, env}, c.form);
}
