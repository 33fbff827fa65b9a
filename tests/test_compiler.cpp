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
#include "horn/compiler.hpp"
#include "horn/database.hpp"
#include "horn/parser.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>


using namespace horn;


class CompilerTest: public ::testing::Test {
  protected:
  const database db {};

  value
  eval(const compiled_term &term)
  {
    environment env = fresh_environment(term.fvs);
    return term(db, {}, env);
  }

  static size_t
  count_solutions(goal g, size_t max_steps = 10000)
  {
    answer_stream stream = run(g);
    size_t count = 0;
    for (size_t i = 0; i < max_steps and not stream.exhausted(); ++i)
    {
      if (stream.pull())
        count += 1;
    }
    return count;
  }
};


TEST_F(CompilerTest, Literals)
{
  EXPECT_TRUE(isnum(eval(make_literal(42L)), 42));
  EXPECT_EQ(str_view(eval(make_literal(std::string_view {"abc"}))), "abc");
  EXPECT_TRUE(make_literal(1L).fvs.empty());
}

TEST_F(CompilerTest, VariablesComeFromEnvironment)
{
  const compiled_term x = make_variable("x");
  EXPECT_EQ(x.fvs, (free_variables {"x"}));

  environment env = fresh_environment(x.fvs);
  const value a = x(db, {}, env);
  const value b = x(db, {}, env);
  EXPECT_TRUE(isvar(a));
  EXPECT_TRUE(is(a, b));

  environment other = fresh_environment(x.fvs);
  EXPECT_FALSE(is(a, x(db, {}, other)));
}

TEST_F(CompilerTest, MissingVariableIsAnError)
{
  const compiled_term x = make_variable("x");
  environment env;
  EXPECT_THROW((void)x(db, {}, env), std::logic_error);
}

TEST_F(CompilerTest, AnonymousVariablesAreAlwaysFresh)
{
  const compiled_term anon = make_anonymous("_");
  EXPECT_TRUE(anon.fvs.empty());

  environment env;
  const value a = anon(db, {}, env);
  const value b = anon(db, {}, env);
  EXPECT_TRUE(isvar(a));
  EXPECT_FALSE(is(a, b));

  // Two occurrences in one term are independent as well
  const compiled_term pair = parse_term("(P _ _)");
  const value p = eval(pair);
  EXPECT_FALSE(is(argument(p, 0), argument(p, 1)));
}

TEST_F(CompilerTest, CollectKeepsOrderAndUnitesVariables)
{
  const std::vector<compiled_term> terms {
      make_variable("b"), make_literal(1L), make_variable("a"),
      make_variable("b")};
  const compiled_terms all = collect(terms);
  EXPECT_EQ(all.fvs, (free_variables {"a", "b"}));

  environment env = fresh_environment(all.fvs);
  const stl::vector<value> vals = all(db, {}, env);
  ASSERT_EQ(vals.size(), 4u);
  EXPECT_EQ(var_name(vals[0]), "b");
  EXPECT_TRUE(isnum(vals[1], 1));
  EXPECT_EQ(var_name(vals[2]), "a");
  EXPECT_TRUE(is(vals[0], vals[3]));
}

TEST_F(CompilerTest, CompoundsAndLists)
{
  const std::vector<compiled_term> args {make_literal(1L), make_variable("x")};
  const compiled_term f = make_compound("F", collect(args));
  EXPECT_EQ(f.fvs, (free_variables {"x"}));
  EXPECT_EQ(to_string(eval(f)), "(F 1 x)");

  const compiled_term l = make_list(collect(args));
  EXPECT_EQ(to_string(eval(l)), "[1, x]");

  const compiled_term empty = make_list(collect({}));
  EXPECT_TRUE(isnil(eval(empty)));

  const compiled_term atom = make_compound("Red", collect({}));
  EXPECT_TRUE(isatom(eval(atom), "Red"));
}

TEST_F(CompilerTest, CallsAreSuspended)
{
  // Nothing is looked up until the suspension is forced
  const std::vector<compiled_term> args {make_literal(1L)};
  const compiled_goal call = make_call("Undefined", collect(args));
  environment env;
  const goal g = call(db, {}, env);
  ASSERT_EQ(g.kind(), goal_kind::suspend);

  const auto thunk = dynamic_cast<const call_thunk*>(g.node()->delayed);
  ASSERT_NE(thunk, nullptr);
  EXPECT_EQ(thunk->symbol(), "Undefined");
  ASSERT_EQ(thunk->args().size(), 1u);
  EXPECT_TRUE(isnum(thunk->args()[0], 1));

  EXPECT_THROW((void)thunk->force(), undefined_relation);
}

TEST_F(CompilerTest, EmptyConjunctionSucceeds)
{
  const compiled_goal none = make_calls({});
  environment env;
  EXPECT_EQ(none(db, {}, env).kind(), goal_kind::succeed);
}

TEST_F(CompilerTest, FactMatchesArguments)
{
  // Pair x x.
  const std::vector<compiled_term> head {make_variable("x"),
                                         make_variable("x")};
  const clause pair = make_fact(collect(head));
  EXPECT_EQ(pair.fvs, (free_variables {"x"}));

  const auto solve = [&](std::initializer_list<value> args) {
    environment env = fresh_environment(pair.fvs);
    const stl::vector<value> argv {args};
    return count_solutions(horn::evaluate(pair, db, argv, env));
  };
  EXPECT_EQ(solve({num(1), num(1)}), 1u);
  EXPECT_EQ(solve({num(1), num(2)}), 0u);
  // Arity mismatch is an ordinary failure
  EXPECT_EQ(solve({num(1)}), 0u);
  EXPECT_EQ(solve({num(1), num(1), num(1)}), 0u);
}

TEST_F(CompilerTest, RuleFreeVariablesIncludeBody)
{
  const std::vector<compiled_term> head {make_variable("x")};
  const std::vector<compiled_term> args {make_variable("x"),
                                         make_variable("y")};
  const std::vector<compiled_goal> calls {make_call("Foo", collect(args))};
  const clause c = make_rule(collect(head), make_calls(calls));
  EXPECT_EQ(c.fvs, (free_variables {"x", "y"}));
  EXPECT_TRUE(std::holds_alternative<rule>(c.form));
}
