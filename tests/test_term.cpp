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


#include "horn/format.hpp"
#include "horn/term.hpp"

#include <gtest/gtest.h>

#include <format>
#include <stdexcept>


using namespace horn;


TEST(TermTest, ConsAndNilAreCanonical)
{
  const value x = compound("Cons", {num(1), atom("Nil")});
  EXPECT_TRUE(iscons(x));
  EXPECT_TRUE(isnil(cdr(x)));
  EXPECT_TRUE(is(atom("Nil"), nil));
  EXPECT_EQ(functor(x), "Cons");
  EXPECT_EQ(arity(x), 2u);
  EXPECT_EQ(functor(nil), "Nil");
}

TEST(TermTest, ZeroArgumentCompoundIsAtom)
{
  const value x = compound("Red", std::span<const value> {});
  EXPECT_TRUE(isatom(x));
  EXPECT_TRUE(isatom(x, "Red"));
  EXPECT_EQ(arity(x), 0u);
}

TEST(TermTest, ConsWithOtherArityIsCompound)
{
  const value x = compound("Cons", {num(1)});
  EXPECT_TRUE(iscompound(x));
  EXPECT_FALSE(iscons(x));
}

TEST(TermTest, Arguments)
{
  const value x = compound("H", {atom("Red"), num(7), str("s")});
  EXPECT_EQ(arity(x), 3u);
  EXPECT_TRUE(isatom(argument(x, 0), "Red"));
  EXPECT_TRUE(isnum(argument(x, 1), 7));
  EXPECT_EQ(str_view(argument(x, 2)), "s");
  EXPECT_THROW((void)argument(x, 3), std::out_of_range);
  EXPECT_THROW((void)functor(num(1)), std::invalid_argument);
  EXPECT_THROW((void)car(nil), std::invalid_argument);
}

TEST(TermTest, ProperLists)
{
  EXPECT_TRUE(is_proper_list(nil));
  EXPECT_TRUE(is_proper_list(list(1, 2, 3)));
  EXPECT_FALSE(is_proper_list(cons(num(1), num(2))));
  EXPECT_FALSE(is_proper_list(cons(num(1), var("t"))));
  EXPECT_EQ(length(list(1, 2, 3)), 3u);
}

TEST(TermTest, MakeListKeepsOrder)
{
  const value elements[] = {num(1), num(2), num(3)};
  EXPECT_EQ(make_list(elements), list(1, 2, 3));
  EXPECT_EQ(make_list(elements, var("t"))->t, tag::cons);
  EXPECT_FALSE(is_proper_list(make_list(elements, var("t"))));
}

TEST(TermTest, StructuralEquality)
{
  EXPECT_EQ(compound("F", {num(1), list(2, 3)}),
            compound("F", {num(1), list(2, 3)}));
  EXPECT_NE(compound("F", {num(1)}), compound("G", {num(1)}));
  EXPECT_NE(compound("F", {num(1)}), compound("F", {num(1), num(2)}));
  EXPECT_EQ(str("abc"), str("abc"));
  EXPECT_NE(str("1"), num(1));

  // Variables are equal only to themselves
  const value x = var("x");
  EXPECT_EQ(x, x);
  EXPECT_NE(x, var("x"));
}

TEST(TermTest, VariablesHaveDistinctIdentities)
{
  const value a = var("x");
  const value b = var("x");
  EXPECT_EQ(var_name(a), var_name(b));
  EXPECT_NE(var_id(a), var_id(b));
}

TEST(TermTest, Printing)
{
  EXPECT_EQ(to_string(nil), "[]");
  EXPECT_EQ(to_string(atom("Red")), "Red");
  EXPECT_EQ(to_string(num(42)), "42");
  EXPECT_EQ(to_string(str("hi")), "\"hi\"");
  EXPECT_EQ(to_string(list(1, 2, 3)), "[1, 2, 3]");
  EXPECT_EQ(to_string(compound("H", {atom("Red"), list(1)})), "(H Red [1])");
  EXPECT_EQ(to_string(cons(num(1), var("_.0"))), "(Cons 1 _.0)");
  EXPECT_EQ(to_string(cons(num(1), cons(num(2), num(3)))),
            "(Cons 1 (Cons 2 3))");
  EXPECT_EQ(to_string(list(compound("F", {nil}))), "[(F [])]");
}

TEST(TermTest, Format)
{
  EXPECT_EQ(std::format("<{}>", list(1, 2)), "<[1, 2]>");
}
