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


#include "horn/logging.hpp"
#include "horn/parser.hpp"
#include "horn/program.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>


using namespace horn;


static const char lists_program[] = R"(
  Member x (Cons x _).
  Member x (Cons _ rest) <- Member x rest.

  Append [] ys ys.
  Append (Cons x xs) ys (Cons x zs) <- Append xs ys zs.
)";


static std::vector<std::string>
answers(solutions sols)
{
  std::vector<std::string> result;
  for (const solution &sol : sols)
    result.push_back(sol.to_string());
  return result;
}


class ProgramTest: public ::testing::Test {
  protected:
  const program prog = program::load(lists_program, "lists");

  std::vector<std::string>
  ask(std::string_view text,
      std::optional<std::vector<std::string>> vars = std::nullopt,
      std::optional<size_t> limit = std::nullopt) const
  { return answers(prog.query(text, std::move(vars), limit)); }
};


TEST_F(ProgramTest, Symbols)
{
  EXPECT_EQ(prog.symbols(), (std::vector<std::string> {"Append", "Member"}));
  ASSERT_NE(prog.db().find("Member"), nullptr);
  EXPECT_EQ(prog.db().find("Member")->clauses().size(), 2u);
  EXPECT_EQ(prog.db().find("Nope"), nullptr);
}

TEST_F(ProgramTest, MemberOfList)
{
  EXPECT_EQ(ask("Member x [5, 7]"),
            (std::vector<std::string> {"x: 5", "x: 7"}));
  EXPECT_EQ(ask("Member x [22, 137]"),
            (std::vector<std::string> {"x: 22", "x: 137"}));
}

TEST_F(ProgramTest, ExplicitConsIsAList)
{
  EXPECT_EQ(ask("Member x (Cons 5 [])"), (std::vector<std::string> {"x: 5"}));
  EXPECT_EQ(ask("Member x (Cons 5 Nil)"), (std::vector<std::string> {"x: 5"}));
}

TEST_F(ProgramTest, NoSolutions)
{
  EXPECT_TRUE(ask("Member q []").empty());
  EXPECT_TRUE(ask("Member 3 [1, 2]").empty());
}

TEST_F(ProgramTest, GroundQuery)
{
  // No variables: one empty solution per proof
  const std::vector<std::string> result = ask("Member 2 [1, 2]");
  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result[0], "");
}

TEST_F(ProgramTest, UnboundElementIsShared)
{
  EXPECT_EQ(ask("Member x [a]"),
            (std::vector<std::string> {"a: _.0; x: _.0"}));
}

TEST_F(ProgramTest, InfiniteRelationWithLimit)
{
  EXPECT_EQ(ask("Member x a", std::nullopt, 3),
            (std::vector<std::string> {
                "a: (Cons _.0 _.1); x: _.0",
                "a: (Cons _.0 (Cons _.1 _.2)); x: _.0",
                "a: (Cons _.0 (Cons _.1 (Cons _.2 _.3))); x: _.0",
            }));
}

TEST_F(ProgramTest, InfiniteRelationConsumedLazily)
{
  solutions sols = prog.query("Member x a");
  for (size_t i = 0; i < 5; ++i)
  {
    const std::optional<solution> sol = sols.next();
    ASSERT_TRUE(sol);
    EXPECT_EQ(length(sol->at("a")), i + 1);
  }
  EXPECT_EQ(sols.count(), 5u);
}

TEST_F(ProgramTest, LimitStopsTheSearch)
{
  solutions sols = prog.query("Member x [1, 2, 3]", std::nullopt, 1);
  ASSERT_TRUE(sols.next());
  const size_t steps = sols.steps();
  EXPECT_FALSE(sols.next());
  EXPECT_EQ(sols.steps(), steps);

  EXPECT_TRUE(ask("Member x [1, 2, 3]", std::nullopt, 0).empty());
  EXPECT_EQ(ask("Member x [1, 2, 3]", std::nullopt, 10).size(), 3u);
}

TEST_F(ProgramTest, ConjunctionIntersects)
{
  EXPECT_EQ(ask("Member x [5, 7], Member x [7, 8]"),
            (std::vector<std::string> {"x: 7"}));
  EXPECT_TRUE(ask("Member x [1], Member x [2]").empty());
}

TEST_F(ProgramTest, AppendForward)
{
  EXPECT_EQ(ask("Append [1, 2] [3] z"),
            (std::vector<std::string> {"z: [1, 2, 3]"}));
  EXPECT_EQ(ask("Append [] [] z"), (std::vector<std::string> {"z: []"}));
}

TEST_F(ProgramTest, AppendBackward)
{
  EXPECT_EQ(ask("Append x y [1, 2]"),
            (std::vector<std::string> {
                "x: []; y: [1, 2]",
                "x: [1]; y: [2]",
                "x: [1, 2]; y: []",
            }));
  EXPECT_EQ(ask("Append x [3] [1, 2, 3]"),
            (std::vector<std::string> {"x: [1, 2]"}));
}

TEST_F(ProgramTest, AppendOpenTail)
{
  EXPECT_EQ(ask("Append [1] y z", std::nullopt, 1),
            (std::vector<std::string> {"y: _.0; z: (Cons 1 _.0)"}));
}

TEST_F(ProgramTest, RequestedVariables)
{
  EXPECT_EQ(ask("Member x [a]", std::vector<std::string> {"x"}),
            (std::vector<std::string> {"x: _.0"}));
  EXPECT_EQ(ask("Member x [a]", std::vector<std::string> {"x", "a"}),
            (std::vector<std::string> {"x: _.0; a: _.0"}));
  EXPECT_EQ(answers(prog.query("Append x y [1]", "y")),
            (std::vector<std::string> {"y: [1]", "y: []"}));
  EXPECT_THROW((void)prog.query("Member x [1]", "y"), std::invalid_argument);
}

TEST_F(ProgramTest, SplitVariables)
{
  EXPECT_EQ(split_variables("  a b\tc "),
            (std::vector<std::string> {"a", "b", "c"}));
  EXPECT_TRUE(split_variables("").empty());
}

TEST_F(ProgramTest, SolutionAccess)
{
  solutions sols = prog.query("Append x y [1]");
  EXPECT_EQ(sols.names(), (std::vector<std::string> {"x", "y"}));
  const std::optional<solution> sol = sols.next();
  ASSERT_TRUE(sol);
  EXPECT_EQ(sol->size(), 2u);
  EXPECT_TRUE(sol->contains("x"));
  EXPECT_FALSE(sol->contains("z"));
  EXPECT_TRUE(isnil(sol->at("x")));
  EXPECT_EQ(to_string(sol->at("y")), "[1]");
  EXPECT_THROW((void)sol->at("z"), std::out_of_range);
}

TEST_F(ProgramTest, StringsAndNumbers)
{
  EXPECT_EQ(ask("Member x [\"a b\", 2, Red]"),
            (std::vector<std::string> {"x: \"a b\"", "x: 2", "x: Red"}));
}

TEST_F(ProgramTest, PrintQuery)
{
  std::ostringstream buf;
  EXPECT_EQ(prog.print_query(buf, "Member x [5, 7]"), 2u);
  EXPECT_EQ(buf.str(), "x: 5\nx: 7\n");

  std::ostringstream none;
  EXPECT_EQ(prog.print_query(none, "Member x []"), 0u);
  EXPECT_EQ(none.str(), "");
}

TEST_F(ProgramTest, UndefinedRelationInQuery)
{
  EXPECT_THROW((void)prog.query("Nope x"), undefined_relation);
  EXPECT_THROW((void)prog.query("Member x [1], Nope x"), undefined_relation);

  try
  {
    (void)prog.query("Member x [1], Nope x");
    FAIL() << "expected undefined_relation";
  }
  catch (const undefined_relation &exn)
  {
    EXPECT_EQ(exn.symbol(), "Nope");
    ASSERT_TRUE(exn.location());
    EXPECT_EQ(exn.location()->column, 15u);
  }
}

TEST_F(ProgramTest, UndefinedRelationInBody)
{
  const program p = program::load("Foo x <- Bar x.");
  solutions sols = p.query("Foo x");
  EXPECT_THROW((void)sols.next(), undefined_relation);
}

TEST_F(ProgramTest, ErrorReportQuotesOnlyItsOwnSource)
{
  const program p = program::load("Foo x <- Bar x.", "foo.horn");

  // Rule body location: offsets refer to foo.horn, not to the query
  const std::string text = "Foo xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx";
  solutions sols = p.query(text);
  try
  {
    (void)sols.next();
    FAIL() << "expected undefined_relation";
  }
  catch (const undefined_relation &exn)
  {
    ASSERT_TRUE(exn.location());
    EXPECT_EQ(exn.location()->source, "foo.horn");
    EXPECT_EQ(strip_escape_sequences(exn.display(text, query_source)),
              "undefined relation: Bar\nfoo.horn:1:10");
  }

  // Query location: the query is quoted
  const std::string query = "Member x [1], Nope x";
  try
  {
    (void)prog.query(query);
    FAIL() << "expected undefined_relation";
  }
  catch (const undefined_relation &exn)
  {
    const std::string report =
        strip_escape_sequences(exn.display(query, query_source));
    EXPECT_NE(report.find("<query>:1:15\n  Member x [1], Nope x"),
              std::string::npos)
        << report;
  }
}

TEST_F(ProgramTest, EmptyProgram)
{
  const program empty;
  EXPECT_TRUE(empty.symbols().empty());
  EXPECT_THROW((void)empty.query("Member x [1]"), undefined_relation);
}

TEST_F(ProgramTest, SyntaxErrorsPropagate)
{
  EXPECT_THROW((void)prog.query("Member x ["), syntax_error);
  EXPECT_THROW((void)prog.query("Member x [1]."), unconsumed_input);
  EXPECT_THROW((void)program::load("Member x"), syntax_error);
}

TEST_F(ProgramTest, ClauseOrderDoesNotChangeSolutions)
{
  const program forward = program::load("Color Red. Color Blue.");
  const program backward = program::load("Color Blue. Color Red.");

  std::vector<std::string> a = answers(forward.query("Color c"));
  std::vector<std::string> b = answers(backward.query("Color c"));
  EXPECT_EQ(a, (std::vector<std::string> {"c: Red", "c: Blue"}));
  EXPECT_EQ(b, (std::vector<std::string> {"c: Blue", "c: Red"}));

  std::sort(a.begin(), a.end());
  std::sort(b.begin(), b.end());
  EXPECT_EQ(a, b);
}

TEST_F(ProgramTest, ClausesTriedInDeclarationOrder)
{
  const program p = program::load(R"(
    Digit 1.
    Other 9.
    Digit 2.
    Digit 3.
  )");
  EXPECT_EQ(answers(p.query("Digit d")),
            (std::vector<std::string> {"d: 1", "d: 2", "d: 3"}));
}

TEST_F(ProgramTest, QueriesAreIsolated)
{
  solutions first = prog.query("Member x a");
  solutions second = prog.query("Member x [1]");

  // Interleave both searches
  const std::optional<solution> a1 = first.next();
  const std::optional<solution> b1 = second.next();
  const std::optional<solution> a2 = first.next();
  ASSERT_TRUE(a1 and b1 and a2);

  EXPECT_EQ(a1->to_string(), "a: (Cons _.0 _.1); x: _.0");
  EXPECT_EQ(b1->to_string(), "x: 1");
  EXPECT_EQ(a2->to_string(), "a: (Cons _.0 (Cons _.1 _.2)); x: _.0");

  // Running a query again gives the same answers
  EXPECT_EQ(ask("Member x a", std::nullopt, 2), ask("Member x a", std::nullopt, 2));
}

TEST_F(ProgramTest, AnonymousVariablesInQuery)
{
  EXPECT_EQ(ask("Member _ [1, 2]").size(), 2u);
  EXPECT_EQ(ask("Append _ _ [1, 2]").size(), 3u);
}

TEST_F(ProgramTest, ReifiedTermsRoundTrip)
{
  const database db {};
  for (const solution &sol :
       prog.query("Append x y [1, (F \"s\" Red), [2, 3], []]"))
  {
    for (const auto &[name, val] : sol)
    {
      const std::string text = to_string(val);
      const compiled_term term = parse_term(text);
      ASSERT_TRUE(term.fvs.empty()) << text;
      environment env;
      EXPECT_EQ(term(db, {}, env), val) << text;
    }
  }
}


TEST(ProgramFileTest, LoadExampleFile)
{
  const program prog = program::load_file(HORN_EXAMPLES_DIR "/lists.horn");
  const std::vector<std::string> symbols = prog.symbols();
  EXPECT_NE(std::find(symbols.begin(), symbols.end(), "Reverse"),
            symbols.end());

  EXPECT_EQ(answers(prog.query("Reverse [1, 2, 3] r")),
            (std::vector<std::string> {"r: [3, 2, 1]"}));
  EXPECT_EQ(answers(prog.query("Length [A, B] n")),
            (std::vector<std::string> {"n: (S (S Z))"}));
  EXPECT_EQ(answers(prog.query("Last [1, 2, 3] x")),
            (std::vector<std::string> {"x: 3"}));

  std::vector<std::string> perms = answers(prog.query("Permutation [1, 2, 3] p"));
  std::sort(perms.begin(), perms.end());
  EXPECT_EQ(perms, (std::vector<std::string> {
                       "p: [1, 2, 3]", "p: [1, 3, 2]", "p: [2, 1, 3]",
                       "p: [2, 3, 1]", "p: [3, 1, 2]", "p: [3, 2, 1]"}));
}

TEST(ProgramFileTest, ZebraPuzzle)
{
  const program prog = program::load_file(HORN_EXAMPLES_DIR "/zebra.horn");
  EXPECT_EQ(answers(prog.query("Zebra owns hs", "owns", 1)),
            (std::vector<std::string> {"owns: German"}));
}

TEST(ProgramFileTest, MissingFile)
{
  EXPECT_THROW((void)program::load_file("/nonexistent/file.horn"),
               std::runtime_error);
}
