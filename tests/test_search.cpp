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


#include "horn/search.hpp"
#include "horn/stl/vector.hpp"
#include "horn/substitution.hpp"

#include <gtest/gtest.h>

#include <sstream>


using namespace horn;


namespace {

// Goal without solutions that never finishes
class never: public thunk {
  public:
  goal
  force() const override
  { return suspend(this); }

  void
  describe(std::ostream &os) const override
  { os << "never"; }
};

// Infinitely many solutions binding a variable to the same number
class repeat: public thunk {
  public:
  repeat(value x, long n): m_x {&*x}, m_n {n} { }

  goal
  force() const override
  { return disj(eq(value {m_x}, num(m_n)), suspend(this)); }

  void
  describe(std::ostream &os) const override
  { os << "repeat " << m_n; }

  private:
  object *m_x;
  long m_n;
};

// Succeeds once; counts how many times it was forced
class counting: public thunk {
  public:
  goal
  force() const override
  {
    forced += 1;
    return succeed();
  }

  void
  describe(std::ostream &os) const override
  { os << "counting"; }

  mutable size_t forced = 0;
};

} // anonymous namespace


static stl::vector<substitution>
take(answer_stream &stream, size_t n, size_t max_steps = 10000)
{
  stl::vector<substitution> result;
  for (size_t i = 0;
       i < max_steps and result.size() < n and not stream.exhausted(); ++i)
  {
    if (const auto s = stream.pull())
      result.push_back(*s);
  }
  return result;
}


TEST(SearchTest, SucceedAndFail)
{
  answer_stream yes = run(succeed());
  EXPECT_EQ(take(yes, 10).size(), 1u);
  EXPECT_TRUE(yes.exhausted());

  answer_stream no = run(fail());
  EXPECT_EQ(take(no, 10).size(), 0u);
  EXPECT_TRUE(no.exhausted());
}

TEST(SearchTest, Unification)
{
  const value x = var("x");
  answer_stream stream = run(eq(x, num(1)));
  const auto result = take(stream, 10);
  ASSERT_EQ(result.size(), 1u);
  EXPECT_TRUE(isnum(result[0].walk(x), 1));

  answer_stream mismatch = run(eq(num(1), num(2)));
  EXPECT_TRUE(take(mismatch, 10).empty());
}

TEST(SearchTest, ConjunctionThreadsState)
{
  const value x = var("x");
  const value y = var("y");
  answer_stream stream = run(conj(eq(x, num(1)), eq(y, x)));
  const auto result = take(stream, 10);
  ASSERT_EQ(result.size(), 1u);
  EXPECT_TRUE(isnum(result[0].walk(y), 1));

  answer_stream conflict = run(conj(eq(x, num(1)), eq(x, num(2))));
  EXPECT_TRUE(take(conflict, 10).empty());
}

TEST(SearchTest, DisjunctionKeepsOrder)
{
  const value x = var("x");
  answer_stream stream = run(disj(eq(x, num(1)), eq(x, num(2))));
  const auto result = take(stream, 10);
  ASSERT_EQ(result.size(), 2u);
  EXPECT_TRUE(isnum(result[0].walk(x), 1));
  EXPECT_TRUE(isnum(result[1].walk(x), 2));
}

TEST(SearchTest, FoldIdentities)
{
  answer_stream all = run(conj_all({}));
  EXPECT_EQ(take(all, 10).size(), 1u);

  answer_stream any = run(disj_all({}));
  EXPECT_TRUE(take(any, 10).empty());
}

TEST(SearchTest, DisjunctionIsFairToInfiniteBranches)
{
  const value x = var("x");
  answer_stream stream = run(disj(suspend(make<never>()), eq(x, num(7))));
  const auto result = take(stream, 1);
  ASSERT_EQ(result.size(), 1u);
  EXPECT_TRUE(isnum(result[0].walk(x), 7));
}

TEST(SearchTest, DisjunctionInterleavesInfiniteStreams)
{
  const value x = var("x");
  const goal ones = suspend(make<repeat>(x, 1));
  const goal twos = suspend(make<repeat>(x, 2));
  answer_stream stream = run(disj(ones, twos));

  size_t nones = 0, ntwos = 0;
  for (const substitution &s : take(stream, 10))
  {
    if (isnum(s.walk(x), 1))
      nones += 1;
    else if (isnum(s.walk(x), 2))
      ntwos += 1;
  }
  EXPECT_GE(nones, 3u);
  EXPECT_GE(ntwos, 3u);
}

TEST(SearchTest, ConjunctionWithInfiniteFirstGoal)
{
  const value x = var("x");
  const value y = var("y");
  const goal g = conj(suspend(make<repeat>(x, 1)), eq(y, x));
  answer_stream stream = run(g);
  const auto result = take(stream, 3);
  ASSERT_EQ(result.size(), 3u);
  for (const substitution &s : result)
    EXPECT_TRUE(isnum(s.walk(y), 1));
}

TEST(SearchTest, SuspensionIsLazyAndForcedOnce)
{
  counting *c = make<counting>();
  answer_stream stream = run(conj(suspend(c), succeed()));
  EXPECT_EQ(c->forced, 0u);
  EXPECT_EQ(take(stream, 10).size(), 1u);
  EXPECT_EQ(c->forced, 1u);
}

TEST(SearchTest, StepsProduceNoResultMarkers)
{
  answer_stream stream = run(suspend(make<counting>()));
  // First step forces the suspension without producing a state
  EXPECT_FALSE(stream.pull());
  EXPECT_EQ(stream.steps(), 1u);
}

TEST(SearchTest, WriteGoal)
{
  const value x = var("x");
  std::ostringstream buf;
  write(buf, disj(conj(eq(x, num(1)), succeed()), suspend(make<never>())));
  EXPECT_EQ(buf.str(), "(or (and (= x 1) succeed) (delay never))");
}
