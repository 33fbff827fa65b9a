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
#include "horn/substitution.hpp"

#include <optional>
#include <ostream>
#include <span>

/**
 * \file search.hpp
 * Goals and the lazy search driver
 *
 * A goal is an immutable description of a search problem built from unification,
 * conjunction, disjunction and suspension. Running a goal against a binding
 * state yields a lazy stream of states satisfying it. The stream is advanced
 * one bounded step at a time; a step that does not complete a solution yields
 * a no-result marker instead.
 *
 * Fairness: disjunction alternates between its branches after every step, and
 * conjunction interleaves solving the continuation for an already produced
 * state with producing further states of its first goal. Neither an infinite
 * branch nor an infinite continuation can starve the others.
 *
 * \ingroup engine
 */


namespace horn {

class goal;


/**
 * Deferred construction of a goal
 *
 * Thunks are allocated on the GC heap (see `make()`) and forced by the search
 * driver exactly once per suspension it starts.
 *
 * \ingroup engine
 */
class thunk {
  public:
  virtual ~thunk() = default;

  /**
   * Produce the suspended goal
   */
  [[nodiscard]] virtual goal
  force() const = 0;

  /**
   * Write a short description for diagnostics
   */
  virtual void
  describe(std::ostream &os) const = 0;
}; // class horn::thunk


/**
 * Kinds of goals
 *
 * \ingroup engine
 */
enum class goal_kind {
  succeed, /**< Always succeeds once */
  fail,    /**< Never succeeds */
  unify,   /**< Succeeds if two terms can be made equal */
  conj,    /**< Both subgoals on the same branch */
  disj,    /**< Either subgoal */
  suspend, /**< Goal produced by a thunk when the driver gets to it */
};


struct goal_node {
  goal_kind kind;
  object *lhs, *rhs;
  const goal_node *first, *second;
  const thunk *delayed;
}; // struct horn::goal_node


/**
 * Reference to an immutable goal
 *
 * \ingroup engine
 */
class goal {
  public:
  explicit goal(const goal_node *node) noexcept: m_node {node} { }

  goal_kind
  kind() const noexcept
  { return m_node->kind; }

  const goal_node*
  node() const noexcept
  { return m_node; }

  private:
  const goal_node *m_node;
}; // class horn::goal


/**
 * \name Goal constructors
 * \{
 */

/**
 * Identity of conjunction
 *
 * \ingroup engine
 */
[[nodiscard]] goal
succeed();

/**
 * Identity of disjunction
 *
 * \ingroup engine
 */
[[nodiscard]] goal
fail();

/**
 * Unification of two terms
 *
 * \ingroup engine
 */
[[nodiscard]] goal
eq(value a, value b);

/**
 * Conjunction: \p g2 is solved in every state produced by \p g1
 *
 * \ingroup engine
 */
[[nodiscard]] goal
conj(goal g1, goal g2);

/**
 * Disjunction: states of both goals contribute
 *
 * \ingroup engine
 */
[[nodiscard]] goal
disj(goal g1, goal g2);

/**
 * Suspension of a goal until the search driver reaches it
 *
 * \ingroup engine
 */
[[nodiscard]] goal
suspend(const thunk *delayed);

/**
 * Conjunction of a sequence, folded right with `succeed()`
 *
 * \ingroup engine
 */
[[nodiscard]] goal
conj_all(std::span<const goal> goals);

/**
 * Disjunction of a sequence, folded right with `fail()`
 *
 * \ingroup engine
 */
[[nodiscard]] goal
disj_all(std::span<const goal> goals);

/** \} */


/**
 * Write a goal for diagnostics
 *
 * \ingroup engine
 */
void
write(std::ostream &os, goal g);


struct stream_node;

/**
 * Lazy stream of states satisfying a goal
 *
 * \note The stream references GC memory; keep it on the stack or inside
 * memory visible to the collector (see `root_ptr`).
 *
 * \ingroup engine
 */
class answer_stream {
  public:
  /**
   * Start solving \p g from state \p s
   */
  explicit answer_stream(goal g, const substitution &s = empty_state());

  /**
   * Whether no more states will ever be produced
   */
  bool
  exhausted() const noexcept;

  /**
   * Perform one step of the search
   *
   * \return Next state, or nothing when the step produced no result (this is
   * also the case once the stream is exhausted)
   */
  std::optional<substitution>
  pull();

  /**
   * Number of search steps performed so far
   */
  size_t
  steps() const noexcept
  { return m_steps; }

  private:
  const stream_node *m_current;
  size_t m_steps;
}; // class horn::answer_stream


/**
 * Run a goal
 *
 * \param g Goal to solve
 * \param s Initial state
 * \return Lazy stream of states satisfying \p g
 *
 * \ingroup engine
 */
[[nodiscard]] inline answer_stream
run(goal g, const substitution &s = empty_state())
{ return answer_stream {g, s}; }

} // namespace horn
