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
#include "horn/database.hpp"
#include "horn/memory.hpp"
#include "horn/search.hpp"
#include "horn/stl/vector.hpp"
#include "horn/term.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * \file query.hpp
 * Solutions of a query
 *
 * \ingroup query
 */


namespace horn {

/**
 * Values of the requested variables in one solution
 *
 * \ingroup query
 */
class solution {
  public:
  using binding = std::pair<std::string, value>;
  using const_iterator = stl::vector<binding>::const_iterator;

  void
  add(std::string_view name, value val)
  { m_bindings.emplace_back(std::string {name}, val); }

  /**
   * Value of a variable
   *
   * \throws std::out_of_range if \p name is not part of the solution
   */
  value
  at(std::string_view name) const;

  bool
  contains(std::string_view name) const noexcept;

  size_t
  size() const noexcept
  { return m_bindings.size(); }

  const_iterator
  begin() const noexcept
  { return m_bindings.begin(); }

  const_iterator
  end() const noexcept
  { return m_bindings.end(); }

  /**
   * Render as `name: value` pairs joined by "; "
   */
  std::string
  to_string() const;

  private:
  stl::vector<binding> m_bindings;
}; // class horn::solution


/**
 * Lazy sequence of solutions of a query
 *
 * Nothing is searched for until a solution is requested; once the limit is
 * reached no further search is performed.
 *
 * \ingroup query
 */
class solutions {
  struct state {
    std::shared_ptr<const database> db;
    compiled_goal query; // owns call locations referenced by the goal
    answer_stream stream;
    stl::vector<value> vars;
    std::vector<std::string> names;
    std::optional<size_t> limit;
    size_t count;
  }; // struct horn::solutions::state

  public:
  class iterator {
    public:
    using iterator_category = std::input_iterator_tag;
    using value_type = solution;
    using difference_type = std::ptrdiff_t;
    using pointer = const solution*;
    using reference = const solution&;

    iterator() = default;

    explicit iterator(solutions *owner)
    : m_owner {owner}
    { ++*this; }

    const solution&
    operator * () const noexcept
    { return *m_current; }

    const solution*
    operator -> () const noexcept
    { return &*m_current; }

    iterator&
    operator ++ ()
    {
      m_current = m_owner->next();
      return *this;
    }

    void
    operator ++ (int)
    { ++*this; }

    friend bool
    operator == (const iterator &it, std::default_sentinel_t) noexcept
    { return not it.m_current.has_value(); }

    private:
    solutions *m_owner = nullptr;
    std::optional<solution> m_current;
  }; // class horn::solutions::iterator

  /**
   * \param db Database the query refers to
   * \param query Compiled query
   * \param g Goal of the query
   * \param vars Logic variables to report
   * \param names Names of \p vars
   * \param limit Maximal number of solutions to produce
   */
  solutions(std::shared_ptr<const database> db, compiled_goal query, goal g,
            stl::vector<value> vars, std::vector<std::string> names,
            std::optional<size_t> limit);

  /**
   * Search for the next solution
   *
   * \return Next solution, or nothing when the search space is exhausted or
   * the limit is reached
   * \throws undefined_relation when the search reaches a call of an undefined
   * relation
   */
  std::optional<solution>
  next();

  /**
   * Number of solutions produced so far
   */
  size_t
  count() const noexcept
  { return m_state->count; }

  /**
   * Number of search steps performed so far
   */
  size_t
  steps() const noexcept
  { return m_state->stream.steps(); }

  /**
   * Names of the reported variables, in reporting order
   */
  const std::vector<std::string>&
  names() const noexcept
  { return m_state->names; }

  iterator
  begin()
  { return iterator {this}; }

  std::default_sentinel_t
  end() const noexcept
  { return std::default_sentinel; }

  /**
   * Drain all remaining solutions
   *
   * \warning Does not terminate for infinitely many solutions without a limit.
   */
  std::vector<solution>
  to_vector();

  private:
  root_ptr<state> m_state;
}; // class horn::solutions


/**
 * Write solution as `name: value` pairs joined by "; "
 *
 * \ingroup query
 */
void
write(std::ostream &os, const solution &sol);

} // namespace horn
