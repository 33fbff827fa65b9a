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
#include "horn/stl/vector.hpp"
#include "horn/stl/unordered_map.hpp"

#include <concepts>
#include <format>
#include <optional>

/**
 * \file substitution.hpp
 * Binding states and unification
 *
 * \ingroup engine
 */


namespace horn {

/**
 * Single variable binding
 *
 * Bindings form an immutable AVL tree on the GC heap ordered by the address of
 * the variable. Extending a substitution copies only the path to the new
 * binding, so substitutions it was derived from are not affected and every
 * search branch can keep its own. Lookup is logarithmic in the number of
 * bindings.
 *
 * \ingroup engine
 */
struct binding {
  object *var;
  object *val;
  const binding *left, *right;
  int height;
}; // struct horn::binding


/**
 * Binding state threaded through the search
 *
 * \ingroup engine
 */
class substitution {
  public:
  /**
   * Construct the empty state
   */
  substitution() noexcept: m_root {nullptr}, m_size {0} { }

  /**
   * Number of bindings
   */
  size_t
  size() const noexcept
  { return m_size; }

  /**
   * Find the value bound to a variable
   *
   * \param var Variable to look up
   * \param[out] result Bound value, left unmodified when \p var is unbound
   * \return True if \p var is bound
   */
  bool
  lookup(value var, value &result) const noexcept;

  /**
   * Follow bindings of a variable until reaching a non-variable or an
   * unbound variable
   */
  [[nodiscard]] value
  walk(value x) const noexcept;

  /**
   * Substitute all bound variables in a term, recursively
   */
  [[nodiscard]] value
  walk_all(value x) const;

  /**
   * Create new state with one more binding
   *
   * \note \p var must be unbound in this state.
   */
  [[nodiscard]] substitution
  extend(value var, value val) const;

  private:
  substitution(const binding *root, size_t size) noexcept
  : m_root {root}, m_size {size}
  { }

  const binding *m_root;
  size_t m_size;
}; // class horn::substitution


/**
 * The initial binding state
 *
 * \ingroup engine
 */
[[nodiscard]] inline substitution
empty_state() noexcept
{ return substitution {}; }


/**
 * Unify two terms
 *
 * No occurs check is performed.
 *
 * \param a First term
 * \param b Second term
 * \param s State to extend
 * \return Extended state if \p a and \p b can be made equal; nothing otherwise
 *
 * \ingroup engine
 */
[[nodiscard]] std::optional<substitution>
unify(value a, value b, const substitution &s);


/**
 * Concept for a function naming unresolved variables during reification
 *
 * \ingroup engine
 */
template <typename T>
concept unbound_variable_handler = requires(T &f, value x)
{
  { f(x) } -> std::convertible_to<value>;
};


/**
 * Replace every unresolved variable by a placeholder `_.N`
 *
 * Placeholders are numbered in order of first appearance; one handler shared
 * by several reifications keeps the numbering consistent across them.
 *
 * \ingroup engine
 */
class canonical_names {
  public:
  value
  operator () (value x)
  {
    const auto it = m_names.find(&*x);
    if (it != m_names.end())
      return it->second;
    const value placeholder = var(std::format("_.{}", m_names.size()));
    m_names.emplace(&*x, placeholder);
    return placeholder;
  }

  private:
  stl::unordered_map<const object *, value> m_names;
}; // class horn::canonical_names
static_assert(unbound_variable_handler<canonical_names>);


/**
 * Leave unresolved variables as they are
 *
 * \ingroup engine
 */
struct keep_unbound_variables {
  value
  operator () (value x) const noexcept
  { return x; }
}; // struct horn::keep_unbound_variables
static_assert(unbound_variable_handler<keep_unbound_variables>);


/**
 * Resolve a term against a binding state
 *
 * \tparam UVHandler Type of unbound variable handler
 * \param x Term to resolve
 * \param s Binding state
 * \param uvhandler Handler producing replacements for unresolved variables
 * \return Term with all bound variables substituted
 *
 * \ingroup engine
 */
template <unbound_variable_handler UVHandler>
[[nodiscard]] value
reify(value x, const substitution &s, UVHandler &uvhandler)
{
  x = s.walk(x);
  switch (x->t)
  {
    case tag::var:
      return uvhandler(x);

    case tag::compound: {
      stl::vector<value> args;
      args.reserve(arity(x));
      for (size_t i = 0; i < arity(x); ++i)
        args.push_back(reify(argument(x, i), s, uvhandler));
      return compound(functor(x), args);
    }

    case tag::cons: {
      // Iterate over the spine to keep recursion depth independent of length
      stl::vector<value> elements;
      for (; iscons(x); x = s.walk(cdr(x)))
        elements.push_back(reify(car(x), s, uvhandler));
      return make_list(elements, reify(x, s, uvhandler));
    }

    default:
      return x;
  }
}

/**
 * Resolve a term, naming unresolved variables `_.0`, `_.1`, ...
 *
 * \ingroup engine
 */
[[nodiscard]] inline value
reify(value x, const substitution &s)
{
  canonical_names names;
  return reify(x, s, names);
}

} // namespace horn
