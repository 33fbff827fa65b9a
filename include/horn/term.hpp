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

#include "horn/memory.hpp"

#include <cassert>
#include <cstring>
#include <initializer_list>
#include <ostream>
#include <ranges>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

/**
 * \file term.hpp
 * Runtime representation of terms
 *
 * A term is one of:
 * - the empty list `Nil`;
 * - an atom (a 0-ary compound);
 * - a compound: constructor name with an ordered sequence of arguments;
 * - a list pair `(Cons head tail)`;
 * - an integer or string literal;
 * - a logic variable.
 *
 * `Cons` with two arguments and `Nil` with none are reserved constructors:
 * building them with `compound()` yields the list pair and the empty list
 * respectively, so there is exactly one encoding of every list.
 *
 * \ingroup core
 */


namespace horn {

/**
 * Names of the reserved list constructors
 *
 * \ingroup core
 */
constexpr char CONS[] = "Cons";
constexpr char NIL[] = "Nil";

/**
 * Tag enumeration for term kinds
 *
 * \ingroup core
 */
enum class tag {
  nil,
  atom,
  compound,
  cons,
  num,
  str,
  var,
};

struct object;

/**
 * Reference to a term
 *
 * \ingroup core
 */
class value {
  public:
  explicit value(object *ptr): m_ptr {ptr} { assert(ptr != nullptr); }

  /**
   * Construct reference to `Nil`
   */
  value();

  constexpr object*
  operator -> () const noexcept
  { return m_ptr; }

  constexpr object&
  operator * () const noexcept
  { return *m_ptr; }

  /**
   * Structural equality (variables compare by identity)
   */
  [[nodiscard]] bool
  operator == (value other) const noexcept;

  private:
  object *m_ptr;
}; // class horn::value


/**
 * Term object
 *
 * \ingroup core
 */
struct object {
  object(enum tag tag): t {tag} { }

  enum tag t;
  union {
    struct { const char *data; size_t len; } name; /**< Atom name */
    struct {
      const char *data;
      size_t len;
      object **args;
      size_t nargs;
    } compound; /**< Compound constructor and arguments */
    struct { object *car, *cdr; }; /**< List pair */
    long num; /**< Integer literal */
    struct { const char *data; size_t len; } str; /**< String literal */
    struct { const char *data; size_t len; size_t id; } var; /**< Variable */
  };
}; // struct horn::object


/**
 * Intern a string for the lifetime of the process
 *
 * Equal strings share one copy; constructor names are interned.
 *
 * \ingroup core
 */
[[nodiscard]] std::string_view
global_string(std::string_view str);


extern const value nil; /**< The empty list */


/**
 * \name Fundamental constructors
 * \{
 */

/**
 * Create an atom
 *
 * \note `atom("Nil")` returns the empty list.
 *
 * \ingroup core
 */
[[nodiscard]] value
atom(std::string_view name);

/**
 * Create a compound term
 *
 * Degenerate forms are canonicalized: no arguments yield an atom, `Cons` with
 * two arguments yields a list pair.
 *
 * \param name Constructor name
 * \param args Arguments
 * \return Compound term
 *
 * \ingroup core
 */
[[nodiscard]] value
compound(std::string_view name, std::span<const value> args);

[[nodiscard]] inline value
compound(std::string_view name, std::initializer_list<value> args)
{ return compound(name, std::span<const value> {args.begin(), args.size()}); }

/**
 * Create a list pair
 *
 * \ingroup core
 */
[[nodiscard]] inline value
cons(value car, value cdr)
{
  value ret {make<object>(tag::cons)};
  ret->car = &*car;
  ret->cdr = &*cdr;
  return ret;
}

/**
 * Create an integer literal
 *
 * \ingroup core
 */
[[nodiscard]] inline value
num(long val)
{
  value ret {make_atomic<object>(tag::num)};
  ret->num = val;
  return ret;
}

/**
 * Create a string literal
 *
 * \ingroup core
 */
[[nodiscard]] inline value
str(std::string_view str)
{
  value ret {make<object>(tag::str)};
  char *data = static_cast<char*>(allocate_atomic(str.length() + 1));
  std::memcpy(data, str.data(), str.length());
  data[str.length()] = '\0';
  ret->str.data = data;
  ret->str.len = str.length();
  return ret;
}

/**
 * Create a fresh logic variable
 *
 * Every call returns a variable distinct from all others, whatever the name
 * hint.
 *
 * \param hint Name used when the variable is printed
 * \return New variable
 *
 * \ingroup core
 */
[[nodiscard]] value
var(std::string_view hint);

/** \} */

/**
 * \name Conversions used by the list constructors
 * \{
 */

[[nodiscard]] inline value
from(value x)
{ return x; }

[[nodiscard]] inline value
from(long x)
{ return num(x); }

[[nodiscard]] inline value
from(int x)
{ return num(x); }

/** \} */


/**
 * \name Type tests and accessors
 * \{
 */

[[nodiscard]] inline bool
isnil(value x)
{ return x->t == tag::nil; }

[[nodiscard]] inline bool
iscons(value x)
{ return x->t == tag::cons; }

[[nodiscard]] inline bool
isatom(value x)
{ return x->t == tag::atom; }

[[nodiscard]] inline bool
isatom(value x, std::string_view name)
{
  return isatom(x) and
         std::string_view {x->name.data, x->name.len} == name;
}

[[nodiscard]] inline bool
iscompound(value x)
{ return x->t == tag::compound; }

[[nodiscard]] inline bool
isnum(value x)
{ return x->t == tag::num; }

[[nodiscard]] inline bool
isnum(value x, long num)
{ return isnum(x) and x->num == num; }

[[nodiscard]] inline bool
isstr(value x)
{ return x->t == tag::str; }

[[nodiscard]] inline bool
isvar(value x)
{ return x->t == tag::var; }

/**
 * Get constructor name of a structured term
 *
 * Works uniformly for atoms, compounds, list pairs (`Cons`) and the empty
 * list (`Nil`).
 *
 * \throws std::invalid_argument If the term is not structured
 *
 * \ingroup core
 */
[[nodiscard]] std::string_view
functor(value x);

/**
 * Get number of arguments of a structured term
 *
 * \throws std::invalid_argument If the term is not structured
 *
 * \ingroup core
 */
[[nodiscard]] size_t
arity(value x);

/**
 * Get argument of a structured term
 *
 * \throws std::out_of_range If \p i is not below arity of \p x
 *
 * \ingroup core
 */
[[nodiscard]] value
argument(value x, size_t i);

[[nodiscard]] inline long
num_val(value x)
{
  if (not isnum(x))
    throw std::invalid_argument {"num_val() - not a number"};
  return x->num;
}

[[nodiscard]] inline std::string_view
str_view(value x)
{
  if (not isstr(x))
    throw std::invalid_argument {"str_view() - not a string"};
  return std::string_view {x->str.data, x->str.len};
}

[[nodiscard]] inline std::string_view
var_name(value x)
{
  if (not isvar(x))
    throw std::invalid_argument {"var_name() - not a variable"};
  return std::string_view {x->var.data, x->var.len};
}

[[nodiscard]] inline size_t
var_id(value x)
{
  if (not isvar(x))
    throw std::invalid_argument {"var_id() - not a variable"};
  return x->var.id;
}

/** \} */


/**
 * \name Lists
 * \{
 */

template <bool Test=true>
[[nodiscard]] inline value
car(value x)
{
  if constexpr (Test)
  {
    if (x->t != tag::cons)
      throw std::invalid_argument {"car() - not a pair"};
  }
  return value {x->car};
}

template <bool Test=true>
[[nodiscard]] inline value
cdr(value x)
{
  if constexpr (Test)
  {
    if (x->t != tag::cons)
      throw std::invalid_argument {"cdr() - not a pair"};
  }
  return value {x->cdr};
}

/**
 * Check whether a chain of pairs terminates in `Nil`
 *
 * \ingroup core
 */
[[nodiscard]] inline bool
is_proper_list(value x)
{
  while (iscons(x))
    x = cdr<false>(x);
  return isnil(x);
}

/**
 * Number of pairs in a chain
 *
 * \ingroup core
 */
[[nodiscard]] inline size_t
length(value l)
{
  size_t len = 0;
  for (; iscons(l); l = cdr<false>(l), ++len);
  return len;
}

template <typename Head>
[[nodiscard]] value
list(Head head)
{ return cons(from(head), nil); }

template <typename Head, typename ...Tail>
[[nodiscard]] value
list(Head head, Tail&& ...tail)
{ return cons(from(head), list(std::forward<Tail>(tail)...)); }

/**
 * Build a list ending in \p tail from a range of terms
 *
 * Elements are attached right to left, so the last element of the range sits
 * next to \p tail.
 *
 * \ingroup core
 */
template <std::ranges::bidirectional_range Range>
[[nodiscard]] value
make_list(const Range &range, value tail = nil)
{
  value acc = tail;
  for (const value x : range | std::views::reverse)
    acc = cons(x, acc);
  return acc;
}

/** \} */


/**
 * \name Basic functions
 * \{
 */

/**
 * Check if two references point to the same object
 *
 * \ingroup core
 */
[[nodiscard]] inline bool
is(value a, value b)
{ return &*a == &*b; }

/**
 * Structural equality; variables are equal only to themselves
 *
 * \ingroup core
 */
[[nodiscard]] bool
equal(value a, value b);

/** \} */


/**
 * \name Printing
 * \{
 */

/**
 * Write term in the source syntax
 *
 * Proper lists are written as `[a, b]`, atoms as bare names, other compounds
 * as `(Name arg ...)`, variables by their name.
 *
 * \ingroup core
 */
void
write(std::ostream &os, value x);

/**
 * Render term into a string
 *
 * \ingroup core
 */
[[nodiscard]] std::string
to_string(value x);

/** \} */

} // namespace horn


inline std::ostream&
operator << (std::ostream &os, const horn::value &val)
{ horn::write(os, val); return os; }

inline
horn::value::value()
: m_ptr {&*horn::nil}
{ }

inline bool
horn::value::operator == (horn::value other) const noexcept
{ return horn::equal(*this, other); }
