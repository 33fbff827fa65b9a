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


#include "horn/term.hpp"

#include <format>
#include <stdexcept>
#include <string>
#include <unordered_set>


////////////////////////////////////////////////////////////////////////////////
//
//                              Nil
//
static
horn::object nil_object {horn::tag::nil};
const horn::value horn::nil {&nil_object};


////////////////////////////////////////////////////////////////////////////////
//
//                        Interned strings
//
// The set itself lives in static storage; the characters are uncollectable so
// that views handed out stay valid after the collector runs.
static std::unordered_set<std::string_view> &
_global_strings()
{
  static std::unordered_set<std::string_view> strings;
  return strings;
}

std::string_view
horn::global_string(std::string_view str)
{
  auto &strings = _global_strings();
  const auto it = strings.find(str);
  if (it != strings.end())
    return *it;

  char *gstr = static_cast<char*>(allocate_uncollectable(str.size() + 1));
  str.copy(gstr, str.size());
  gstr[str.size()] = '\0';
  return *strings.emplace(gstr, str.size()).first;
}


horn::value
horn::atom(std::string_view name)
{
  if (name == NIL)
    return nil;

  const std::string_view gname = global_string(name);
  value ret {make<object>(tag::atom)};
  ret->name.data = gname.data();
  ret->name.len = gname.size();
  return ret;
}


horn::value
horn::compound(std::string_view name, std::span<const value> args)
{
  if (args.empty())
    return atom(name);

  if (args.size() == 2 and name == CONS)
    return cons(args[0], args[1]);

  const std::string_view gname = global_string(name);
  value ret {make<object>(tag::compound)};
  ret->compound.data = gname.data();
  ret->compound.len = gname.size();
  ret->compound.args =
      static_cast<object**>(allocate(args.size() * sizeof(object*)));
  for (size_t i = 0; i < args.size(); ++i)
    ret->compound.args[i] = &*args[i];
  ret->compound.nargs = args.size();
  return ret;
}


horn::value
horn::var(std::string_view hint)
{
  static size_t counter = 0;
  const std::string_view ghint = global_string(hint);
  value ret {make<object>(tag::var)};
  ret->var.data = ghint.data();
  ret->var.len = ghint.size();
  ret->var.id = counter++;
  return ret;
}


std::string_view
horn::functor(value x)
{
  switch (x->t)
  {
    case tag::nil: return NIL;
    case tag::cons: return CONS;
    case tag::atom: return {x->name.data, x->name.len};
    case tag::compound: return {x->compound.data, x->compound.len};
    default:
      throw std::invalid_argument {"functor() - not a structured term"};
  }
}


size_t
horn::arity(value x)
{
  switch (x->t)
  {
    case tag::nil:
    case tag::atom: return 0;
    case tag::cons: return 2;
    case tag::compound: return x->compound.nargs;
    default:
      throw std::invalid_argument {"arity() - not a structured term"};
  }
}


horn::value
horn::argument(value x, size_t i)
{
  if (i >= arity(x))
    throw std::out_of_range {
        std::format("argument() - index {} out of range for {}", i,
                    to_string(x))};

  if (iscons(x))
    return i == 0 ? car(x) : cdr(x);
  return value {x->compound.args[i]};
}


bool
horn::equal(value a, value b)
{
  // Walk list spines iteratively; long lists would blow the stack otherwise
  while (true)
  {
    if (is(a, b))
      return true;

    if (a->t != b->t)
      return false;

    switch (a->t)
    {
      case tag::nil:
        return true;

      case tag::atom:
        return functor(a) == functor(b);

      case tag::num:
        return a->num == b->num;

      case tag::str:
        return str_view(a) == str_view(b);

      case tag::var:
        // Distinct objects are distinct variables
        return false;

      case tag::compound:
        if (functor(a) != functor(b) or arity(a) != arity(b))
          return false;
        for (size_t i = 0; i < arity(a); ++i)
        {
          if (not equal(argument(a, i), argument(b, i)))
            return false;
        }
        return true;

      case tag::cons:
        if (not equal(car(a), car(b)))
          return false;
        a = cdr(a);
        b = cdr(b);
        continue;
    }
    std::terminate();
  }
}
