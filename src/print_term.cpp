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

#include <sstream>


static void
_write(std::ostream &os, horn::value x)
{
  using namespace horn;

  switch (x->t)
  {
    case tag::nil:
      os << "[]";
      break;

    case tag::atom:
      os << functor(x);
      break;

    case tag::num:
      os << num_val(x);
      break;

    case tag::str:
      os << '"' << str_view(x) << '"';
      break;

    case tag::var:
      os << var_name(x);
      break;

    case tag::cons:
      if (is_proper_list(x))
      {
        os << '[';
        _write(os, car(x));
        for (x = cdr(x); iscons(x); x = cdr(x))
        {
          os << ", ";
          _write(os, car(x));
        }
        os << ']';
        break;
      }
      [[fallthrough]];

    case tag::compound:
      os << '(' << functor(x);
      for (size_t i = 0; i < arity(x); ++i)
      {
        os << ' ';
        _write(os, argument(x, i));
      }
      os << ')';
      break;
  }
}


void
horn::write(std::ostream &os, value x)
{ _write(os, x); }


std::string
horn::to_string(value x)
{
  std::ostringstream buf;
  _write(buf, x);
  return buf.str();
}
