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

#include <algorithm>
#include <format>
#include <sstream>

/**
 * \file format.hpp
 * `std::format` support for terms
 *
 * \ingroup utils
 */


namespace std {

/**
 * Formatter for horn::value
 *
 * Accepts no format options; terms are written in the source syntax.
 *
 * \ingroup utils
 */
template <>
struct formatter<horn::value, char> {
  template <class ParseContext>
  constexpr ParseContext::iterator
  parse(ParseContext &ctx)
  {
    auto it = ctx.begin();
    if (it != ctx.end() and *it != '}')
      throw std::format_error {"Invalid format arguments for horn::value"};
    return it;
  }

  template <class FmtContext>
  FmtContext::iterator
  format(horn::value x, FmtContext &ctx) const
  {
    std::ostringstream buffer;
    horn::write(buffer, x);
    return std::ranges::copy(std::move(buffer).str(), ctx.out()).out;
  }
};

} // namespace std
