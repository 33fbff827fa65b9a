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

#include <string>
#include <string_view>

/**
 * \file source_location.hpp
 * Locations of tokens in program and query text
 *
 * \ingroup syntax
 */

namespace horn {

/**
 * Region of the input text
 *
 * \ingroup syntax
 */
struct source_location {
  source_location() = default;

  source_location(std::string_view source_, size_t start, size_t end,
                  size_t line, size_t column)
  : source {source_}, start {start}, end {end}, line {line}, column {column}
  { }

  bool
  operator == (const source_location &other) const = default;

  std::string source; ///< Source name (filepath or "<string>")
  size_t start = 0;   ///< Start offset in the input
  size_t end = 0;     ///< End offset in the input
  size_t line = 1;    ///< 1-based line of `start`
  size_t column = 1;  ///< 1-based column of `start`
};

/**
 * Display the location as `source:line:column`, followed by the offending
 * line with the region underlined when \p text is available
 *
 * \param location Location to display
 * \param text Full input text the location refers to (may be empty)
 * \return Formatted report
 *
 * \ingroup syntax
 */
[[nodiscard]] std::string
display_location(const source_location &location, std::string_view text = {},
                 std::string_view hlstyle = "\e[38;5;1;1m");

} // namespace horn
