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


#include "horn/source_location.hpp"

#include <algorithm>
#include <format>


std::string
horn::display_location(const source_location &location, std::string_view text,
                       std::string_view hlstyle)
{
  std::string result = std::format("{}:{}:{}", location.source, location.line,
                                   location.column);
  if (text.empty() or location.start > text.size())
    return result;

  // Find the line containing the start position
  const size_t linestart = location.start == 0
                               ? 0
                               : text.rfind('\n', location.start - 1) + 1;
  size_t lineend = text.find('\n', location.start);
  if (lineend == std::string_view::npos)
    lineend = text.size();

  const std::string_view line = text.substr(linestart, lineend - linestart);
  const size_t hlstart = location.start - linestart;
  const size_t hlend =
      std::max(hlstart + 1, std::min(location.end, lineend) - linestart);

  result += "\n  ";
  result += line.substr(0, hlstart);
  result += hlstyle;
  result += line.substr(hlstart, hlend - hlstart);
  if (not hlstyle.empty())
    result += "\e[0m";
  result += line.substr(std::min(hlend, line.size()));
  result += "\n  ";
  result += std::string(hlstart, ' ');
  result += std::string(std::max<size_t>(1, hlend - hlstart), '^');
  return result;
}
