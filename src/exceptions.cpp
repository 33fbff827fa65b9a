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


#include "horn/exceptions.hpp"
#include "horn/source_location.hpp"


horn::bad_code::bad_code(std::string_view what, const source_location &location)
: runtime_error(std::string(what)), m_location {location}
{ }


void
horn::bad_code::display(std::ostream &os, std::string_view text,
                        std::string_view source) const noexcept
{
  // Write basic error report
  os << what();

  // Write location if available
  if (m_location)
  {
    // Offsets of a location in another input mean nothing for this text
    if (not source.empty() and m_location->source != source)
      text = {};
    os << "\n" << display_location(m_location.value(), text);
  }
}
