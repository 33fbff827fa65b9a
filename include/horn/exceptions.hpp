#pragma once

#include "horn/source_location.hpp"

#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>


namespace horn {

/**
 * Base of all errors caused by program or query text
 */
struct bad_code: std::runtime_error {
  bad_code(std::string_view what): runtime_error(std::string(what)) { }
  bad_code(std::string_view what, const source_location &location);

  const std::optional<source_location>&
  location() const noexcept
  { return m_location; }

  /**
   * Write the message followed by the location
   *
   * \param text Input to quote the offending fragment from
   * \param source Source name of \p text; the text is only quoted when the
   * location refers to this source (or when \p source is empty)
   */
  void
  display(std::ostream &os, std::string_view text = {},
          std::string_view source = {}) const noexcept;

  std::string
  display(std::string_view text = {}, std::string_view source = {}) const
  {
    std::ostringstream buf;
    display(buf, text, source);
    return buf.str();
  }

  private:
  std::optional<source_location> m_location;
}; // struct horn::bad_code

} // namespace horn
