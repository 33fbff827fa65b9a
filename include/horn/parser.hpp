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

#include "horn/clause.hpp"
#include "horn/compiler.hpp"
#include "horn/exceptions.hpp"
#include "horn/source_location.hpp"

#include <string>
#include <string_view>
#include <vector>

/**
 * \file parser.hpp
 * Parser of programs, queries and term literals
 *
 * Grammar:
 * ```
 * program   : rule* END
 * query     : calls END
 * rule      : predicate ( '<-' calls '.' | '.' )
 * predicate : SYMBOL term*
 * calls     : call (',' call)*
 * call      : SYMBOL term*
 * term      : '(' SYMBOL term* ')' | '[' (term (',' term)*)? ']'
 *           | SYMBOL | VARIABLE | ANONVAR | NUMBER | STRING
 * ```
 * Whitespace and `#` comments (up to the end of the line) are skipped.
 *
 * The parser does not build a syntax tree; the constructors of compiler.hpp
 * are invoked directly as semantic actions.
 *
 * \ingroup syntax
 */


namespace horn {

/**
 * Malformed program, query or term text
 *
 * \ingroup syntax
 */
struct syntax_error: public bad_code {
  using bad_code::bad_code;
};

/**
 * Input text left over after a complete program, query or term
 *
 * \ingroup syntax
 */
struct unconsumed_input: public syntax_error {
  using syntax_error::syntax_error;
};


/**
 * Recursive-descent parser
 *
 * \ingroup syntax
 */
class parser {
  public:
  /**
   * Token representation for the lexical analyzer
   *
   * \ingroup syntax
   */
  struct token {
    enum class type {
      LPAREN,   // (
      RPAREN,   // )
      LBRACKET, // [
      RBRACKET, // ]
      COMMA,    // ,
      PERIOD,   // .
      ARROW,    // <-
      SYMBOL,   // Foo, Member, etc.
      VARIABLE, // x, tail, etc.
      ANONVAR,  // _, _rest, etc.
      NUMBER,   // 42
      STRING,   // "hello"
      END       // end of input
    };
    type type;
    std::string value;
    source_location location;
  };

  /**
   * \param source_name Name of the input used in source locations
   */
  explicit parser(std::string_view source_name = "<string>")
  : m_source {source_name}
  { }

  /**
   * Parse a sequence of facts and rules
   *
   * \throws syntax_error
   */
  std::vector<rule_definition>
  parse_program(std::string_view text) const;

  /**
   * Parse a comma-separated sequence of calls
   *
   * \throws syntax_error
   */
  compiled_goal
  parse_query(std::string_view text) const;

  /**
   * Parse a single term literal
   *
   * \throws syntax_error
   */
  compiled_term
  parse_term(std::string_view text) const;

  /**
   * Split input text into tokens; the result always ends with an END token
   *
   * \throws syntax_error on characters that can not start a token
   */
  std::vector<token>
  tokenize(std::string_view text) const;

  private:
  rule_definition
  _parse_rule(const std::vector<token> &tokens, size_t &pos) const;

  compiled_goal
  _parse_calls(const std::vector<token> &tokens, size_t &pos) const;

  compiled_goal
  _parse_call(const std::vector<token> &tokens, size_t &pos) const;

  compiled_terms
  _parse_terms(const std::vector<token> &tokens, size_t &pos) const;

  compiled_term
  _parse_term(const std::vector<token> &tokens, size_t &pos) const;

  const token&
  _expect(const std::vector<token> &tokens, size_t &pos,
          enum token::type type) const;

  void
  _expect_end(const std::vector<token> &tokens, size_t pos) const;

  std::string m_source;
}; // class horn::parser


/**
 * \name Parser entry points
 * \{
 */

/**
 * Parse program text into rule definitions in declaration order
 *
 * \ingroup syntax
 */
[[nodiscard]] inline std::vector<rule_definition>
parse_program(std::string_view text, std::string_view source = "<string>")
{ return parser {source}.parse_program(text); }

/**
 * Source name of query text
 *
 * \ingroup syntax
 */
inline constexpr std::string_view query_source = "<query>";

/**
 * Parse query text into a compiled goal
 *
 * \ingroup syntax
 */
[[nodiscard]] inline compiled_goal
parse_query(std::string_view text, std::string_view source = query_source)
{ return parser {source}.parse_query(text); }

/**
 * Parse a term literal
 *
 * \ingroup syntax
 */
[[nodiscard]] inline compiled_term
parse_term(std::string_view text, std::string_view source = "<term>")
{ return parser {source}.parse_term(text); }

/** \} */

} // namespace horn
