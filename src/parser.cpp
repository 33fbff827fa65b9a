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


#include "horn/parser.hpp"
#include "horn/logging.hpp"

#include <cctype>
#include <charconv>
#include <format>


static std::string_view
_type_name(enum horn::parser::token::type type)
{
  using type_t = enum horn::parser::token::type;
  switch (type)
  {
    case type_t::LPAREN: return "'('";
    case type_t::RPAREN: return "')'";
    case type_t::LBRACKET: return "'['";
    case type_t::RBRACKET: return "']'";
    case type_t::COMMA: return "','";
    case type_t::PERIOD: return "'.'";
    case type_t::ARROW: return "'<-'";
    case type_t::SYMBOL: return "symbol";
    case type_t::VARIABLE: return "variable";
    case type_t::ANONVAR: return "anonymous variable";
    case type_t::NUMBER: return "number";
    case type_t::STRING: return "string";
    case type_t::END: return "end of input";
  }
  std::terminate();
}


static std::string
_describe(const horn::parser::token &token)
{
  using type_t = enum horn::parser::token::type;
  switch (token.type)
  {
    case type_t::SYMBOL:
    case type_t::VARIABLE:
    case type_t::ANONVAR:
    case type_t::NUMBER:
      return std::format("{} {}", _type_name(token.type), token.value);
    case type_t::STRING:
      return std::format("string \"{}\"", token.value);
    default:
      return std::string {_type_name(token.type)};
  }
}


static bool
_is_word_char(char c)
{ return std::isalnum(static_cast<unsigned char>(c)) or c == '_'; }


std::vector<horn::parser::token>
horn::parser::tokenize(std::string_view text) const
{
  using type_t = enum token::type;

  std::vector<token> tokens;
  size_t pos = 0;
  size_t line = 1;
  size_t column = 1;

  // Advance the cursor, keeping track of lines
  const auto advance = [&](size_t n) {
    for (size_t i = 0; i < n; ++i, ++pos)
    {
      if (text[pos] == '\n')
      {
        line += 1;
        column = 1;
      }
      else
        column += 1;
    }
  };

  while (pos < text.size())
  {
    const char c = text[pos];

    // Skip whitespace
    if (std::isspace(static_cast<unsigned char>(c)))
    {
      advance(1);
      continue;
    }

    // Handle comments (hash to end of line)
    if (c == '#')
    {
      size_t n = 0;
      while (pos + n < text.size() and text[pos + n] != '\n')
        n += 1;
      advance(n);
      continue;
    }

    const size_t start = pos;
    const size_t startline = line;
    const size_t startcolumn = column;
    const auto emit = [&](type_t type, size_t len, std::string value) {
      advance(len);
      tokens.push_back({type, std::move(value),
                        {m_source, start, pos, startline, startcolumn}});
    };

    switch (c)
    {
      case '(': emit(type_t::LPAREN, 1, "("); continue;
      case ')': emit(type_t::RPAREN, 1, ")"); continue;
      case '[': emit(type_t::LBRACKET, 1, "["); continue;
      case ']': emit(type_t::RBRACKET, 1, "]"); continue;
      case ',': emit(type_t::COMMA, 1, ","); continue;
      case '.': emit(type_t::PERIOD, 1, "."); continue;
    }

    if (c == '<' and pos + 1 < text.size() and text[pos + 1] == '-')
    {
      emit(type_t::ARROW, 2, "<-");
      continue;
    }

    // Handle string literals; no escape sequences
    if (c == '"')
    {
      const size_t close = text.find('"', pos + 1);
      if (close == std::string_view::npos)
      {
        throw syntax_error {
            "unterminated string literal",
            {m_source, start, text.size(), startline, startcolumn}};
      }
      emit(type_t::STRING, close - pos + 1,
           std::string {text.substr(pos + 1, close - pos - 1)});
      continue;
    }

    // Handle numbers and words
    if (std::isdigit(static_cast<unsigned char>(c)))
    {
      size_t len = 0;
      while (pos + len < text.size() and
             std::isdigit(static_cast<unsigned char>(text[pos + len])))
        len += 1;
      emit(type_t::NUMBER, len, std::string {text.substr(pos, len)});
      continue;
    }

    if (_is_word_char(c))
    {
      size_t len = 0;
      while (pos + len < text.size() and _is_word_char(text[pos + len]))
        len += 1;
      type_t type;
      if (c == '_')
        type = type_t::ANONVAR;
      else if (std::isupper(static_cast<unsigned char>(c)))
        type = type_t::SYMBOL;
      else
        type = type_t::VARIABLE;
      emit(type, len, std::string {text.substr(pos, len)});
      continue;
    }

    throw syntax_error {std::format("unexpected character '{}'", c),
                        {m_source, start, start + 1, startline, startcolumn}};
  }

  tokens.push_back(
      {type_t::END, "", {m_source, text.size(), text.size(), line, column}});
  return tokens;
}


const horn::parser::token&
horn::parser::_expect(const std::vector<token> &tokens, size_t &pos,
                      enum token::type type) const
{
  const token &tok = tokens[pos];
  if (tok.type != type)
  {
    throw syntax_error {std::format("expected {}, got {}", _type_name(type),
                                    _describe(tok)),
                        tok.location};
  }
  pos += 1;
  return tok;
}


void
horn::parser::_expect_end(const std::vector<token> &tokens, size_t pos) const
{
  const token &tok = tokens[pos];
  if (tok.type != token::type::END)
  {
    throw unconsumed_input {
        std::format("unexpected {} after the end of input", _describe(tok)),
        tok.location};
  }
}


static bool
_starts_term(const horn::parser::token &tok)
{
  using type_t = enum horn::parser::token::type;
  switch (tok.type)
  {
    case type_t::LPAREN:
    case type_t::LBRACKET:
    case type_t::SYMBOL:
    case type_t::VARIABLE:
    case type_t::ANONVAR:
    case type_t::NUMBER:
    case type_t::STRING:
      return true;
    default:
      return false;
  }
}


horn::compiled_term
horn::parser::_parse_term(const std::vector<token> &tokens, size_t &pos) const
{
  using type_t = enum token::type;

  const token &tok = tokens[pos];
  switch (tok.type)
  {
    case type_t::LPAREN: {
      pos += 1;
      const token &symbol = _expect(tokens, pos, type_t::SYMBOL);
      compiled_terms args = _parse_terms(tokens, pos);
      _expect(tokens, pos, type_t::RPAREN);
      return make_compound(symbol.value, std::move(args));
    }

    case type_t::LBRACKET: {
      pos += 1;
      std::vector<compiled_term> elements;
      if (tokens[pos].type != type_t::RBRACKET)
      {
        elements.push_back(_parse_term(tokens, pos));
        while (tokens[pos].type == type_t::COMMA)
        {
          pos += 1;
          elements.push_back(_parse_term(tokens, pos));
        }
      }
      _expect(tokens, pos, type_t::RBRACKET);
      return make_list(collect(elements));
    }

    case type_t::SYMBOL:
      pos += 1;
      return make_compound(tok.value, collect({}));

    case type_t::VARIABLE:
      pos += 1;
      return make_variable(tok.value);

    case type_t::ANONVAR:
      pos += 1;
      return make_anonymous(tok.value);

    case type_t::NUMBER: {
      long number = 0;
      const char *begin = tok.value.data();
      const char *end = begin + tok.value.size();
      const auto [ptr, ec] = std::from_chars(begin, end, number);
      if (ec != std::errc {} or ptr != end)
      {
        throw syntax_error {
            std::format("integer literal out of range: {}", tok.value),
            tok.location};
      }
      pos += 1;
      return make_literal(number);
    }

    case type_t::STRING:
      pos += 1;
      return make_literal(std::string_view {tok.value});

    default:
      throw syntax_error {std::format("expected term, got {}", _describe(tok)),
                          tok.location};
  }
}


horn::compiled_terms
horn::parser::_parse_terms(const std::vector<token> &tokens, size_t &pos) const
{
  std::vector<compiled_term> terms;
  while (_starts_term(tokens[pos]))
    terms.push_back(_parse_term(tokens, pos));
  return collect(terms);
}


horn::compiled_goal
horn::parser::_parse_call(const std::vector<token> &tokens, size_t &pos) const
{
  const token &symbol = _expect(tokens, pos, token::type::SYMBOL);
  compiled_terms args = _parse_terms(tokens, pos);
  return make_call(symbol.value, std::move(args), symbol.location);
}


horn::compiled_goal
horn::parser::_parse_calls(const std::vector<token> &tokens, size_t &pos) const
{
  std::vector<compiled_goal> calls;
  calls.push_back(_parse_call(tokens, pos));
  while (tokens[pos].type == token::type::COMMA)
  {
    pos += 1;
    calls.push_back(_parse_call(tokens, pos));
  }
  return make_calls(calls);
}


horn::rule_definition
horn::parser::_parse_rule(const std::vector<token> &tokens, size_t &pos) const
{
  using type_t = enum token::type;

  const token &symbol = _expect(tokens, pos, type_t::SYMBOL);
  compiled_terms head = _parse_terms(tokens, pos);

  if (tokens[pos].type == type_t::ARROW)
  {
    pos += 1;
    compiled_goal body = _parse_calls(tokens, pos);
    _expect(tokens, pos, type_t::PERIOD);
    return {symbol.value, make_rule(std::move(head), std::move(body)),
            symbol.location};
  }

  if (tokens[pos].type == type_t::PERIOD)
  {
    pos += 1;
    return {symbol.value, make_fact(std::move(head)), symbol.location};
  }

  throw syntax_error {
      std::format("expected '<-' or '.', got {}", _describe(tokens[pos])),
      tokens[pos].location};
}


std::vector<horn::rule_definition>
horn::parser::parse_program(std::string_view text) const
{
  const std::vector<token> tokens = tokenize(text);
  size_t pos = 0;

  std::vector<rule_definition> rules;
  while (tokens[pos].type == token::type::SYMBOL)
  {
    rules.push_back(_parse_rule(tokens, pos));
    if (global_flags.contains("DebugLoad"))
      debug("{}: clause of {}", display_location(rules.back().location),
            rules.back().symbol);
  }
  _expect_end(tokens, pos);
  return rules;
}


horn::compiled_goal
horn::parser::parse_query(std::string_view text) const
{
  const std::vector<token> tokens = tokenize(text);
  size_t pos = 0;
  compiled_goal result = _parse_calls(tokens, pos);
  _expect_end(tokens, pos);
  return result;
}


horn::compiled_term
horn::parser::parse_term(std::string_view text) const
{
  const std::vector<token> tokens = tokenize(text);
  size_t pos = 0;
  compiled_term result = _parse_term(tokens, pos);
  _expect_end(tokens, pos);
  return result;
}
