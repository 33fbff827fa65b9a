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
#include "repl.hpp"

#include <cstdlib>
#include <cstring>
#include <set>
#include <string>
#include <vector>

// Readline headers
#include <readline/readline.h>
#include <readline/history.h>


static const char history_file[] = ".horn_history";

// Predicate names for autocompletion
static std::set<std::string> known_symbols;

// REPL commands for autocompletion
static const char *commands[] = {":help", ":limit", ":vars", nullptr};


// Helper function to read a line with prompt using readline
bool
prompt_line(const std::string &prompt, std::string &line)
{
  char *input = readline(prompt.c_str());

  // Check if EOF or error
  if (!input)
    return false;

  line = input;

  // Add non-empty lines to history
  if (not line.empty())
    add_history(input);

  // Free the memory allocated by readline
  free(input);

  return true;
}


static char *
_command_generator(const char *text, int state)
{
  static size_t command_index;
  static std::vector<std::string> matching_symbols;
  static size_t symbol_index;

  // If this is a new word to complete, initialize the counters
  if (state == 0)
  {
    command_index = 0;
    matching_symbols.clear();
    symbol_index = 0;

    const std::string prefix {text};
    for (const std::string &symbol : known_symbols)
    {
      if (symbol.compare(0, prefix.length(), prefix) == 0)
        matching_symbols.push_back(symbol);
    }
  }

  // First return matching commands
  while (commands[command_index])
  {
    const char *name = commands[command_index++];
    if (strncmp(name, text, strlen(text)) == 0)
      return strdup(name);
  }

  // Then return matching predicates
  if (symbol_index < matching_symbols.size())
    return strdup(matching_symbols[symbol_index++].c_str());

  // No more matches
  return nullptr;
}


static char **
_horn_completion(const char *text, [[maybe_unused]] int start,
                 [[maybe_unused]] int end)
{
  // Don't do filename completion even if our generator finds no matches
  rl_attempted_completion_over = 1;
  return rl_completion_matches(text, _command_generator);
}


void
init_readline()
{
  rl_readline_name = "horn";
  rl_attempted_completion_function = _horn_completion;
  rl_bind_key('\t', rl_complete);

  // Read history from file if it exists
  read_history(history_file);
}


void
cleanup_readline()
{
  // Save history to file (limit to 500 entries)
  write_history(history_file);
  history_truncate_file(history_file, 500);
}


void
add_completions(std::span<const std::string> symbols)
{ known_symbols.insert(symbols.begin(), symbols.end()); }
