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

#include "horn/logging.hpp"
#include "horn/parser.hpp"
#include "horn/program.hpp"
#include "horn/utilities/execution_timer.hpp"

#include <boost/program_options.hpp>
#include <gc/gc.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace std {
namespace fs = std::filesystem;
}


struct query_settings {
  std::optional<std::vector<std::string>> vars;
  std::optional<size_t> limit;
};


static std::string
read_file(const std::fs::path &path)
{
  using namespace horn;

  if (std::ifstream infile {path, std::ios::binary})
  {
    std::ostringstream buf;
    buf << infile.rdbuf();
    return buf.str();
  }
  else
  {
    error("Could not open input file '{}'", path.c_str());
    throw std::runtime_error {"Can't read file"};
  }
}


// Parse all program files into a single program
static horn::program
load_program(const std::vector<std::fs::path> &paths)
{
  using namespace horn;

  std::vector<rule_definition> rules;
  for (const std::fs::path &path : paths)
  {
    info("\e[1mloading program from {}\e[0m", path.c_str());
    const std::string text = read_file(path);
    try
    {
      std::vector<rule_definition> filerules = parse_program(text, path.string());
      for (rule_definition &def : filerules)
        rules.push_back(std::move(def));
    }
    catch (const syntax_error &exn)
    {
      error("{}", exn.display(text, path.string()));
      throw;
    }
  }
  return program {rules};
}


static void
print_help()
{
  std::cout << "Enter comma-separated calls to query the program, e.g.\n"
            << "  Member x [1, 2, 3]\n"
            << "Commands:\n"
            << "  :limit [N]    report at most N solutions (no limit if omitted)\n"
            << "  :vars [a ...] report only the given variables (all if omitted)\n"
            << "  :help         show this message\n";
}


// Handle a REPL command; returns false for unknown commands
static bool
run_command(const std::string &line, query_settings &settings)
{
  std::istringstream input {line};
  std::string command;
  input >> command;

  if (command == ":help")
  {
    print_help();
    return true;
  }

  if (command == ":limit")
  {
    size_t limit = 0;
    if (input >> limit)
    {
      settings.limit = limit;
      std::cout << "limit: " << limit << std::endl;
    }
    else
    {
      settings.limit = std::nullopt;
      std::cout << "limit: none" << std::endl;
    }
    return true;
  }

  if (command == ":vars")
  {
    std::string rest;
    std::getline(input, rest);
    std::vector<std::string> vars = horn::split_variables(rest);
    if (vars.empty())
    {
      settings.vars = std::nullopt;
      std::cout << "vars: all" << std::endl;
    }
    else
    {
      settings.vars = std::move(vars);
      std::cout << "vars: " << rest << std::endl;
    }
    return true;
  }

  return false;
}


static void
read_eval_print_loop(const horn::program &prog)
{
  using namespace horn;

  // Initialize readline
  init_readline();
  const std::vector<std::string> symbols = prog.symbols();
  add_completions(symbols);

  query_settings settings;
  for (std::string line; prompt_line("?- ", line); line.clear())
  {
    if (line.find_first_not_of(" \t") == std::string::npos)
      continue;

    if (line.front() == ':')
    {
      if (not run_command(line, settings))
        std::cout << "unknown command; try :help" << std::endl;
      continue;
    }

    try
    {
      const size_t count =
          prog.print_query(std::cout, line, settings.vars, settings.limit);
      if (count == 0)
        std::cout << "no." << std::endl;
    }
    catch (const bad_code &exn)
    {
      std::cout << exn.display(line, query_source) << std::endl;
    }
    catch (const std::invalid_argument &exn)
    {
      std::cout << exn.what() << std::endl;
    }
  }

  // Clean up readline before exiting
  cleanup_readline();
}


int
main(int argc, char **argv)
{
  namespace po = boost::program_options;
  using namespace horn;

  GC_INIT();

  std::string verbosity {loglevel_name(loglevel::warning)};
  std::vector<std::string> flags;
  std::vector<std::fs::path> files;
  std::vector<std::string> queries;
  std::string vars;
  size_t limit = 0;

  // Define command line options
  po::options_description desc {"Allowed options"};
  desc.add_options()
    ("help,h", "produce help message")
    ("program-file", po::value<std::vector<std::fs::path>>(&files), "program file to load")
    ("query,q", po::value<std::vector<std::string>>(&queries), "run query and exit")
    ("limit,n", po::value<size_t>(&limit), "report at most N solutions per query")
    ("vars", po::value<std::string>(&vars), "report only these (space-separated) variables")
    ("verbosity,v", po::value<std::string>(&verbosity)->implicit_value("debug"), "verbosity")
    ("flag,f", po::value<std::vector<std::string>>(&flags), "flags")
    ("timing", "report time spent in the engine");

  po::positional_options_description posdesc;
  posdesc.add("program-file", -1);

  po::variables_map varmap;
  try
  {
    auto parsedopts = po::command_line_parser(argc, argv)
                          .options(desc)
                          .positional(posdesc)
                          .run();
    po::store(parsedopts, varmap);
    po::notify(varmap);
  }
  catch (const po::error &e)
  {
    error("{}", e.what());
    std::cerr << desc << std::endl;
    return EXIT_FAILURE;
  }

  // Print help
  if (varmap.contains("help"))
  {
    std::cout << "Usage: " << argv[0] << " [options] [program-file...]" << std::endl;
    std::cout << desc << std::endl;
    return EXIT_SUCCESS;
  }

  // Set global log-level
  try
  {
    loglevel = parse_loglevel(verbosity);
  }
  catch (const std::runtime_error &exn)
  {
    error("{}", exn.what());
    return EXIT_FAILURE;
  }
  const bool timing = varmap.contains("timing");
  if (timing and not (loglevel >= loglevel::info))
    loglevel = loglevel::info;

  // Set global flags
  for (const std::string &flag : flags)
    global_flags.emplace(flag);

  query_settings settings;
  if (varmap.contains("limit"))
    settings.limit = limit;
  if (varmap.contains("vars"))
    settings.vars = split_variables(vars);

  std::optional<program> prog;
  try
  {
    prog = load_program(files);
  }
  catch (const std::runtime_error &)
  {
    // Already reported
    return EXIT_FAILURE;
  }

  if (queries.empty())
    read_eval_print_loop(*prog);
  else
  {
    for (const std::string &text : queries)
    {
      try
      {
        prog->print_query(std::cout, text, settings.vars, settings.limit);
      }
      catch (const bad_code &exn)
      {
        error("{}", exn.display(text, query_source));
        return EXIT_FAILURE;
      }
      catch (const std::invalid_argument &exn)
      {
        error("{}", exn.what());
        return EXIT_FAILURE;
      }
    }
  }

  if (timing)
    execution_timer::report_global_stats();

  return EXIT_SUCCESS;
}
