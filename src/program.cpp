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


#include "horn/program.hpp"
#include "horn/logging.hpp"
#include "horn/parser.hpp"
#include "horn/utilities/execution_timer.hpp"

#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>


// Visit every call of a goal that is not yet forced
template <typename F>
static void
_for_each_call(horn::goal g, F &&f)
{
  using namespace horn;

  const goal_node *node = g.node();
  switch (node->kind)
  {
    case goal_kind::conj:
    case goal_kind::disj:
      _for_each_call(goal {node->first}, f);
      _for_each_call(goal {node->second}, f);
      break;

    case goal_kind::suspend:
      if (const auto call = dynamic_cast<const call_thunk*>(node->delayed))
        f(*call);
      break;

    default:
      break;
  }
}


// Warn about calls of undefined relations in rule bodies
static void
_check_bodies(const horn::database &db)
{
  using namespace horn;

  db.for_each([&](const relation &rel) {
    for (const clause &c : rel.clauses())
    {
      const rule *r = std::get_if<rule>(&c.form);
      if (r == nullptr)
        continue;

      environment env = fresh_environment(r->body.fvs);
      _for_each_call(r->body(db, {}, env), [&](const call_thunk &call) {
        if (db.find(call.symbol()) != nullptr)
          return;
        if (call.location())
          warning("{}: {} calls undefined relation {}",
                  display_location(*call.location()), rel.symbol(),
                  call.symbol());
        else
          warning("{} calls undefined relation {}", rel.symbol(),
                  call.symbol());
      });
    }
  });
}


horn::program::program()
: m_db {std::make_shared<const database>()}
{ }


horn::program::program(std::span<const rule_definition> rules)
: m_db {std::make_shared<const database>(rules)}
{
  _check_bodies(*m_db);
  if (global_flags.contains("DebugLoad"))
    debug("loaded {} clauses of {} predicates", rules.size(), m_db->size());
}


horn::program
horn::program::load(std::string_view text, std::string_view source)
{
  HORN_FUNCTION_BENCHMARK
  const std::vector<rule_definition> rules = parse_program(text, source);
  return program {rules};
}


horn::program
horn::program::load_file(const std::filesystem::path &path)
{
  std::ifstream file {path};
  if (not file)
    throw std::runtime_error {
        std::format("failed to open file {}", path.string())};

  std::ostringstream buf;
  buf << file.rdbuf();
  return load(buf.str(), path.string());
}


horn::solutions
horn::program::query(std::string_view text,
                     std::optional<std::vector<std::string>> vars,
                     std::optional<size_t> limit) const
{
  HORN_FUNCTION_BENCHMARK

  compiled_goal q = parse_query(text);

  // Report all variables of the query unless told otherwise
  std::vector<std::string> names =
      vars ? std::move(*vars)
           : std::vector<std::string> {q.fvs.begin(), q.fvs.end()};
  for (const std::string &name : names)
  {
    if (not q.fvs.contains(name))
      throw std::invalid_argument {
          std::format("variable {} does not occur in the query", name)};
  }

  environment env = fresh_environment(q.fvs);
  const goal g = q(*m_db, {}, env);

  // Calls written in the query itself must be resolvable before searching
  _for_each_call(g, [&](const call_thunk &call) {
    if (m_db->find(call.symbol()) != nullptr)
      return;
    if (call.location())
      throw undefined_relation {call.symbol(), *call.location()};
    throw undefined_relation {call.symbol()};
  });

  if (global_flags.contains("DebugQuery"))
  {
    std::ostringstream buf;
    write(buf, g);
    debug("query {}", buf.str());
  }

  stl::vector<value> reported;
  reported.reserve(names.size());
  for (const std::string &name : names)
    reported.push_back(env.at(name));

  return solutions {m_db, std::move(q), g, std::move(reported),
                    std::move(names), limit};
}


horn::solutions
horn::program::query(std::string_view text, std::string_view vars,
                     std::optional<size_t> limit) const
{ return query(text, split_variables(vars), limit); }


size_t
horn::program::print_query(std::ostream &os, std::string_view text,
                           std::optional<std::vector<std::string>> vars,
                           std::optional<size_t> limit) const
{
  size_t count = 0;
  for (const solution &sol : query(text, std::move(vars), limit))
  {
    write(os, sol);
    os << std::endl;
    count += 1;
  }
  return count;
}


std::vector<std::string>
horn::split_variables(std::string_view vars)
{
  std::vector<std::string> result;
  std::istringstream input {std::string {vars}};
  std::string name;
  while (input >> name)
    result.push_back(name);
  return result;
}
