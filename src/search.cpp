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


#include "horn/search.hpp"

#include <exception>
#include <ranges>


////////////////////////////////////////////////////////////////////////////////
//
//                                Goals
//
static const horn::goal_node succeed_node {
    horn::goal_kind::succeed, nullptr, nullptr, nullptr, nullptr, nullptr};
static const horn::goal_node fail_node {
    horn::goal_kind::fail, nullptr, nullptr, nullptr, nullptr, nullptr};


horn::goal
horn::succeed()
{ return goal {&succeed_node}; }


horn::goal
horn::fail()
{ return goal {&fail_node}; }


horn::goal
horn::eq(value a, value b)
{
  return goal {
      make<goal_node>(goal_kind::unify, &*a, &*b, nullptr, nullptr, nullptr)};
}


horn::goal
horn::conj(goal g1, goal g2)
{
  return goal {make<goal_node>(goal_kind::conj, nullptr, nullptr, g1.node(),
                               g2.node(), nullptr)};
}


horn::goal
horn::disj(goal g1, goal g2)
{
  return goal {make<goal_node>(goal_kind::disj, nullptr, nullptr, g1.node(),
                               g2.node(), nullptr)};
}


horn::goal
horn::suspend(const thunk *delayed)
{
  assert(delayed != nullptr);
  return goal {make<goal_node>(goal_kind::suspend, nullptr, nullptr, nullptr,
                               nullptr, delayed)};
}


horn::goal
horn::conj_all(std::span<const goal> goals)
{
  goal acc = succeed();
  for (const goal g : goals | std::views::reverse)
    acc = conj(g, acc);
  return acc;
}


horn::goal
horn::disj_all(std::span<const goal> goals)
{
  goal acc = fail();
  for (const goal g : goals | std::views::reverse)
    acc = disj(g, acc);
  return acc;
}


void
horn::write(std::ostream &os, goal g)
{
  const goal_node *node = g.node();
  switch (node->kind)
  {
    case goal_kind::succeed:
      os << "succeed";
      break;

    case goal_kind::fail:
      os << "fail";
      break;

    case goal_kind::unify:
      os << "(= " << value {node->lhs} << ' ' << value {node->rhs} << ')';
      break;

    case goal_kind::conj:
    case goal_kind::disj:
      os << (node->kind == goal_kind::conj ? "(and " : "(or ");
      write(os, goal {node->first});
      os << ' ';
      write(os, goal {node->second});
      os << ')';
      break;

    case goal_kind::suspend:
      os << "(delay ";
      node->delayed->describe(os);
      os << ')';
      break;
  }
}


////////////////////////////////////////////////////////////////////////////////
//
//                               Streams
//
namespace horn {

enum class stream_kind {
  empty,  /**< No more states */
  mature, /**< State available now, followed by `rest` */
  pause,  /**< Goal waiting to be started on `state` */
  mplus,  /**< Interleaving of `first` and `second` */
  bind,   /**< `goal` to be solved in every state of `first` */
};

struct stream_node {
  stream_kind kind;
  substitution state;
  const goal_node *goal;
  const stream_node *first, *second;
}; // struct horn::stream_node

} // namespace horn


static const horn::stream_node empty_stream {
    horn::stream_kind::empty, horn::substitution {}, nullptr, nullptr, nullptr};


static const horn::stream_node *
_mature(const horn::substitution &s, const horn::stream_node *rest)
{
  using namespace horn;
  return make<stream_node>(stream_kind::mature, s, nullptr, rest, nullptr);
}

static const horn::stream_node *
_pause(const horn::goal_node *g, const horn::substitution &s)
{
  using namespace horn;
  return make<stream_node>(stream_kind::pause, s, g, nullptr, nullptr);
}

static const horn::stream_node *
_mplus(const horn::stream_node *a, const horn::stream_node *b)
{
  using namespace horn;
  return make<stream_node>(stream_kind::mplus, substitution {}, nullptr, a, b);
}

static const horn::stream_node *
_bind(const horn::stream_node *a, const horn::goal_node *g)
{
  using namespace horn;
  return make<stream_node>(stream_kind::bind, substitution {}, g, a, nullptr);
}


// Begin solving a goal; subgoals are paused, so this never recurses
static const horn::stream_node *
_start(const horn::goal_node *g, const horn::substitution &s)
{
  using namespace horn;

  switch (g->kind)
  {
    case goal_kind::succeed:
      return _mature(s, &empty_stream);

    case goal_kind::fail:
      return &empty_stream;

    case goal_kind::unify:
      if (const auto next = unify(value {g->lhs}, value {g->rhs}, s))
        return _mature(*next, &empty_stream);
      return &empty_stream;

    case goal_kind::conj:
      return _bind(_pause(g->first, s), g->second);

    case goal_kind::disj:
      return _mplus(_pause(g->first, s), _pause(g->second, s));

    case goal_kind::suspend:
      return _pause(g->delayed->force().node(), s);
  }
  std::terminate();
}


// Advance a stream that is neither empty nor mature by one step
static const horn::stream_node *
_step(const horn::stream_node *x)
{
  using namespace horn;

  switch (x->kind)
  {
    case stream_kind::empty:
    case stream_kind::mature:
      return x;

    case stream_kind::pause:
      return _start(x->goal, x->state);

    case stream_kind::mplus: {
      const stream_node *a = x->first;
      switch (a->kind)
      {
        case stream_kind::empty:
          return x->second;
        case stream_kind::mature:
          // Hand the turn over to the other branch
          return _mature(a->state, _mplus(x->second, a->first));
        default:
          return _mplus(x->second, _step(a));
      }
    }

    case stream_kind::bind: {
      const stream_node *a = x->first;
      switch (a->kind)
      {
        case stream_kind::empty:
          return &empty_stream;
        case stream_kind::mature:
          return _mplus(_pause(x->goal, a->state), _bind(a->first, x->goal));
        default:
          return _bind(_step(a), x->goal);
      }
    }
  }
  std::terminate();
}


horn::answer_stream::answer_stream(goal g, const substitution &s)
: m_current {_pause(g.node(), s)}, m_steps {0}
{ }


bool
horn::answer_stream::exhausted() const noexcept
{ return m_current->kind == stream_kind::empty; }


std::optional<horn::substitution>
horn::answer_stream::pull()
{
  switch (m_current->kind)
  {
    case stream_kind::empty:
      return std::nullopt;

    case stream_kind::mature: {
      const substitution result = m_current->state;
      m_current = m_current->first;
      return result;
    }

    default:
      m_current = _step(m_current);
      m_steps += 1;
      return std::nullopt;
  }
}
