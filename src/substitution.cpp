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


#include "horn/substitution.hpp"

#include <algorithm>
#include <functional>


static int
_height(const horn::binding *b) noexcept
{ return b ? b->height : 0; }


static const horn::binding*
_node(horn::object *var, horn::object *val, const horn::binding *left,
      const horn::binding *right)
{
  using namespace horn;
  const int height = 1 + std::max(_height(left), _height(right));
  return make<binding>(var, val, left, right, height);
}


// Join two subtrees around a binding, rotating when their heights differ by 2
static const horn::binding*
_balance(horn::object *var, horn::object *val, const horn::binding *l,
         const horn::binding *r)
{
  if (_height(l) > _height(r) + 1)
  {
    if (_height(l->left) >= _height(l->right))
      return _node(l->var, l->val, l->left, _node(var, val, l->right, r));
    const horn::binding *lr = l->right;
    return _node(lr->var, lr->val, _node(l->var, l->val, l->left, lr->left),
                 _node(var, val, lr->right, r));
  }

  if (_height(r) > _height(l) + 1)
  {
    if (_height(r->right) >= _height(r->left))
      return _node(r->var, r->val, _node(var, val, l, r->left), r->right);
    const horn::binding *rl = r->left;
    return _node(rl->var, rl->val, _node(var, val, l, rl->left),
                 _node(r->var, r->val, rl->right, r->right));
  }

  return _node(var, val, l, r);
}


static const horn::binding*
_insert(const horn::binding *b, horn::object *var, horn::object *val)
{
  if (b == nullptr)
    return _node(var, val, nullptr, nullptr);

  const std::less<const horn::object*> less;
  if (less(var, b->var))
    return _balance(b->var, b->val, _insert(b->left, var, val), b->right);
  if (less(b->var, var))
    return _balance(b->var, b->val, b->left, _insert(b->right, var, val));
  return _node(var, val, b->left, b->right);
}


bool
horn::substitution::lookup(value var, value &result) const noexcept
{
  const std::less<const object*> less;
  const object *key = &*var;
  const binding *b = m_root;
  while (b)
  {
    if (less(key, b->var))
      b = b->left;
    else if (less(b->var, key))
      b = b->right;
    else
    {
      result = value {b->val};
      return true;
    }
  }
  return false;
}


horn::value
horn::substitution::walk(value x) const noexcept
{
  while (isvar(x) and lookup(x, x));
  return x;
}


horn::value
horn::substitution::walk_all(value x) const
{
  keep_unbound_variables keep;
  return reify(x, *this, keep);
}


horn::substitution
horn::substitution::extend(value var, value val) const
{
  assert(isvar(var));
  return substitution {_insert(m_root, &*var, &*val), m_size + 1};
}


std::optional<horn::substitution>
horn::unify(value a, value b, const substitution &s)
{
  substitution result = s;
  while (true)
  {
    a = result.walk(a);
    b = result.walk(b);

    if (is(a, b))
      return result;

    if (isvar(a))
      return result.extend(a, b);
    if (isvar(b))
      return result.extend(b, a);

    if (a->t != b->t)
      return std::nullopt;

    switch (a->t)
    {
      case tag::nil:
        return result;

      case tag::atom:
        if (functor(a) == functor(b))
          return result;
        return std::nullopt;

      case tag::num:
        if (a->num == b->num)
          return result;
        return std::nullopt;

      case tag::str:
        if (str_view(a) == str_view(b))
          return result;
        return std::nullopt;

      case tag::compound: {
        if (functor(a) != functor(b) or arity(a) != arity(b))
          return std::nullopt;
        for (size_t i = 0; i < arity(a); ++i)
        {
          const auto next = unify(argument(a, i), argument(b, i), result);
          if (not next)
            return std::nullopt;
          result = *next;
        }
        return result;
      }

      case tag::cons: {
        // Heads recursively, tails by iteration
        const auto next = unify(car(a), car(b), result);
        if (not next)
          return std::nullopt;
        result = *next;
        a = cdr(a);
        b = cdr(b);
        continue;
      }

      case tag::var:
        // Unreachable: variables are handled above
        break;
    }
    std::terminate();
  }
}

