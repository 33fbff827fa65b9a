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


#include "horn/utilities/execution_timer.hpp"
#include "horn/logging.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <unordered_map>


namespace horn {

struct _timer_stats {
  std::chrono::nanoseconds total {0};
  std::chrono::nanoseconds max {0};
  size_t count = 0;
};

static std::unordered_map<std::string, _timer_stats> &
_global_stats()
{
  static std::unordered_map<std::string, _timer_stats> stats;
  return stats;
}

static std::string
_format_duration(std::chrono::nanoseconds duration)
{
  const double ms = std::chrono::duration<double, std::milli>(duration).count();
  if (ms < 1.0)
    return std::format("{:.3f} μs", ms * 1000.0);
  else if (ms < 1000.0)
    return std::format("{:.3f} ms", ms);
  else
    return std::format("{:.3f} s", ms / 1000.0);
}


execution_timer::execution_timer(std::string_view name, bool auto_start)
: m_name {name},
  m_running {false},
  m_total_duration {std::chrono::nanoseconds::zero()}
{
  if (auto_start)
    start();
}

execution_timer::~execution_timer()
{
  if (m_running)
    stop();
}

void
execution_timer::start()
{
  if (not m_running)
  {
    m_start_time = std::chrono::steady_clock::now();
    m_running = true;
  }
}

void
execution_timer::stop()
{
  if (m_running)
  {
    const auto duration = std::chrono::steady_clock::now() - m_start_time;
    m_total_duration += duration;
    m_running = false;

    _timer_stats &stats = _global_stats()[m_name];
    stats.total += duration;
    stats.max = std::max<std::chrono::nanoseconds>(stats.max, duration);
    stats.count += 1;
  }
}

void
execution_timer::reset()
{
  m_running = false;
  m_total_duration = std::chrono::nanoseconds::zero();
}

void
execution_timer::report() const
{
  info("\e[1m{}\e[0m completed in {}", m_name,
       _format_duration(m_total_duration));
}

void
execution_timer::report_global_stats()
{
  // Longest total first
  std::multimap<std::chrono::nanoseconds, std::string, std::greater<>> entries;
  for (const auto &[name, stats] : _global_stats())
  {
    entries.emplace(stats.total,
                    std::format("\e[1m{:20}\e[0m - calls: {}, total: {}, max: {}",
                                name, stats.count,
                                _format_duration(stats.total),
                                _format_duration(stats.max)));
  }

  for (const auto &[_, text] : entries)
    info("{}", text);
}

void
execution_timer::reset_global_stats() noexcept
{ _global_stats().clear(); }

} // namespace horn
