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

#include <chrono>
#include <string>
#include <string_view>


/**
 * Accumulate time spent in the enclosing function under its name
 *
 * Compiled away in release builds.
 */
#ifndef HORN_RELEASE_BUILD
# define HORN_FUNCTION_BENCHMARK \
    horn::execution_timer _horn_function_timer {__func__};
#else
# define HORN_FUNCTION_BENCHMARK
#endif


namespace horn {

/**
 * Measure execution time of code blocks
 *
 * Timing starts on construction and stops on destruction (or manually with
 * start() and stop()). Every stop adds the measured duration to process-wide
 * statistics keyed by the timer name, see report_global_stats().
 *
 * Usage example:
 * {
 *     execution_timer timer("parse program");
 *     // Code to measure
 * }
 */
class execution_timer {
  public:
  /**
   * Construct a new timer
   *
   * \param name Name of the operation being timed
   * \param auto_start Whether to start timing immediately
   */
  explicit execution_timer(std::string_view name, bool auto_start = true);

  ~execution_timer();

  execution_timer(const execution_timer&) = delete;
  void operator = (const execution_timer&) = delete;

  /**
   * Log accumulated statistics of all timers at info level
   */
  static void
  report_global_stats();

  /**
   * Forget accumulated statistics of all timers
   */
  static void
  reset_global_stats() noexcept;

  void
  start();

  void
  stop();

  void
  reset();

  template <typename Duration>
  Duration
  elapsed() const
  { return std::chrono::duration_cast<Duration>(m_total_duration); }

  /**
   * Log elapsed time of this timer at info level
   */
  void
  report() const;

  private:
  std::string m_name;
  bool m_running;
  std::chrono::time_point<std::chrono::steady_clock> m_start_time;
  std::chrono::nanoseconds m_total_duration;
}; // class horn::execution_timer

} // namespace horn
