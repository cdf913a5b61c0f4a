// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * timer.hpp
 *
 * Scoped wall-clock timer for examples.
 */

#ifndef EXAMPLES_COMMON_TIMER_HPP
#define EXAMPLES_COMMON_TIMER_HPP

#include <spdlog/spdlog.h>

#include <chrono>
#include <string>
#include <utility>

namespace examples {

/// Logs the elapsed time under `label` when it goes out of scope.
class ScopedTimer {
 public:
  using Clock = std::chrono::steady_clock;

  explicit ScopedTimer(std::string label)
      : label_(std::move(label)), start_(Clock::now()) {}

  ~ScopedTimer() {
    const double ms =
        std::chrono::duration<double, std::milli>(Clock::now() - start_)
            .count();
    spdlog::info("[{}] {:.3f} ms", label_, ms);
  }

  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;

 private:
  std::string label_;
  Clock::time_point start_;
};

}  // namespace examples

#endif  // EXAMPLES_COMMON_TIMER_HPP
