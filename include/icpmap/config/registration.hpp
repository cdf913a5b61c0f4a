// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * registration.hpp
 *
 * Default ICP parameters for standalone scan registration.
 */

#ifndef ICPMAP_CONFIG_REGISTRATION_HPP
#define ICPMAP_CONFIG_REGISTRATION_HPP

#include <optional>

namespace icpmap::config {

struct Registration {
  bool use_spatial_index = true;
  int max_iterations = 50;
  std::optional<double> mse_absolute_threshold;  ///< Unset: interval test only
  double mse_interval_threshold = 0.01;
};

}  // namespace icpmap::config

#endif  // ICPMAP_CONFIG_REGISTRATION_HPP
