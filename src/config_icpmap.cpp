// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * config_icpmap.cpp
 *
 * YAML configuration loading.
 *
 *  Created on: Apr 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>

#include "icpmap/config/icpmap.hpp"

namespace icpmap {
namespace detail {

template <typename T>
void load(const YAML::Node& node, const std::string& key, T& value) {
  if (node[key]) {
    value = node[key].as<T>();
  }
}

template <typename T>
void load(const YAML::Node& node, const std::string& key,
          std::optional<T>& value) {
  if (node[key] && !node[key].IsNull()) {
    value = node[key].as<T>();
  }
}

Config parse(const YAML::Node& root) {
  Config cfg;

  // Standalone registration
  if (auto n = root["registration"]) {
    auto& r = cfg.registration;
    load(n, "use_spatial_index", r.use_spatial_index);
    load(n, "max_iterations", r.max_iterations);
    load(n, "mse_absolute_threshold", r.mse_absolute_threshold);
    load(n, "mse_interval_threshold", r.mse_interval_threshold);
  }

  // Mapper
  if (auto n = root["mapper"]) {
    auto& m = cfg.mapper;
    load(n, "dimensions", m.dimensions);
    load(n, "resolution", m.resolution);
    if (auto o = n["occupancy"]) {
      load(o, "occupied_factor", m.occupancy.occupied_factor);
      load(o, "free_factor", m.occupancy.free_factor);
      load(o, "max_confidence", m.occupancy.max_confidence);
    }
    if (auto o = n["odometry"]) {
      load(o, "enabled", m.odometry.enabled);
      load(o, "use_spatial_index", m.odometry.use_spatial_index);
      load(o, "max_iterations", m.odometry.max_iterations);
      load(o, "mse_interval_threshold", m.odometry.mse_interval_threshold);
      load(o, "voxel_size", m.odometry.voxel_size);
    }
  }

  return cfg;
}

void requireAboveEpsilon(const std::string& name, double value) {
  if (!(value > std::numeric_limits<double>::epsilon())) {
    throw std::invalid_argument(name + " (" + std::to_string(value) +
                                ") must exceed machine epsilon");
  }
}

void validate(Config& cfg) {
  // --- Fatal: values that make registration or the grid undefined ---
  const auto& r = cfg.registration;
  if (r.max_iterations <= 0) {
    throw std::invalid_argument("registration.max_iterations (" +
                                std::to_string(r.max_iterations) +
                                ") must be > 0");
  }
  requireAboveEpsilon("registration.mse_interval_threshold",
                      r.mse_interval_threshold);
  if (r.mse_absolute_threshold) {
    requireAboveEpsilon("registration.mse_absolute_threshold",
                        *r.mse_absolute_threshold);
  }

  auto& m = cfg.mapper;
  if (!(m.resolution > 0.0) || !std::isfinite(m.resolution)) {
    throw std::invalid_argument("mapper.resolution (" +
                                std::to_string(m.resolution) +
                                ") must be finite and > 0");
  }
  for (std::size_t i = 0; i < m.dimensions.size(); ++i) {
    if (m.dimensions[i] == 0) {
      throw std::invalid_argument("mapper.dimensions[" + std::to_string(i) +
                                  "] must be > 0");
    }
  }
  if (!(m.occupancy.occupied_factor > 1.0) ||
      !(m.occupancy.free_factor > 1.0)) {
    throw std::invalid_argument(
        "mapper.occupancy: occupied_factor (" +
        std::to_string(m.occupancy.occupied_factor) + ") and free_factor (" +
        std::to_string(m.occupancy.free_factor) + ") must be > 1");
  }
  if (!(m.occupancy.max_confidence > 0.0) ||
      !std::isfinite(m.occupancy.max_confidence)) {
    throw std::invalid_argument("mapper.occupancy.max_confidence (" +
                                std::to_string(m.occupancy.max_confidence) +
                                ") must be finite and > 0");
  }
  if (m.odometry.max_iterations <= 0) {
    throw std::invalid_argument("mapper.odometry.max_iterations (" +
                                std::to_string(m.odometry.max_iterations) +
                                ") must be > 0");
  }
  requireAboveEpsilon("mapper.odometry.mse_interval_threshold",
                      m.odometry.mse_interval_threshold);

  // --- Non-fatal: warn and clamp ---
  if (m.odometry.voxel_size < 0.0) {
    spdlog::warn(
        "[Config] mapper.odometry.voxel_size ({}) must be >= 0, clamping to 0",
        m.odometry.voxel_size);
    m.odometry.voxel_size = 0.0;
  }

  // Below the golden ratio ln(f - 1/f) turns negative and the update flips.
  const double golden_ratio = (1.0 + std::sqrt(5.0)) / 2.0;
  if (m.occupancy.occupied_factor <= golden_ratio) {
    spdlog::warn(
        "[Config] mapper.occupancy.occupied_factor ({}) <= {:.3f}, hits will "
        "lower occupancy",
        m.occupancy.occupied_factor, golden_ratio);
  }
  if (m.occupancy.free_factor <= golden_ratio) {
    spdlog::warn(
        "[Config] mapper.occupancy.free_factor ({}) <= {:.3f}, pass-throughs "
        "will raise occupancy",
        m.occupancy.free_factor, golden_ratio);
  }
}

}  // namespace detail

Config parseConfig(const YAML::Node& root) {
  auto cfg = detail::parse(root);
  detail::validate(cfg);
  return cfg;
}

Config loadConfig(const std::string& path) {
  try {
    return parseConfig(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load config: " + path + " - " +
                             e.what());
  }
}

}  // namespace icpmap
