// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef ICPMAP_CONFIG_ICPMAP_HPP
#define ICPMAP_CONFIG_ICPMAP_HPP

#include <string>

namespace YAML {
class Node;
}

#include "icpmap/config/mapper.hpp"
#include "icpmap/config/registration.hpp"

namespace icpmap {

/// Top-level configuration for icpmap.
struct Config {
  config::Registration registration;
  config::Mapper mapper;
};

/**
 * @brief Parse and validate a configuration tree. Missing keys keep defaults.
 * @throws std::invalid_argument on values that make the math undefined
 */
Config parseConfig(const YAML::Node& root);

/// @throws std::runtime_error if the file cannot be read or parsed
Config loadConfig(const std::string& path);

}  // namespace icpmap

#endif  // ICPMAP_CONFIG_ICPMAP_HPP
