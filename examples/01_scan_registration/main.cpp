// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * 01_scan_registration - ICP between two scans
 *
 * Demonstrates:
 * - Loading registration parameters from YAML
 * - Aligning two simulated room scans with ICP
 * - Handling the ICPResult success / failure branches
 */

#include <icpmap/icpmap.hpp>

#include <iostream>
#include <string>

#include "../common/room_scan.hpp"
#include "../common/timer.hpp"

using namespace icpmap;

int main(int argc, char** argv) {
  std::cout << "=== 01_scan_registration ===\n" << std::endl;

  // 1. Configuration
  const std::string path =
      argc > 1 ? argv[1] : std::string(ICPMAP_CONFIG_DIR) + "/default.yaml";
  Config cfg;
  try {
    cfg = loadConfig(path);
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  const auto icp_cfg = ICPConfiguration<float>::fromConfig(cfg.registration);

  // 2. Two scans, the sensor moved between them
  const examples::Room room;
  const auto previous =
      examples::scanRoom(room, Point2f(0.0f, 0.0f), 360, 0.005f, 1);
  const auto current =
      examples::scanRoom(room, Point2f(0.25f, -0.1f), 360, 0.005f, 2);
  std::cout << "Scans: " << previous.size() << " / " << current.size()
            << " points" << std::endl;

  // 3. Register previous -> current
  ICPResult<float, 2> result = ICPError::DidNotConverge;
  {
    examples::ScopedTimer timer("ICP");
    result = icp(previous, current, icp_cfg);
  }

  // 4. Results
  if (!result) {
    std::cout << "Registration failed: " << toString(result.error())
              << std::endl;
    return 1;
  }
  const auto& success = result.value();
  const auto motion = success.transform.inverse();
  std::cout << "Converged at iteration " << success.iterations_used
            << ", mse " << success.mse << "\n"
            << "Scan delta:    t = " << success.transform.translation().transpose()
            << ", yaw = " << success.transform.rotation().angle() << "\n"
            << "Sensor motion: t = " << motion.translation().transpose()
            << " (expected 0.25 -0.1)" << std::endl;

  return 0;
}
