// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * 02_incremental_mapping - occupancy mapping from a scan stream
 *
 * Demonstrates:
 * - Building an IncrementalMapper from YAML
 * - Pushing several frames of a stationary scanner with odometry enabled
 * - Reading back cell probabilities
 */

#include <icpmap/icpmap.hpp>
#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>

#include "../common/room_scan.hpp"
#include "../common/timer.hpp"

using namespace icpmap;

namespace {

/// Coarse ASCII view: '#' occupied, '.' free, ' ' unknown.
void printAsciiMap(const OccupancyGrid<float, 2>& grid, int step) {
  const auto& dims = grid.dimensions();
  for (int y = static_cast<int>(dims[1]) - 1; y >= 0; y -= step) {
    std::string row;
    for (int x = 0; x < static_cast<int>(dims[0]); x += step) {
      float best = 0.5f;
      for (int dy = 0; dy < step; ++dy) {
        for (int dx = 0; dx < step; ++dx) {
          const auto p = grid.probability(GridIndex<2>(x + dx, y - dy));
          if (p && std::abs(*p - 0.5f) > std::abs(best - 0.5f)) best = *p;
        }
      }
      row += best > 0.6f ? '#' : (best < 0.4f ? '.' : ' ');
    }
    std::cout << row << "\n";
  }
  std::cout << std::flush;
}

}  // namespace

int main(int argc, char** argv) {
  std::cout << "=== 02_incremental_mapping ===\n" << std::endl;
  spdlog::set_level(spdlog::level::debug);

  // 1. Mapper from configuration
  const std::string path =
      argc > 1 ? argv[1] : std::string(ICPMAP_CONFIG_DIR) + "/default.yaml";
  try {
    const Config cfg = loadConfig(path);
    auto mapper = IncrementalMapper<float, 2>::fromConfig(cfg.mapper);

    // 2. Stream frames
    const examples::Room room;
    for (std::uint32_t frame = 0; frame < 5; ++frame) {
      const auto scan =
          examples::scanRoom(room, Point2f(0.0f, 0.0f), 720, 0.01f, frame);
      examples::ScopedTimer timer("Frame " + std::to_string(frame));
      mapper.pushPointCloud(scan, true);
    }

    // 3. Results
    const auto pose = mapper.currentPose();
    std::cout << "Frame index: " << static_cast<int>(mapper.frameIndex())
              << "\nPose (cells): " << pose.translation().transpose()
              << ", yaw " << pose.rotation().angle() << std::endl;

    const GridIndex<2> wall(
        static_cast<int>(pose.translation().x() +
                         room.half_width * mapper.resolution()),
        static_cast<int>(pose.translation().y()));
    if (const auto p = mapper.grid().probability(wall)) {
      std::cout << "P(occupied) at east wall: " << *p << std::endl;
    }
    printAsciiMap(mapper.grid(), 8);
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  return 0;
}
