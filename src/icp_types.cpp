// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "icpmap/registration/icp_types.hpp"

namespace icpmap {

const char* toString(ICPError error) noexcept {
  switch (error) {
    case ICPError::SourceCloudEmpty:
      return "SourceCloudEmpty";
    case ICPError::TargetCloudEmpty:
      return "TargetCloudEmpty";
    case ICPError::IterationBudgetIsZero:
      return "IterationBudgetIsZero";
    case ICPError::IntervalThresholdTooLow:
      return "IntervalThresholdTooLow";
    case ICPError::AbsoluteThresholdTooLow:
      return "AbsoluteThresholdTooLow";
    case ICPError::NoNearestNeighbourFound:
      return "NoNearestNeighbourFound";
    case ICPError::DidNotConverge:
      return "DidNotConverge";
  }
  return "Unknown";
}

}  // namespace icpmap
