/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "mbvi/types.h"

namespace mbvi {

std::string to_string(SiteKind kind) {
  switch (kind) {
    case SiteKind::GLOBAL:
      return "GLOBAL";
    case SiteKind::LOCAL:
      return "LOCAL";
    case SiteKind::OBSERVED:
      return "OBSERVED";
    default:
      return "UNKNOWN";
  }
}

std::string to_string(VariationalFamily family) {
  switch (family) {
    case VariationalFamily::NONE:
      return "NONE";
    case VariationalFamily::NORMAL:
      return "NORMAL";
    case VariationalFamily::CATEGORICAL:
      return "CATEGORICAL";
    case VariationalFamily::EMPIRICAL:
      return "EMPIRICAL";
    default:
      return "UNKNOWN";
  }
}

std::string to_string(InferenceMode mode) {
  return mode == InferenceMode::LOCAL ? "LOCAL" : "GLOBAL";
}

} // namespace mbvi
