/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <Eigen/Dense>
#include <vector>

#include "mbvi/types.h"

namespace mbvi {
namespace data {

// A minibatch: M data indices and the M observations at those indices,
// row m of values being the observation at indices[m].
struct Batch {
  std::vector<uint> indices;
  Eigen::MatrixXd values;

  Batch() {}
  Batch(std::vector<uint> indices, Eigen::MatrixXd values)
      : indices(std::move(indices)), values(std::move(values)) {}

  uint size() const {
    return static_cast<uint>(indices.size());
  }
};

} // namespace data
} // namespace mbvi
