/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <stdexcept>

#include "mbvi/data/in_memory_source.h"

namespace mbvi {
namespace data {

InMemoryDataSource::InMemoryDataSource(
    const Eigen::MatrixXd& observations,
    SamplingScheme scheme,
    uint seed)
    : _observations(observations),
      _sampler(static_cast<uint>(observations.rows()), scheme, seed) {
  if (observations.cols() == 0) {
    throw std::invalid_argument("observations must have at least one column");
  }
}

Batch InMemoryDataSource::next_batch(uint batch_size) {
  return get(_sampler.next(batch_size));
}

Batch InMemoryDataSource::get(const std::vector<uint>& indices) const {
  Eigen::MatrixXd values(indices.size(), _observations.cols());
  for (size_t m = 0; m < indices.size(); m++) {
    if (indices[m] >= size()) {
      throw std::out_of_range(
          "index " + std::to_string(indices[m]) + " is out of range");
    }
    values.row(m) = _observations.row(indices[m]);
  }
  return Batch(indices, std::move(values));
}

} // namespace data
} // namespace mbvi
