/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "mbvi/data/data_source.h"

namespace mbvi {
namespace data {

// A data set held in memory as an N x D matrix, one observation per row.
class InMemoryDataSource : public DataSource {
 public:
  explicit InMemoryDataSource(
      const Eigen::MatrixXd& observations,
      SamplingScheme scheme = SamplingScheme::WITH_REPLACEMENT,
      uint seed = 5123401);

  uint size() const override {
    return static_cast<uint>(_observations.rows());
  }
  uint dim() const override {
    return static_cast<uint>(_observations.cols());
  }
  Batch next_batch(uint batch_size) override;
  Batch get(const std::vector<uint>& indices) const override;

  const Eigen::MatrixXd& observations() const {
    return _observations;
  }

 private:
  Eigen::MatrixXd _observations;
  IndexSampler _sampler;
};

} // namespace data
} // namespace mbvi
