/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <vector>

#include "mbvi/data/data_source.h"

namespace mbvi {
namespace data {

struct SyntheticMixtureConfig {
  uint size;
  // K x D matrix of component means
  Eigen::MatrixXd means;
  double obs_scale;
  // mixture weights; empty means uniform
  std::vector<double> weights;
  uint seed;
  SamplingScheme scheme;

  SyntheticMixtureConfig(
      uint size,
      const Eigen::MatrixXd& means,
      double obs_scale = 1.0,
      std::vector<double> weights = {},
      uint seed = 5123401,
      SamplingScheme scheme = SamplingScheme::WITH_REPLACEMENT)
      : size(size),
        means(means),
        obs_scale(obs_scale),
        weights(std::move(weights)),
        seed(seed),
        scheme(scheme) {}
};

/*
A virtual data set of `size` draws from a mixture of isotropic Gaussians.
Observation n is generated on demand from a generator seeded with
(seed, n), so the data set is fixed for a given seed, costs no memory, and
may be far larger than what fits in RAM.
*/
class SyntheticMixtureSource : public DataSource {
 public:
  explicit SyntheticMixtureSource(const SyntheticMixtureConfig& config);

  uint size() const override {
    return _config.size;
  }
  uint dim() const override {
    return static_cast<uint>(_config.means.cols());
  }
  Batch next_batch(uint batch_size) override;
  Batch get(const std::vector<uint>& indices) const override;

  // the mixture component observation n was drawn from
  uint component(uint n) const;
  Eigen::RowVectorXd observation(uint n) const;
  const Eigen::MatrixXd& means() const {
    return _config.means;
  }

 private:
  std::mt19937 generator_for(uint n) const;

  SyntheticMixtureConfig _config;
  IndexSampler _sampler;
};

} // namespace data
} // namespace mbvi
