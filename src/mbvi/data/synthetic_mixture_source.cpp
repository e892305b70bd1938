/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <stdexcept>

#include "mbvi/data/synthetic_mixture_source.h"

namespace mbvi {
namespace data {

SyntheticMixtureSource::SyntheticMixtureSource(
    const SyntheticMixtureConfig& config)
    : _config(config), _sampler(config.size, config.scheme, config.seed) {
  if (config.means.rows() == 0 or config.means.cols() == 0) {
    throw std::invalid_argument("mixture needs at least one component");
  }
  if (config.obs_scale <= 0) {
    throw std::invalid_argument("obs_scale must be positive");
  }
  if (_config.weights.empty()) {
    _config.weights.assign(config.means.rows(), 1.0);
  }
  if (_config.weights.size() != static_cast<size_t>(config.means.rows())) {
    throw std::invalid_argument("need one mixture weight per component");
  }
}

std::mt19937 SyntheticMixtureSource::generator_for(uint n) const {
  std::seed_seq seq{_config.seed, n};
  return std::mt19937(seq);
}

uint SyntheticMixtureSource::component(uint n) const {
  std::mt19937 gen = generator_for(n);
  std::discrete_distribution<uint> pick(
      _config.weights.begin(), _config.weights.end());
  return pick(gen);
}

Eigen::RowVectorXd SyntheticMixtureSource::observation(uint n) const {
  if (n >= _config.size) {
    throw std::out_of_range("index " + std::to_string(n) + " is out of range");
  }
  // the component is drawn first from the same stream, see component()
  std::mt19937 gen = generator_for(n);
  std::discrete_distribution<uint> pick(
      _config.weights.begin(), _config.weights.end());
  uint k = pick(gen);
  std::normal_distribution<double> noise(0.0, _config.obs_scale);
  Eigen::RowVectorXd x(dim());
  for (uint d = 0; d < dim(); d++) {
    x(d) = _config.means(k, d) + noise(gen);
  }
  return x;
}

Batch SyntheticMixtureSource::next_batch(uint batch_size) {
  return get(_sampler.next(batch_size));
}

Batch SyntheticMixtureSource::get(const std::vector<uint>& indices) const {
  Eigen::MatrixXd values(indices.size(), dim());
  for (size_t m = 0; m < indices.size(); m++) {
    values.row(m) = observation(indices[m]);
  }
  return Batch(indices, std::move(values));
}

} // namespace data
} // namespace mbvi
