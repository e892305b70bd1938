/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <cmath>
#include <limits>
#include <stdexcept>

#include "mbvi/distribution/categorical.h"
#include "mbvi/util.h"

namespace mbvi {
namespace distribution {

Categorical::Categorical(const Eigen::MatrixXd& logits) {
  if (logits.cols() == 0) {
    throw std::invalid_argument("Categorical needs at least one outcome");
  }
  _log_probs.resize(logits.rows(), logits.cols());
  for (Eigen::Index r = 0; r < logits.rows(); r++) {
    _log_probs.row(r) = logits.row(r).array() - util::log_sum_exp(logits.row(r));
  }
}

Eigen::MatrixXd Categorical::probs() const {
  return _log_probs.array().exp();
}

std::vector<uint> Categorical::sample(std::mt19937& gen) const {
  Eigen::MatrixXd p = probs();
  std::vector<uint> result;
  result.reserve(p.rows());
  for (Eigen::Index r = 0; r < p.rows(); r++) {
    // copy the row out since discrete_distribution wants an iterator range
    std::vector<double> weights(p.cols());
    for (Eigen::Index k = 0; k < p.cols(); k++) {
      weights[k] = p(r, k);
    }
    std::discrete_distribution<uint> distrib(weights.begin(), weights.end());
    result.push_back(distrib(gen));
  }
  return result;
}

double Categorical::log_prob(const std::vector<uint>& values) const {
  if (values.size() != static_cast<size_t>(_log_probs.rows())) {
    throw std::invalid_argument(
        "Categorical::log_prob expects one value per row");
  }
  double result = 0.0;
  for (size_t r = 0; r < values.size(); r++) {
    if (values[r] >= num_outcomes()) {
      return -std::numeric_limits<double>::infinity();
    }
    result += _log_probs(r, values[r]);
  }
  return result;
}

double Categorical::entropy() const {
  return -(_log_probs.array().exp() * _log_probs.array()).sum();
}

double Categorical::expected_payoff_with_entropy(
    const Eigen::MatrixXd& payoff,
    Eigen::MatrixXd& grad) const {
  if (payoff.rows() != _log_probs.rows() or
      payoff.cols() != _log_probs.cols()) {
    throw std::invalid_argument(
        "payoff must have one entry per row and outcome");
  }
  Eigen::ArrayXXd p = _log_probs.array().exp();
  // f(r, k) - log q_r(k)
  Eigen::ArrayXXd centered = payoff.array() - _log_probs.array();
  Eigen::ArrayXd per_row = (p * centered).rowwise().sum();
  grad = (p * (centered.colwise() - per_row)).matrix();
  return per_row.sum();
}

} // namespace distribution
} // namespace mbvi
