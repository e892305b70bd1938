/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <Eigen/Dense>
#include <random>
#include <vector>

#include "mbvi/types.h"

namespace mbvi {
namespace distribution {

/*
A column of independent Categorical random variables parameterized by
unnormalized logits: row r is a distribution over the logits.cols()
outcomes with probabilities softmax(logits.row(r)).
*/
class Categorical {
 public:
  explicit Categorical(const Eigen::MatrixXd& logits);

  uint num_rows() const {
    return static_cast<uint>(_log_probs.rows());
  }
  uint num_outcomes() const {
    return static_cast<uint>(_log_probs.cols());
  }
  const Eigen::MatrixXd& log_probs() const {
    return _log_probs;
  }
  Eigen::MatrixXd probs() const;

  std::vector<uint> sample(std::mt19937& gen) const;
  double log_prob(const std::vector<uint>& values) const;
  // sum of the per-row entropies
  double entropy() const;

  /*
  Given a payoff f(r, k) for each row r and outcome k, compute
      objective = sum_r E_{k ~ q_r}[f(r, k) - log q_r(k)]
  and write into grad the gradient of the objective with respect to the
  logits. With p = softmax(logits) and L_r the per-row objective,
      d/dlogit(r, j) = p(r, j) * (f(r, j) - log p(r, j) - L_r)
  :returns: the objective
  */
  double expected_payoff_with_entropy(
      const Eigen::MatrixXd& payoff,
      Eigen::MatrixXd& grad) const;

 private:
  Eigen::MatrixXd _log_probs;
};

} // namespace distribution
} // namespace mbvi
