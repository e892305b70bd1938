/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <Eigen/Dense>
#include <random>

namespace mbvi {
namespace distribution {

/*
A matrix of independent Normal random variables, one per coefficient of
loc. Used both as a prior (constant loc and scale) and as a mean-field
variational factor.
*/
class Normal {
 public:
  Normal(const Eigen::MatrixXd& loc, const Eigen::MatrixXd& scale);
  Normal(const Eigen::MatrixXd& loc, double scale);

  const Eigen::MatrixXd& loc() const {
    return _loc;
  }
  const Eigen::MatrixXd& scale() const {
    return _scale;
  }

  Eigen::MatrixXd sample(std::mt19937& gen) const;
  // loc + scale * eps, the reparameterized draw for given noise eps
  Eigen::MatrixXd transform(const Eigen::MatrixXd& eps) const;

  double log_prob(const Eigen::MatrixXd& value) const;
  // *adds* d/dvalue log_prob(value) to grad
  void gradient_log_prob_value(
      const Eigen::MatrixXd& value,
      Eigen::MatrixXd& grad) const;
  double entropy() const;

  /*
  KL(this || other), summed over all coefficients.
  KL(N(m1, s1) || N(m2, s2)) =
      log(s2 / s1) + (s1^2 + (m1 - m2)^2) / (2 s2^2) - 1/2
  */
  double kl_divergence(const Normal& other) const;
  /*
  *Adds* the gradient of kl_divergence(other) with respect to this
  distribution's loc and scale to grad_loc and grad_scale.
  d/dm1 : (m1 - m2) / s2^2
  d/ds1 : -1/s1 + s1 / s2^2
  */
  void gradient_kl_divergence(
      const Normal& other,
      Eigen::MatrixXd& grad_loc,
      Eigen::MatrixXd& grad_scale) const;

 private:
  Eigen::MatrixXd _loc;
  Eigen::MatrixXd _scale;
};

/*
E[log Normal(x | beta, sigma)] over beta ~ Normal(loc, scale), for a row
vector x and row vectors loc and scale of the same width:
    -D/2 log(2 pi sigma^2) - (|x - loc|^2 + |scale|^2) / (2 sigma^2)
With scale set to zero this is the log density at beta = loc.
*/
double expected_normal_log_prob(
    const Eigen::Ref<const Eigen::RowVectorXd>& x,
    const Eigen::Ref<const Eigen::RowVectorXd>& loc,
    const Eigen::Ref<const Eigen::RowVectorXd>& scale,
    double sigma);

} // namespace distribution
} // namespace mbvi
