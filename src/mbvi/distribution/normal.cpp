/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#define _USE_MATH_DEFINES
#include <cmath>
#include <stdexcept>

#include "mbvi/distribution/normal.h"
#include "mbvi/util.h"

namespace mbvi {
namespace distribution {

Normal::Normal(const Eigen::MatrixXd& loc, const Eigen::MatrixXd& scale)
    : _loc(loc), _scale(scale) {
  if (loc.rows() != scale.rows() or loc.cols() != scale.cols()) {
    throw std::invalid_argument("Normal loc and scale must have equal shapes");
  }
  if (not(scale.array() > 0).all()) {
    throw std::invalid_argument("Normal scale must be positive");
  }
}

Normal::Normal(const Eigen::MatrixXd& loc, double scale)
    : Normal(loc, Eigen::MatrixXd::Constant(loc.rows(), loc.cols(), scale)) {}

Eigen::MatrixXd Normal::sample(std::mt19937& gen) const {
  return transform(util::standard_normal(
      gen, static_cast<int>(_loc.rows()), static_cast<int>(_loc.cols())));
}

Eigen::MatrixXd Normal::transform(const Eigen::MatrixXd& eps) const {
  return _loc + _scale.cwiseProduct(eps);
}

// log_prob of a normal: - log(s) -0.5 log(2*pi) - 0.5 (x - m)^2 / s^2
// grad  w.r.t. value x: - (x - m) / s^2
double Normal::log_prob(const Eigen::MatrixXd& value) const {
  static const double half_of_log_2_pi = 0.5 * std::log(2 * M_PI);
  Eigen::ArrayXXd z = (value - _loc).array() / _scale.array();
  return (-_scale.array().log() - half_of_log_2_pi - 0.5 * z.square()).sum();
}

void Normal::gradient_log_prob_value(
    const Eigen::MatrixXd& value,
    Eigen::MatrixXd& grad) const {
  grad.array() -= (value - _loc).array() / _scale.array().square();
}

// entropy of a normal: 0.5 log(2 pi e) + log(s)
double Normal::entropy() const {
  static const double half_log_2_pi_e = 0.5 * std::log(2 * M_PI * M_E);
  return (half_log_2_pi_e + _scale.array().log()).sum();
}

double Normal::kl_divergence(const Normal& other) const {
  Eigen::ArrayXXd s1 = _scale.array();
  Eigen::ArrayXXd s2 = other._scale.array();
  Eigen::ArrayXXd diff = (_loc - other._loc).array();
  return ((s2 / s1).log() + (s1.square() + diff.square()) / (2 * s2.square()) -
          0.5)
      .sum();
}

void Normal::gradient_kl_divergence(
    const Normal& other,
    Eigen::MatrixXd& grad_loc,
    Eigen::MatrixXd& grad_scale) const {
  Eigen::ArrayXXd s2_sq = other._scale.array().square();
  grad_loc.array() += (_loc - other._loc).array() / s2_sq;
  grad_scale.array() += -_scale.array().inverse() + _scale.array() / s2_sq;
}

double expected_normal_log_prob(
    const Eigen::Ref<const Eigen::RowVectorXd>& x,
    const Eigen::Ref<const Eigen::RowVectorXd>& loc,
    const Eigen::Ref<const Eigen::RowVectorXd>& scale,
    double sigma) {
  double sigma_sq = sigma * sigma;
  double dim = static_cast<double>(x.size());
  return -0.5 * dim * std::log(2 * M_PI * sigma_sq) -
      ((x - loc).squaredNorm() + scale.squaredNorm()) / (2 * sigma_sq);
}

} // namespace distribution
} // namespace mbvi
