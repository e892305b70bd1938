/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#define _USE_MATH_DEFINES
#include <cmath>
#include <stdexcept>

#include <gtest/gtest.h>

#include "mbvi/distribution/normal.h"

using namespace mbvi;
using namespace distribution;

namespace {

double normal_log_density(double x, double mu, double sigma) {
  return -std::log(sigma) - 0.5 * std::log(2 * M_PI) -
      0.5 * (x - mu) * (x - mu) / (sigma * sigma);
}

} // namespace

TEST(testdistrib, normal_log_prob) {
  Eigen::MatrixXd loc(2, 1);
  loc << 1.0, -2.0;
  Eigen::MatrixXd scale(2, 1);
  scale << 0.5, 3.0;
  Normal dist(loc, scale);
  Eigen::MatrixXd value(2, 1);
  value << 1.5, 0.0;
  double expected = normal_log_density(1.5, 1.0, 0.5) +
      normal_log_density(0.0, -2.0, 3.0);
  EXPECT_NEAR(dist.log_prob(value), expected, 1e-12);

  Eigen::MatrixXd grad = Eigen::MatrixXd::Zero(2, 1);
  dist.gradient_log_prob_value(value, grad);
  EXPECT_NEAR(grad(0), -0.5 / 0.25, 1e-12);
  EXPECT_NEAR(grad(1), -2.0 / 9.0, 1e-12);

  EXPECT_THROW(Normal(loc, 0.0), std::invalid_argument);
  EXPECT_THROW(Normal(loc, Eigen::MatrixXd::Ones(1, 2)), std::invalid_argument);
}

TEST(testdistrib, normal_kl_divergence) {
  Eigen::MatrixXd loc(1, 3);
  loc << 0.3, -1.0, 2.0;
  Eigen::MatrixXd scale(1, 3);
  scale << 0.7, 1.5, 0.2;
  Normal q(loc, scale);
  Normal p(Eigen::MatrixXd::Zero(1, 3), 2.0);

  EXPECT_NEAR(q.kl_divergence(q), 0.0, 1e-12);
  EXPECT_GT(q.kl_divergence(p), 0.0);

  // KL = -H(q) - E_q[log p]
  double expected = -q.entropy();
  for (uint i = 0; i < 3; i++) {
    expected -= -std::log(2.0) - 0.5 * std::log(2 * M_PI) -
        (loc(i) * loc(i) + scale(i) * scale(i)) / 8.0;
  }
  EXPECT_NEAR(q.kl_divergence(p), expected, 1e-10);

  // analytic gradients against central differences
  Eigen::MatrixXd grad_loc = Eigen::MatrixXd::Zero(1, 3);
  Eigen::MatrixXd grad_scale = Eigen::MatrixXd::Zero(1, 3);
  q.gradient_kl_divergence(p, grad_loc, grad_scale);
  const double h = 1e-6;
  for (uint i = 0; i < 3; i++) {
    Eigen::MatrixXd up = loc, down = loc;
    up(i) += h;
    down(i) -= h;
    double numeric =
        (Normal(up, scale).kl_divergence(p) -
         Normal(down, scale).kl_divergence(p)) /
        (2 * h);
    EXPECT_NEAR(grad_loc(i), numeric, 1e-5);
    up = scale;
    down = scale;
    up(i) += h;
    down(i) -= h;
    numeric = (Normal(loc, up).kl_divergence(p) -
               Normal(loc, down).kl_divergence(p)) /
        (2 * h);
    EXPECT_NEAR(grad_scale(i), numeric, 1e-5);
  }
}

TEST(testdistrib, normal_sample) {
  std::mt19937 gen(23);
  Normal dist(Eigen::MatrixXd::Constant(100, 100, 3.0), 2.0);
  Eigen::MatrixXd draws = dist.sample(gen);
  EXPECT_NEAR(draws.mean(), 3.0, 0.1);
  EXPECT_NEAR(
      std::sqrt((draws.array() - draws.mean()).square().mean()), 2.0, 0.1);

  Eigen::MatrixXd eps = Eigen::MatrixXd::Ones(100, 100);
  EXPECT_NEAR(dist.transform(eps)(4, 7), 5.0, 1e-12);
}

TEST(testdistrib, expected_normal_log_prob) {
  Eigen::RowVectorXd x(2), loc(2), scale(2);
  x << 1.0, 2.0;
  loc << 0.0, 1.0;
  scale << 0.0, 0.0;
  // with zero scale this is the log density at loc
  double at_loc = normal_log_density(1.0, 0.0, 1.5) +
      normal_log_density(2.0, 1.0, 1.5);
  EXPECT_NEAR(expected_normal_log_prob(x, loc, scale, 1.5), at_loc, 1e-12);
  // uncertainty in loc lowers the expectation by |scale|^2 / (2 sigma^2)
  scale << 0.3, 0.4;
  EXPECT_NEAR(
      expected_normal_log_prob(x, loc, scale, 1.5),
      at_loc - 0.25 / (2 * 2.25),
      1e-12);
}
