/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <Eigen/Dense>
#include <string>

#include "mbvi/inference/backend.h"
#include "mbvi/model/model.h"

namespace mbvi {
namespace backend {

struct GaussianMixtureConfig {
  uint num_clusters;
  uint dim;
  // standard deviation of the Normal(0, prior_scale) prior on the means
  double prior_scale;
  // standard deviation of the observation noise
  double obs_scale;

  GaussianMixtureConfig(
      uint num_clusters = 2,
      uint dim = 1,
      double prior_scale = 10.0,
      double obs_scale = 1.0)
      : num_clusters(num_clusters),
        dim(dim),
        prior_scale(prior_scale),
        obs_scale(obs_scale) {}
};

/*
The mixture of Gaussians with K clusters in D dimensions:
    beta ~ Normal(0, prior_scale)          global, K x D
    z[n] ~ Categorical(1/K, ..., 1/K)      local, one-hot over K outcomes
    x[n] ~ Normal(beta[z[n]], obs_scale)   observed, 1 x D
:param global_family: NORMAL for KLqp, EMPIRICAL for SGLD
*/
model::Model build_gaussian_mixture_model(
    const GaussianMixtureConfig& config,
    VariationalFamily global_family = VariationalFamily::NORMAL);

/*
Gradients of the mixture model, computed in closed form. The variational
factors are
    q(beta) = Normal(beta.loc, softplus(beta.scale_raw))
    q(z[m]) = Categorical(softmax(z.logits[m]))
When the global parameters hold "beta.value" instead (the point estimate
maintained by SGLD), q(beta) is a point mass at that value.

The expectation over q(z) and, for the local step, over q(beta) are exact.
The global step estimates the expectation over q(beta) with
reparameterized samples beta = loc + scale * eps and takes the KL divergence
between q(beta) and the prior analytically.

The per-sample terms only enter through the responsibility-weighted sums
of the observations, which are accumulated over contiguous chunks of the
batch on StepOptions::num_threads threads and added up in chunk order.
*/
class GaussianMixtureBackend : public inference::GradientBackend {
 public:
  static const std::string GLOBAL_SITE;
  static const std::string LOCAL_SITE;
  static const std::string OBSERVED_SITE;

  explicit GaussianMixtureBackend(const GaussianMixtureConfig& config);

  void initialize_global(
      inference::ParameterSet& global,
      InitType init_type,
      std::mt19937& gen,
      const data::Batch& batch) const override;
  inference::Evaluation evaluate(
      InferenceMode mode,
      const inference::Subgraph& subgraph,
      const inference::ScaleTable& scales,
      std::mt19937& gen,
      const inference::StepOptions& options) const override;
  inference::Evaluation evaluate_log_joint(
      const inference::Subgraph& subgraph,
      const inference::ScaleTable& scales,
      const inference::StepOptions& options) const override;

  const GaussianMixtureConfig& config() const {
    return _config;
  }

  /*
  Cluster centers picked from the rows of `observations` by farthest-point
  seeding: the first row, then repeatedly the row farthest from all
  centers chosen so far.
  :throws std::invalid_argument: if there are fewer rows than clusters
  */
  Eigen::MatrixXd farthest_point_centers(
      const Eigen::MatrixXd& observations) const;

 private:
  // The responsibility-weighted statistics of a batch:
  // weight(k) = sum_m r(m, k), sum(k, :) = sum_m r(m, k) x[m],
  // sum_sq(k) = sum_m r(m, k) |x[m]|^2
  struct WeightedSums {
    Eigen::VectorXd weight;
    Eigen::MatrixXd sum;
    Eigen::VectorXd sum_sq;
  };

  WeightedSums weighted_sums(
      const Eigen::MatrixXd& responsibilities,
      const Eigen::MatrixXd& observations,
      uint num_threads) const;
  // sum_m sum_k r(m, k) log Normal(x[m] | beta[k], obs_scale)
  double expected_log_likelihood(
      const WeightedSums& sums,
      const Eigen::MatrixXd& beta) const;
  // gradient of expected_log_likelihood with respect to beta
  Eigen::MatrixXd expected_log_likelihood_gradient(
      const WeightedSums& sums,
      const Eigen::MatrixXd& beta) const;
  // sum_m sum_k r(m, k) (log(1/K) - log r(m, k))
  double local_prior_and_entropy(const Eigen::MatrixXd& logits) const;

  // the mean and standard deviation of q(beta)
  void global_factor(
      const inference::ParameterSet& global,
      Eigen::MatrixXd& loc,
      Eigen::MatrixXd& scale) const;
  double log_prior(const Eigen::MatrixXd& beta) const;

  inference::Evaluation evaluate_local(
      const inference::Subgraph& subgraph,
      const inference::ScaleTable& scales,
      const inference::StepOptions& options) const;
  inference::Evaluation evaluate_global(
      const inference::Subgraph& subgraph,
      const inference::ScaleTable& scales,
      std::mt19937& gen,
      const inference::StepOptions& options) const;

  GaussianMixtureConfig _config;
};

} // namespace backend
} // namespace mbvi
