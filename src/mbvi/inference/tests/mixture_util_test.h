/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <Eigen/Dense>

#include "mbvi/backend/gaussian_mixture.h"
#include "mbvi/data/batch.h"
#include "mbvi/inference/backend.h"
#include "mbvi/inference/parameter_set.h"
#include "mbvi/inference/scale_table.h"
#include "mbvi/inference/subgraph.h"
#include "mbvi/model/model.h"

namespace mbvi {
namespace inference {

// (0, 0), (5, 5), (-5, 5), (5, -5), (-5, -5)
Eigen::MatrixXd five_cluster_means();
// (-6, 0), (0, 6), (6, 0)
Eigen::MatrixXd three_cluster_means();

// the largest distance from a row of `from` to its nearest row of `to`
double max_nearest_distance(const Eigen::MatrixXd& from, const Eigen::MatrixXd& to);
// the mean distance from a row of `from` to its nearest row of `to`
double mean_nearest_distance(
    const Eigen::MatrixXd& from,
    const Eigen::MatrixXd& to);

// n draws from the uniform mixture of isotropic Gaussians at `means`
Eigen::MatrixXd
sample_mixture(const Eigen::MatrixXd& means, uint n, uint seed, double sd = 1);

/*
A Gaussian mixture with every piece needed to bind a Subgraph by hand:
a batch of the first `batch_size` of `dataset_size` synthetic observations,
global parameters initialized from the data and zero local logits.
*/
struct BoundMixture {
  backend::GaussianMixtureConfig config;
  model::Model model;
  backend::GaussianMixtureBackend backend;
  data::Batch batch;
  ParameterSet global;
  ParameterSet local;
  ScaleTable scales;

  BoundMixture(
      uint batch_size,
      uint dataset_size,
      VariationalFamily global_family = VariationalFamily::NORMAL,
      uint seed = 17);
  Subgraph bind();
};

/*
Forwards to another backend but returns a NaN gradient from the evaluation
number `fail_at` (counting from 1) of the given mode.
*/
class FaultyBackend : public GradientBackend {
 public:
  FaultyBackend(const GradientBackend& inner, InferenceMode mode, uint fail_at)
      : inner(inner), mode(mode), fail_at(fail_at) {}

  void initialize_global(
      ParameterSet& global,
      InitType init_type,
      std::mt19937& gen,
      const data::Batch& batch) const override;
  Evaluation evaluate(
      InferenceMode mode,
      const Subgraph& subgraph,
      const ScaleTable& scales,
      std::mt19937& gen,
      const StepOptions& options) const override;
  Evaluation evaluate_log_joint(
      const Subgraph& subgraph,
      const ScaleTable& scales,
      const StepOptions& options) const override;

  mutable uint num_calls = 0;

 private:
  void poison(Evaluation& evaluation) const;

  const GradientBackend& inner;
  InferenceMode mode;
  uint fail_at;
};

} // namespace inference
} // namespace mbvi
