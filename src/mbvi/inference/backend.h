/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <random>

#include "mbvi/data/batch.h"
#include "mbvi/inference/parameter_set.h"
#include "mbvi/inference/scale_table.h"
#include "mbvi/inference/subgraph.h"
#include "mbvi/types.h"

namespace mbvi {
namespace inference {

struct StepOptions {
  // worker threads used for the per-sample gradient contributions
  uint num_threads;
  // Monte Carlo samples of the global latent values per evaluation
  uint num_samples;

  StepOptions(uint num_threads = 1, uint num_samples = 1)
      : num_threads(num_threads), num_samples(num_samples) {}
};

// An objective value together with its gradient. gradient has the same
// tensors and shapes as the parameter block it was taken with respect to.
struct Evaluation {
  double value = 0;
  ParameterSet gradient;
};

/*
Computes the scaled objectives of a model and their gradients on a bound
Subgraph. Backends never modify the parameters they are given.
*/
class GradientBackend {
 public:
  virtual ~GradientBackend() {}

  /*
  Create or overwrite the global parameters of the model.
  :param global: the tensors declared by global_layout(model)
  :param init_type: how to choose the starting values
  :param gen: random number generator
  :param batch: observations available to data-dependent initialization
  */
  virtual void initialize_global(
      ParameterSet& global,
      InitType init_type,
      std::mt19937& gen,
      const data::Batch& batch) const = 0;

  /*
  The negative scaled ELBO of the subgraph, i.e. KL(q || p~) up to a
  constant, and its gradient with respect to the parameters of `mode`.
  Each subsampled site's log p and log q terms are multiplied by its
  factor in `scales`.
  */
  virtual Evaluation evaluate(
      InferenceMode mode,
      const Subgraph& subgraph,
      const ScaleTable& scales,
      std::mt19937& gen,
      const StepOptions& options) const = 0;

  /*
  The scaled log joint log p~ at the current global values (the
  "<site>.value" tensors) with the local sites marginalized under their
  variational factors, and its gradient with respect to the global values.
  */
  virtual Evaluation evaluate_log_joint(
      const Subgraph& subgraph,
      const ScaleTable& scales,
      const StepOptions& options) const = 0;
};

} // namespace inference
} // namespace mbvi
