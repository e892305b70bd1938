/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <map>
#include <memory>
#include <random>
#include <string>

#include "mbvi/distribution/empirical.h"
#include "mbvi/inference/backend.h"
#include "mbvi/inference/optimizer.h"
#include "mbvi/inference/scale_table.h"
#include "mbvi/inference/subgraph.h"
#include "mbvi/types.h"

namespace mbvi {
namespace inference {

struct StepResult {
  InferenceMode mode;
  // the objective before the update
  double loss;
  // Euclidean norm of the gradient used by the update
  double grad_norm;
  // number of parameter values updated
  uint num_parameters;
};

/*
One block-coordinate update of a Subgraph. In GLOBAL mode only the
subgraph's global parameters change; in LOCAL mode only its local
parameters. Every check happens before anything is written, so an update
that throws leaves the parameters and the step's own state as they were.
*/
class InferenceStep {
 public:
  virtual ~InferenceStep() {}

  /*
  :param mode: which parameter block to update
  :param subgraph: the bound model restricted to the active batch
  :param scales: scale factors of the subgraph's sites
  :param options: threads and Monte Carlo samples
  :throws ShapeError: if parameters or gradient do not match the subgraph
  :throws OptimizationDivergedError: if the loss, the gradient or the
  updated parameters are not finite
  */
  virtual StepResult update(
      InferenceMode mode,
      const Subgraph& subgraph,
      const ScaleTable& scales,
      const StepOptions& options) = 0;
  // Called when the local parameters of a new batch have been allocated.
  virtual void begin_batch() = 0;
};

/*
Gradient descent on the negative scaled ELBO, i.e. on KL(q || p~) up to a
constant. The global optimizer keeps its moments for the whole run; the
local optimizer starts over with every batch.
*/
class KLqpStep : public InferenceStep {
 public:
  KLqpStep(
      const GradientBackend& backend,
      const OptimizerConfig& global_optimizer,
      const OptimizerConfig& local_optimizer,
      uint seed = 5123401);

  StepResult update(
      InferenceMode mode,
      const Subgraph& subgraph,
      const ScaleTable& scales,
      const StepOptions& options) override;
  void begin_batch() override;

  const Optimizer& optimizer(InferenceMode mode) const {
    return mode == InferenceMode::GLOBAL ? *global_optimizer
                                         : *local_optimizer;
  }

 private:
  const GradientBackend& backend;
  std::unique_ptr<Optimizer> global_optimizer;
  std::unique_ptr<Optimizer> local_optimizer;
  std::mt19937 gen;
};

struct SGLDConfig {
  double step_size;
  // the step size at step t is step_size / (t + 1)^decay_exponent
  double decay_exponent;
  // number of samples kept by the empirical approximation
  uint capacity;

  SGLDConfig(
      double step_size = 0.001,
      double decay_exponent = 0.55,
      uint capacity = 1000)
      : step_size(step_size),
        decay_exponent(decay_exponent),
        capacity(capacity) {}
};

/*
Stochastic-gradient Langevin dynamics on the global values. A GLOBAL update
is one transition
    value += lr_t / 2 * grad log p~(value) + Normal(0, lr_t)
on every "<site>.value" tensor, after which the new value is recorded into
the site's Empirical approximation. LOCAL updates are KLqp steps on the
local factors, with the global values as a point estimate.
*/
class SGLDStep : public InferenceStep {
 public:
  SGLDStep(
      const GradientBackend& backend,
      const SGLDConfig& config,
      const OptimizerConfig& local_optimizer,
      uint seed = 5123401);

  StepResult update(
      InferenceMode mode,
      const Subgraph& subgraph,
      const ScaleTable& scales,
      const StepOptions& options) override;
  void begin_batch() override;

  // the step size of the next transition
  double step_size() const;
  uint num_steps() const {
    return _num_steps;
  }
  // throws std::out_of_range if no sample of the tensor was recorded
  const distribution::Empirical& samples(const std::string& tensor) const;

 private:
  const GradientBackend& backend;
  SGLDConfig config;
  KLqpStep local_step;
  std::mt19937 gen;
  uint _num_steps = 0;
  std::map<std::string, distribution::Empirical> empiricals;
};

} // namespace inference
} // namespace mbvi
