/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

#include "mbvi/errors.h"
#include "mbvi/inference/inference_step.h"
#include "mbvi/util.h"

namespace mbvi {
namespace inference {

namespace {

// the tensors of `values` flattened in the order of the tensors of `like`
Eigen::VectorXd flatten_like(
    const ParameterSet& like,
    const ParameterSet& values) {
  Eigen::VectorXd flattened(like.size());
  Eigen::Index i = 0;
  for (const auto& name : like.names()) {
    const Eigen::MatrixXd& value = values.at(name);
    flattened.segment(i, value.size()) =
        Eigen::Map<const Eigen::VectorXd>(value.data(), value.size());
    i += value.size();
  }
  return flattened;
}

void check_finite_evaluation(
    InferenceMode mode,
    const Evaluation& evaluation) {
  if (not std::isfinite(evaluation.value)) {
    throw OptimizationDivergedError(fmt::format(
        "the {} objective is {}", to_string(mode), evaluation.value));
  }
  for (const auto& name : evaluation.gradient.names()) {
    if (not util::all_finite(evaluation.gradient.at(name))) {
      throw OptimizationDivergedError(
          fmt::format("the gradient of '{}' is not finite", name));
    }
  }
}

} // namespace

KLqpStep::KLqpStep(
    const GradientBackend& backend,
    const OptimizerConfig& global_optimizer,
    const OptimizerConfig& local_optimizer,
    uint seed)
    : backend(backend),
      global_optimizer(make_optimizer(global_optimizer)),
      local_optimizer(make_optimizer(local_optimizer)),
      gen(seed) {}

StepResult KLqpStep::update(
    InferenceMode mode,
    const Subgraph& subgraph,
    const ScaleTable& scales,
    const StepOptions& options) {
  ParameterSet& params = subgraph.params(mode);
  subgraph.check_shapes(mode, params, "parameters");
  Evaluation evaluation =
      backend.evaluate(mode, subgraph, scales, gen, options);
  subgraph.check_shapes(mode, evaluation.gradient, "gradient");
  check_finite_evaluation(mode, evaluation);

  Eigen::VectorXd values;
  params.get_flattened(values);
  Eigen::VectorXd grad = flatten_like(params, evaluation.gradient);
  Optimizer& optimizer =
      mode == InferenceMode::GLOBAL ? *global_optimizer : *local_optimizer;
  Eigen::VectorXd proposed = optimizer.propose(values, grad);
  if (not util::all_finite(proposed)) {
    throw OptimizationDivergedError(fmt::format(
        "the {} update produced non-finite parameters", to_string(mode)));
  }
  params.set_flattened(proposed);
  optimizer.commit();
  return StepResult{mode, evaluation.value, grad.norm(), params.size()};
}

void KLqpStep::begin_batch() {
  local_optimizer->reset();
}

SGLDStep::SGLDStep(
    const GradientBackend& backend,
    const SGLDConfig& config,
    const OptimizerConfig& local_optimizer,
    uint seed)
    : backend(backend),
      config(config),
      local_step(backend, local_optimizer, local_optimizer, seed + 1),
      gen(seed) {
  if (not(config.step_size > 0) or not std::isfinite(config.step_size)) {
    throw std::invalid_argument("SGLD step_size must be positive");
  }
  if (config.decay_exponent < 0) {
    throw std::invalid_argument("SGLD decay_exponent must be non-negative");
  }
  if (config.capacity == 0) {
    throw std::invalid_argument("SGLD capacity must be positive");
  }
}

double SGLDStep::step_size() const {
  return config.step_size / std::pow(_num_steps + 1.0, config.decay_exponent);
}

StepResult SGLDStep::update(
    InferenceMode mode,
    const Subgraph& subgraph,
    const ScaleTable& scales,
    const StepOptions& options) {
  if (mode == InferenceMode::LOCAL) {
    return local_step.update(mode, subgraph, scales, options);
  }
  ParameterSet& params = subgraph.global_params();
  subgraph.check_shapes(mode, params, "parameters");
  Evaluation log_joint = backend.evaluate_log_joint(subgraph, scales, options);
  subgraph.check_shapes(mode, log_joint.gradient, "gradient");
  check_finite_evaluation(mode, log_joint);

  const double lr = step_size();
  const double noise_scale = std::sqrt(lr);
  ParameterSet proposed = params;
  for (const auto& name : params.names()) {
    Eigen::MatrixXd& value = proposed.at(name);
    value += lr / 2 * log_joint.gradient.at(name) +
        noise_scale *
            util::standard_normal(gen, int(value.rows()), int(value.cols()));
  }
  if (not proposed.all_finite()) {
    throw OptimizationDivergedError(
        "the Langevin transition produced non-finite values");
  }

  params = proposed;
  _num_steps++;
  for (const auto& name : params.names()) {
    const Eigen::MatrixXd& value = params.at(name);
    auto it = empiricals.find(name);
    if (it == empiricals.end()) {
      it = empiricals
               .emplace(
                   name,
                   distribution::Empirical(
                       config.capacity,
                       static_cast<uint>(value.rows()),
                       static_cast<uint>(value.cols())))
               .first;
    }
    it->second.record(value);
  }
  Eigen::VectorXd grad = flatten_like(params, log_joint.gradient);
  return StepResult{mode, -log_joint.value, grad.norm(), params.size()};
}

void SGLDStep::begin_batch() {
  local_step.begin_batch();
}

const distribution::Empirical& SGLDStep::samples(
    const std::string& tensor) const {
  auto it = empiricals.find(tensor);
  if (it == empiricals.end()) {
    throw std::out_of_range(
        fmt::format("no samples of '{}' were recorded", tensor));
  }
  return it->second;
}

} // namespace inference
} // namespace mbvi
