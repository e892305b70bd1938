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
#include "mbvi/inference/optimizer.h"

namespace mbvi {
namespace inference {

Optimizer::Optimizer(const OptimizerConfig& config) : _config(config) {
  if (not std::isfinite(config.learning_rate) or config.learning_rate <= 0) {
    throw std::invalid_argument("learning_rate must be positive");
  }
  if (config.decay_rate <= 0 or config.decay_rate > 1) {
    throw std::invalid_argument("decay_rate must be in (0, 1]");
  }
  if (config.decay_steps == 0) {
    throw std::invalid_argument("decay_steps must be positive");
  }
  if (config.momentum < 0 or config.momentum >= 1) {
    throw std::invalid_argument("momentum must be in [0, 1)");
  }
  if (config.beta1 < 0 or config.beta1 >= 1 or config.beta2 < 0 or
      config.beta2 >= 1) {
    throw std::invalid_argument("Adam betas must be in [0, 1)");
  }
  if (config.epsilon <= 0) {
    throw std::invalid_argument("epsilon must be positive");
  }
}

void Optimizer::reset() {
  _num_steps = 0;
}

double Optimizer::learning_rate() const {
  // staircase decay
  return _config.learning_rate *
      std::pow(_config.decay_rate, _num_steps / _config.decay_steps);
}

void Optimizer::check_sizes(
    const Eigen::VectorXd& params,
    const Eigen::VectorXd& grad,
    Eigen::Index moment_size) const {
  if (params.size() != grad.size()) {
    throw ShapeError(fmt::format(
        "{} parameters but {} gradient values", params.size(), grad.size()));
  }
  if (_num_steps > 0 and moment_size != params.size()) {
    throw ShapeError(fmt::format(
        "optimizer state holds {} values but {} parameters were given",
        moment_size,
        params.size()));
  }
}

SGDOptimizer::SGDOptimizer(const OptimizerConfig& config)
    : Optimizer(config) {}

Eigen::VectorXd SGDOptimizer::propose(
    const Eigen::VectorXd& params,
    const Eigen::VectorXd& grad) {
  check_sizes(params, grad, _velocity.size());
  if (_num_steps == 0) {
    _pending_velocity = grad;
  } else {
    _pending_velocity = _config.momentum * _velocity + grad;
  }
  return params - learning_rate() * _pending_velocity;
}

void SGDOptimizer::commit() {
  _velocity = _pending_velocity;
  _num_steps++;
}

void SGDOptimizer::reset() {
  Optimizer::reset();
  _velocity.resize(0);
  _pending_velocity.resize(0);
}

AdamOptimizer::AdamOptimizer(const OptimizerConfig& config)
    : Optimizer(config) {}

Eigen::VectorXd AdamOptimizer::propose(
    const Eigen::VectorXd& params,
    const Eigen::VectorXd& grad) {
  check_sizes(params, grad, _first_moment.size());
  if (_num_steps == 0) {
    _first_moment = Eigen::VectorXd::Zero(params.size());
    _second_moment = Eigen::VectorXd::Zero(params.size());
  }
  const double beta1 = _config.beta1;
  const double beta2 = _config.beta2;
  _pending_first_moment = beta1 * _first_moment + (1 - beta1) * grad;
  _pending_second_moment = beta2 * _second_moment +
      (1 - beta2) * grad.array().square().matrix();
  const double t = _num_steps + 1.0;
  Eigen::ArrayXd m_hat =
      _pending_first_moment.array() / (1 - std::pow(beta1, t));
  Eigen::ArrayXd v_hat =
      _pending_second_moment.array() / (1 - std::pow(beta2, t));
  return params -
      (learning_rate() * m_hat / (v_hat.sqrt() + _config.epsilon)).matrix();
}

void AdamOptimizer::commit() {
  _first_moment = _pending_first_moment;
  _second_moment = _pending_second_moment;
  _num_steps++;
}

void AdamOptimizer::reset() {
  Optimizer::reset();
  _first_moment.resize(0);
  _second_moment.resize(0);
}

std::unique_ptr<Optimizer> make_optimizer(const OptimizerConfig& config) {
  switch (config.type) {
    case OptimizerType::SGD:
      return std::make_unique<SGDOptimizer>(config);
    case OptimizerType::ADAM:
      return std::make_unique<AdamOptimizer>(config);
    default:
      throw std::invalid_argument("unsupported optimizer type");
  }
}

} // namespace inference
} // namespace mbvi
