/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <Eigen/Dense>
#include <memory>

#include "mbvi/types.h"

namespace mbvi {
namespace inference {

struct OptimizerConfig {
  OptimizerType type;
  double learning_rate;
  // the learning rate is multiplied by decay_rate every decay_steps steps
  double decay_rate;
  uint decay_steps;
  // SGD only
  double momentum;
  // Adam only
  double beta1;
  double beta2;
  double epsilon;

  OptimizerConfig(
      OptimizerType type = OptimizerType::ADAM,
      double learning_rate = 0.1,
      double decay_rate = 1.0,
      uint decay_steps = 100,
      double momentum = 0.0,
      double beta1 = 0.9,
      double beta2 = 0.999,
      double epsilon = 1e-8)
      : type(type),
        learning_rate(learning_rate),
        decay_rate(decay_rate),
        decay_steps(decay_steps),
        momentum(momentum),
        beta1(beta1),
        beta2(beta2),
        epsilon(epsilon) {}
};

/*
A first-order minimizer over a flat vector of parameters.
A step is split in two: propose() computes the updated parameters and the
updated optimizer state without installing either, and commit() installs
the state of the last proposal. A proposal that is never committed leaves
the optimizer as it was.
*/
class Optimizer {
 public:
  explicit Optimizer(const OptimizerConfig& config);
  virtual ~Optimizer() {}

  /*
  :param params: current parameter values
  :param grad: gradient of the loss at params
  :returns: the parameters after one descent step
  */
  virtual Eigen::VectorXd propose(
      const Eigen::VectorXd& params,
      const Eigen::VectorXd& grad) = 0;
  virtual void commit() = 0;
  // forget all moments and the step count
  virtual void reset();

  // number of committed steps
  uint num_steps() const {
    return _num_steps;
  }
  // the learning rate used by the next step
  double learning_rate() const;
  const OptimizerConfig& config() const {
    return _config;
  }

 protected:
  // throws ShapeError if the sizes of params, grad and the moments differ
  void check_sizes(
      const Eigen::VectorXd& params,
      const Eigen::VectorXd& grad,
      Eigen::Index moment_size) const;

  OptimizerConfig _config;
  uint _num_steps = 0;
};

class SGDOptimizer : public Optimizer {
 public:
  explicit SGDOptimizer(const OptimizerConfig& config);
  Eigen::VectorXd propose(
      const Eigen::VectorXd& params,
      const Eigen::VectorXd& grad) override;
  void commit() override;
  void reset() override;

 private:
  Eigen::VectorXd _velocity;
  Eigen::VectorXd _pending_velocity;
};

class AdamOptimizer : public Optimizer {
 public:
  explicit AdamOptimizer(const OptimizerConfig& config);
  Eigen::VectorXd propose(
      const Eigen::VectorXd& params,
      const Eigen::VectorXd& grad) override;
  void commit() override;
  void reset() override;

 private:
  Eigen::VectorXd _first_moment;
  Eigen::VectorXd _second_moment;
  Eigen::VectorXd _pending_first_moment;
  Eigen::VectorXd _pending_second_moment;
};

std::unique_ptr<Optimizer> make_optimizer(const OptimizerConfig& config);

} // namespace inference
} // namespace mbvi
