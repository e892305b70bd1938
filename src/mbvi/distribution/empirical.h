/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <Eigen/Dense>
#include <vector>

#include "mbvi/types.h"

namespace mbvi {
namespace distribution {

/*
An approximation of a distribution by a finite set of samples, as produced
by a Markov chain. Holds at most `capacity` samples; once full, new
samples overwrite the oldest ones.
*/
class Empirical {
 public:
  Empirical(uint capacity, uint rows, uint cols);

  void record(const Eigen::MatrixXd& sample);
  void clear();

  uint capacity() const {
    return static_cast<uint>(_samples.size());
  }
  // number of samples currently held
  uint size() const;
  // number of samples ever recorded
  uint num_recorded() const {
    return _num_recorded;
  }
  // i-th held sample in recording order, 0 being the oldest
  const Eigen::MatrixXd& sample(uint i) const;
  // the most recent sample
  const Eigen::MatrixXd& last() const;

  // mean of the held samples after dropping the first `burn_in` of them
  Eigen::MatrixXd mean(uint burn_in = 0) const;
  // coefficient-wise variance of the held samples after burn-in
  Eigen::MatrixXd variance(uint burn_in = 0) const;

 private:
  uint _rows;
  uint _cols;
  std::vector<Eigen::MatrixXd> _samples;
  uint _num_recorded = 0;
};

} // namespace distribution
} // namespace mbvi
