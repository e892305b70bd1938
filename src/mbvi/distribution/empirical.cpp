/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <stdexcept>
#include <string>

#include "mbvi/distribution/empirical.h"

namespace mbvi {
namespace distribution {

Empirical::Empirical(uint capacity, uint rows, uint cols)
    : _rows(rows), _cols(cols) {
  if (capacity == 0) {
    throw std::invalid_argument("Empirical capacity must be positive");
  }
  _samples.resize(capacity, Eigen::MatrixXd::Zero(rows, cols));
}

void Empirical::record(const Eigen::MatrixXd& sample) {
  if (sample.rows() != _rows or sample.cols() != _cols) {
    throw std::invalid_argument(
        "Empirical sample must be " + std::to_string(_rows) + "x" +
        std::to_string(_cols));
  }
  _samples[_num_recorded % capacity()] = sample;
  _num_recorded++;
}

void Empirical::clear() {
  _num_recorded = 0;
}

uint Empirical::size() const {
  return std::min(_num_recorded, capacity());
}

const Eigen::MatrixXd& Empirical::sample(uint i) const {
  if (i >= size()) {
    throw std::out_of_range(
        "Empirical holds " + std::to_string(size()) + " samples");
  }
  // when the buffer has wrapped, the oldest sample sits at the write head
  uint oldest = _num_recorded > capacity() ? _num_recorded % capacity() : 0;
  return _samples[(oldest + i) % capacity()];
}

const Eigen::MatrixXd& Empirical::last() const {
  if (size() == 0) {
    throw std::out_of_range("Empirical holds no samples");
  }
  return sample(size() - 1);
}

Eigen::MatrixXd Empirical::mean(uint burn_in) const {
  if (burn_in >= size()) {
    throw std::invalid_argument("burn_in leaves no samples");
  }
  Eigen::MatrixXd sum = Eigen::MatrixXd::Zero(_rows, _cols);
  for (uint i = burn_in; i < size(); i++) {
    sum += sample(i);
  }
  return sum / static_cast<double>(size() - burn_in);
}

Eigen::MatrixXd Empirical::variance(uint burn_in) const {
  Eigen::MatrixXd mu = mean(burn_in);
  Eigen::MatrixXd sum = Eigen::MatrixXd::Zero(_rows, _cols);
  for (uint i = burn_in; i < size(); i++) {
    sum.array() += (sample(i) - mu).array().square();
  }
  return sum / static_cast<double>(size() - burn_in);
}

} // namespace distribution
} // namespace mbvi
