/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <Eigen/Dense>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "mbvi/types.h"

namespace mbvi {
namespace inference {

// Name of the tensor holding parameter `param` of site `site`, e.g.
// "beta.loc".
std::string tensor_name(const std::string& site, const std::string& param);

/*
An ordered collection of named real matrices: the trainable tensors of a
variational approximation. Tensors are flattened in insertion order and,
within a tensor, in Eigen's column-major order.
*/
class ParameterSet {
 public:
  ParameterSet() {}

  // throws std::invalid_argument if name is already present
  void add(const std::string& name, const Eigen::MatrixXd& value);
  bool has(const std::string& name) const;
  // throws std::out_of_range if name is not present
  Eigen::MatrixXd& at(const std::string& name);
  const Eigen::MatrixXd& at(const std::string& name) const;

  const std::vector<std::string>& names() const {
    return _names;
  }
  uint num_tensors() const {
    return static_cast<uint>(_names.size());
  }
  // total number of coefficients over all tensors
  uint size() const;
  bool empty() const {
    return _names.empty();
  }

  void get_flattened(Eigen::VectorXd& flattened) const;
  // throws ShapeError if flattened.size() != size()
  void set_flattened(const Eigen::VectorXd& flattened);
  void set_zero();
  void clear();
  bool all_finite() const;

 private:
  std::vector<std::string> _names;
  std::vector<Eigen::MatrixXd> _values;
  std::map<std::string, size_t> _index;
};

/*
The global variational parameters of a run, together with the mutex that
serializes writes to them. A cell is owned by the caller and passed by
reference to every driver that updates it; only a GLOBAL inference step
writes to params, and it does so while holding mutex.
*/
struct GlobalParamsCell {
  ParameterSet params;
  std::mutex mutex;

  GlobalParamsCell() {}
  explicit GlobalParamsCell(ParameterSet params) : params(std::move(params)) {}
  GlobalParamsCell(const GlobalParamsCell&) = delete;
  GlobalParamsCell& operator=(const GlobalParamsCell&) = delete;

  // a consistent copy of the parameters
  ParameterSet snapshot() {
    std::lock_guard<std::mutex> lock(mutex);
    return params;
  }
};

} // namespace inference
} // namespace mbvi
