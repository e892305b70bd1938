/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <stdexcept>

#include <fmt/format.h>

#include "mbvi/errors.h"
#include "mbvi/inference/parameter_set.h"

namespace mbvi {
namespace inference {

std::string tensor_name(const std::string& site, const std::string& param) {
  return site + "." + param;
}

void ParameterSet::add(const std::string& name, const Eigen::MatrixXd& value) {
  if (has(name)) {
    throw std::invalid_argument("duplicate parameter '" + name + "'");
  }
  _index[name] = _names.size();
  _names.push_back(name);
  _values.push_back(value);
}

bool ParameterSet::has(const std::string& name) const {
  return _index.find(name) != _index.end();
}

Eigen::MatrixXd& ParameterSet::at(const std::string& name) {
  auto it = _index.find(name);
  if (it == _index.end()) {
    throw std::out_of_range("no parameter named '" + name + "'");
  }
  return _values[it->second];
}

const Eigen::MatrixXd& ParameterSet::at(const std::string& name) const {
  auto it = _index.find(name);
  if (it == _index.end()) {
    throw std::out_of_range("no parameter named '" + name + "'");
  }
  return _values[it->second];
}

uint ParameterSet::size() const {
  Eigen::Index total = 0;
  for (const auto& value : _values) {
    total += value.size();
  }
  return static_cast<uint>(total);
}

void ParameterSet::get_flattened(Eigen::VectorXd& flattened) const {
  flattened.resize(size());
  Eigen::Index i = 0;
  for (const auto& value : _values) {
    flattened.segment(i, value.size()) =
        Eigen::Map<const Eigen::VectorXd>(value.data(), value.size());
    i += value.size();
  }
}

void ParameterSet::set_flattened(const Eigen::VectorXd& flattened) {
  if (flattened.size() != size()) {
    throw ShapeError(fmt::format(
        "expected {} flattened parameter values but got {}",
        size(),
        flattened.size()));
  }
  Eigen::Index i = 0;
  for (auto& value : _values) {
    Eigen::Map<Eigen::VectorXd>(value.data(), value.size()) =
        flattened.segment(i, value.size());
    i += value.size();
  }
}

void ParameterSet::set_zero() {
  for (auto& value : _values) {
    value.setZero();
  }
}

void ParameterSet::clear() {
  _names.clear();
  _values.clear();
  _index.clear();
}

bool ParameterSet::all_finite() const {
  for (const auto& value : _values) {
    if (not value.allFinite()) {
      return false;
    }
  }
  return true;
}

} // namespace inference
} // namespace mbvi
