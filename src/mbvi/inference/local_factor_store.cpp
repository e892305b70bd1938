/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <stdexcept>

#include <fmt/format.h>

#include "mbvi/errors.h"
#include "mbvi/inference/local_factor_store.h"

namespace mbvi {
namespace inference {

std::vector<LocalTensorSpec> local_layout(const model::Model& model) {
  std::vector<LocalTensorSpec> layout;
  for (model::SiteID id : model.sites_of_kind(SiteKind::LOCAL)) {
    const model::Site& site = model.site(id);
    if (site.family == VariationalFamily::CATEGORICAL) {
      layout.push_back({tensor_name(site.name, "logits"), site.shape.size(), 0});
    } else {
      layout.push_back({tensor_name(site.name, "loc"), site.shape.size(), 0});
      layout.push_back(
          {tensor_name(site.name, "scale_raw"), site.shape.size(), 0});
    }
  }
  return layout;
}

LocalFactorStore::LocalFactorStore(std::vector<LocalTensorSpec> layout)
    : _layout(std::move(layout)) {
  if (_layout.empty()) {
    throw std::invalid_argument("the model has no local sites");
  }
}

ParameterSet& LocalFactorStore::current() {
  if (not _active) {
    throw NoActiveBatchError(
        "local parameters requested before allocate() or after reset()");
  }
  return _current;
}

const ParameterSet& LocalFactorStore::current() const {
  if (not _active) {
    throw NoActiveBatchError(
        "local parameters requested before allocate() or after reset()");
  }
  return _current;
}

const std::vector<uint>& LocalFactorStore::batch_indices() const {
  if (not _active) {
    throw NoActiveBatchError("no batch is allocated");
  }
  return _indices;
}

ParameterSet LocalFactorStore::default_parameters(uint rows) const {
  ParameterSet params;
  for (const auto& spec : _layout) {
    params.add(
        spec.name, Eigen::MatrixXd::Constant(rows, spec.cols, spec.default_value));
  }
  return params;
}

EphemeralLocalFactorStore::EphemeralLocalFactorStore(
    std::vector<LocalTensorSpec> layout)
    : LocalFactorStore(std::move(layout)) {}

ParameterSet& EphemeralLocalFactorStore::allocate(
    const std::vector<uint>& batch_indices) {
  if (batch_indices.empty()) {
    throw std::invalid_argument("cannot allocate an empty batch");
  }
  reset();
  _current = default_parameters(static_cast<uint>(batch_indices.size()));
  _indices = batch_indices;
  _active = true;
  return _current;
}

void EphemeralLocalFactorStore::reset() {
  _current.clear();
  _indices.clear();
  _active = false;
}

uint EphemeralLocalFactorStore::num_parameters() const {
  return _current.size();
}

PersistentLocalFactorStore::PersistentLocalFactorStore(
    std::vector<LocalTensorSpec> layout,
    uint dataset_size)
    : LocalFactorStore(std::move(layout)), _dataset_size(dataset_size) {
  if (dataset_size == 0) {
    throw std::invalid_argument("the data set is empty");
  }
  _table = default_parameters(dataset_size);
}

ParameterSet& PersistentLocalFactorStore::allocate(
    const std::vector<uint>& batch_indices) {
  if (batch_indices.empty()) {
    throw std::invalid_argument("cannot allocate an empty batch");
  }
  for (uint index : batch_indices) {
    if (index >= _dataset_size) {
      throw std::out_of_range(fmt::format(
          "batch index {} is outside a data set of size {}",
          index,
          _dataset_size));
    }
  }
  reset();
  _current = default_parameters(static_cast<uint>(batch_indices.size()));
  for (const auto& name : _table.names()) {
    const Eigen::MatrixXd& table = _table.at(name);
    Eigen::MatrixXd& view = _current.at(name);
    for (size_t m = 0; m < batch_indices.size(); m++) {
      view.row(m) = table.row(batch_indices[m]);
    }
  }
  _indices = batch_indices;
  _active = true;
  return _current;
}

void PersistentLocalFactorStore::reset() {
  if (not _active) {
    return;
  }
  for (const auto& name : _table.names()) {
    Eigen::MatrixXd& table = _table.at(name);
    const Eigen::MatrixXd& view = _current.at(name);
    for (size_t m = 0; m < _indices.size(); m++) {
      table.row(_indices[m]) = view.row(m);
    }
  }
  _current.clear();
  _indices.clear();
  _active = false;
}

uint PersistentLocalFactorStore::num_parameters() const {
  return _table.size() + _current.size();
}

Eigen::RowVectorXd PersistentLocalFactorStore::row(
    const std::string& tensor,
    uint index) const {
  if (index >= _dataset_size) {
    throw std::out_of_range("index " + std::to_string(index) + " is invalid");
  }
  return _table.at(tensor).row(index);
}

std::unique_ptr<LocalFactorStore> make_local_factor_store(
    LocalBacking backing,
    const model::Model& model,
    uint dataset_size) {
  if (backing == LocalBacking::PERSISTENT) {
    return std::make_unique<PersistentLocalFactorStore>(
        local_layout(model), dataset_size);
  }
  return std::make_unique<EphemeralLocalFactorStore>(local_layout(model));
}

} // namespace inference
} // namespace mbvi
