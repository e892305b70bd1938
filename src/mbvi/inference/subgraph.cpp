/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fmt/format.h>

#include "mbvi/errors.h"
#include "mbvi/inference/local_factor_store.h"
#include "mbvi/inference/subgraph.h"

namespace mbvi {
namespace inference {

std::map<std::string, TensorShape> global_layout(const model::Model& model) {
  std::map<std::string, TensorShape> layout;
  for (model::SiteID id : model.sites_of_kind(SiteKind::GLOBAL)) {
    const model::Site& site = model.site(id);
    TensorShape shape{site.shape.rows, site.shape.cols};
    if (site.family == VariationalFamily::EMPIRICAL) {
      layout[tensor_name(site.name, "value")] = shape;
    } else {
      layout[tensor_name(site.name, "loc")] = shape;
      layout[tensor_name(site.name, "scale_raw")] = shape;
    }
  }
  return layout;
}

Eigen::MatrixXd Subgraph::observations(const std::string& site) const {
  const BoundSite& bound = bound_site(site);
  if (bound.site->kind != SiteKind::OBSERVED) {
    throw std::invalid_argument(
        fmt::format("site '{}' is not observed", site));
  }
  return _batch->values.middleCols(bound.column, bound.site->shape.size());
}

const BoundSite& Subgraph::bound_site(const std::string& site) const {
  for (const auto& bound : _p_joint) {
    if (bound.site->name == site) {
      return bound;
    }
  }
  throw UnknownSiteError(site);
}

void Subgraph::check_shapes(
    InferenceMode mode,
    const ParameterSet& params,
    const std::string& what) const {
  const auto& declared = shapes(mode);
  if (params.num_tensors() != declared.size()) {
    throw ShapeError(fmt::format(
        "{} has {} tensors but the {} block declares {}",
        what,
        params.num_tensors(),
        to_string(mode),
        declared.size()));
  }
  for (const auto& entry : declared) {
    if (not params.has(entry.first)) {
      throw ShapeError(
          fmt::format("{} is missing tensor '{}'", what, entry.first));
    }
    const Eigen::MatrixXd& value = params.at(entry.first);
    if (value.rows() != entry.second.rows or
        value.cols() != entry.second.cols) {
      throw ShapeError(fmt::format(
          "{} tensor '{}' is {}x{}, expected {}x{}",
          what,
          entry.first,
          value.rows(),
          value.cols(),
          entry.second.rows,
          entry.second.cols));
    }
  }
}

uint Subgraph::num_parameters(InferenceMode mode) const {
  uint count = 0;
  for (const auto& entry : shapes(mode)) {
    count += entry.second.rows * entry.second.cols;
  }
  return count;
}

Subgraph SubgraphBinder::bind(
    const model::Model& model,
    const data::Batch& batch,
    ParameterSet& global,
    ParameterSet& local) const {
  const uint batch_size = batch.size();
  if (batch.values.rows() != batch_size) {
    throw DimensionMismatchError(fmt::format(
        "batch has {} indices but {} observation rows",
        batch_size,
        batch.values.rows()));
  }
  for (const auto& name : local.names()) {
    if (local.at(name).rows() != batch_size) {
      throw DimensionMismatchError(fmt::format(
          "local tensor '{}' has {} rows for a batch of {}",
          name,
          local.at(name).rows(),
          batch_size));
    }
  }

  Subgraph subgraph;
  subgraph._model = &model;
  subgraph._batch = &batch;
  subgraph._global = &global;
  subgraph._local = &local;
  subgraph._global_shapes = global_layout(model);
  for (const auto& spec : local_layout(model)) {
    subgraph._local_shapes[spec.name] = TensorShape{batch_size, spec.cols};
  }

  uint column = 0;
  for (const model::Site& site : model.sites()) {
    BoundSite bound{&site, site.is_subsampled() ? batch_size : 1u, {}};
    if (site.kind == SiteKind::OBSERVED) {
      bound.column = column;
      column += site.shape.size();
    } else {
      const std::string prefix = site.name + ".";
      const auto& declared =
          subgraph.shapes(site.kind == SiteKind::GLOBAL ? InferenceMode::GLOBAL
                                                       : InferenceMode::LOCAL);
      for (const auto& entry : declared) {
        if (entry.first.compare(0, prefix.size(), prefix) == 0) {
          bound.tensors.push_back(entry.first);
        }
      }
      subgraph._q_joint.push_back(bound);
    }
    subgraph._p_joint.push_back(bound);
  }
  if (column != batch.values.cols()) {
    throw DimensionMismatchError(fmt::format(
        "observations have {} columns but the observed sites hold {}",
        batch.values.cols(),
        column));
  }
  return subgraph;
}

} // namespace inference
} // namespace mbvi
