/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <limits>
#include <random>

#include "mbvi/inference/local_factor_store.h"
#include "mbvi/inference/tests/mixture_util_test.h"

namespace mbvi {
namespace inference {

Eigen::MatrixXd five_cluster_means() {
  Eigen::MatrixXd means(5, 2);
  means << 0, 0, 5, 5, -5, 5, 5, -5, -5, -5;
  return means;
}

Eigen::MatrixXd three_cluster_means() {
  Eigen::MatrixXd means(3, 2);
  means << -6, 0, 0, 6, 6, 0;
  return means;
}

double max_nearest_distance(
    const Eigen::MatrixXd& from,
    const Eigen::MatrixXd& to) {
  double result = 0;
  for (Eigen::Index i = 0; i < from.rows(); i++) {
    double nearest =
        (to.rowwise() - from.row(i)).rowwise().norm().minCoeff();
    result = std::max(result, nearest);
  }
  return result;
}

double mean_nearest_distance(
    const Eigen::MatrixXd& from,
    const Eigen::MatrixXd& to) {
  double sum = 0;
  for (Eigen::Index i = 0; i < from.rows(); i++) {
    sum += (to.rowwise() - from.row(i)).rowwise().norm().minCoeff();
  }
  return sum / from.rows();
}

Eigen::MatrixXd
sample_mixture(const Eigen::MatrixXd& means, uint n, uint seed, double sd) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<Eigen::Index> pick(0, means.rows() - 1);
  std::normal_distribution<double> noise(0, sd);
  Eigen::MatrixXd x(n, means.cols());
  for (uint i = 0; i < n; i++) {
    Eigen::Index k = pick(gen);
    for (Eigen::Index d = 0; d < means.cols(); d++) {
      x(i, d) = means(k, d) + noise(gen);
    }
  }
  return x;
}

BoundMixture::BoundMixture(
    uint batch_size,
    uint dataset_size,
    VariationalFamily global_family,
    uint seed)
    : config(3, 2, 10.0, 1.0),
      model(backend::build_gaussian_mixture_model(config, global_family)),
      backend(config),
      scales(ScaleTable::for_subsample(model, dataset_size, batch_size)) {
  std::vector<uint> indices;
  for (uint m = 0; m < batch_size; m++) {
    indices.push_back(m);
  }
  batch = data::Batch(
      indices, sample_mixture(three_cluster_means(), batch_size, seed));
  for (const auto& entry : global_layout(model)) {
    global.add(
        entry.first,
        Eigen::MatrixXd::Zero(entry.second.rows, entry.second.cols));
  }
  std::mt19937 gen(seed);
  backend.initialize_global(global, InitType::DATA, gen, batch);
  for (const auto& spec : local_layout(model)) {
    local.add(spec.name, Eigen::MatrixXd::Zero(batch_size, spec.cols));
  }
}

Subgraph BoundMixture::bind() {
  return SubgraphBinder().bind(model, batch, global, local);
}

void FaultyBackend::poison(Evaluation& evaluation) const {
  for (const auto& name : evaluation.gradient.names()) {
    evaluation.gradient.at(name)(0, 0) =
        std::numeric_limits<double>::quiet_NaN();
  }
}

void FaultyBackend::initialize_global(
    ParameterSet& global,
    InitType init_type,
    std::mt19937& gen,
    const data::Batch& batch) const {
  inner.initialize_global(global, init_type, gen, batch);
}

Evaluation FaultyBackend::evaluate(
    InferenceMode mode,
    const Subgraph& subgraph,
    const ScaleTable& scales,
    std::mt19937& gen,
    const StepOptions& options) const {
  Evaluation result = inner.evaluate(mode, subgraph, scales, gen, options);
  if (mode == this->mode and ++num_calls == fail_at) {
    poison(result);
  }
  return result;
}

Evaluation FaultyBackend::evaluate_log_joint(
    const Subgraph& subgraph,
    const ScaleTable& scales,
    const StepOptions& options) const {
  Evaluation result = inner.evaluate_log_joint(subgraph, scales, options);
  if (mode == InferenceMode::GLOBAL and ++num_calls == fail_at) {
    poison(result);
  }
  return result;
}

} // namespace inference
} // namespace mbvi
