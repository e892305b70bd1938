/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#define _USE_MATH_DEFINES
#include <cmath>

#include <algorithm>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>

#include "mbvi/backend/gaussian_mixture.h"
#include "mbvi/distribution/categorical.h"
#include "mbvi/distribution/normal.h"
#include "mbvi/errors.h"
#include "mbvi/util.h"

namespace mbvi {
namespace backend {

using inference::Evaluation;
using inference::ParameterSet;
using inference::tensor_name;

const std::string GaussianMixtureBackend::GLOBAL_SITE = "beta";
const std::string GaussianMixtureBackend::LOCAL_SITE = "z";
const std::string GaussianMixtureBackend::OBSERVED_SITE = "x";

model::Model build_gaussian_mixture_model(
    const GaussianMixtureConfig& config,
    VariationalFamily global_family) {
  model::Model model;
  model::SiteID beta = model.add_global(
      GaussianMixtureBackend::GLOBAL_SITE,
      model::Shape(config.num_clusters, config.dim),
      global_family);
  model::SiteID z = model.add_local(
      GaussianMixtureBackend::LOCAL_SITE,
      model::Shape(1, config.num_clusters),
      VariationalFamily::CATEGORICAL);
  model.add_observed(
      GaussianMixtureBackend::OBSERVED_SITE,
      model::Shape(1, config.dim),
      {beta, z});
  return model;
}

GaussianMixtureBackend::GaussianMixtureBackend(
    const GaussianMixtureConfig& config)
    : _config(config) {
  if (config.num_clusters == 0 or config.dim == 0) {
    throw std::invalid_argument(
        "a mixture needs at least one cluster and one dimension");
  }
  if (not(config.prior_scale > 0) or not(config.obs_scale > 0)) {
    throw std::invalid_argument("prior_scale and obs_scale must be positive");
  }
}

Eigen::MatrixXd GaussianMixtureBackend::farthest_point_centers(
    const Eigen::MatrixXd& observations) const {
  const uint num_clusters = _config.num_clusters;
  if (observations.rows() < num_clusters) {
    throw std::invalid_argument(fmt::format(
        "cannot seed {} clusters from {} observations",
        num_clusters,
        observations.rows()));
  }
  if (observations.cols() != _config.dim) {
    throw std::invalid_argument(fmt::format(
        "observations have {} columns for a mixture in {} dimensions",
        observations.cols(),
        _config.dim));
  }
  Eigen::MatrixXd centers(num_clusters, _config.dim);
  centers.row(0) = observations.row(0);
  Eigen::VectorXd distance =
      (observations.rowwise() - observations.row(0)).rowwise().squaredNorm();
  for (uint k = 1; k < num_clusters; k++) {
    Eigen::Index farthest;
    distance.maxCoeff(&farthest);
    centers.row(k) = observations.row(farthest);
    distance = distance.cwiseMin(
        (observations.rowwise() - observations.row(farthest))
            .rowwise()
            .squaredNorm());
  }
  return centers;
}

void GaussianMixtureBackend::initialize_global(
    ParameterSet& global,
    InitType init_type,
    std::mt19937& gen,
    const data::Batch& batch) const {
  const std::string value_name = tensor_name(GLOBAL_SITE, "value");
  const std::string loc_name = tensor_name(GLOBAL_SITE, "loc");
  const std::string raw_name = tensor_name(GLOBAL_SITE, "scale_raw");
  const bool point_estimate = global.has(value_name);
  if (not point_estimate and
      not(global.has(loc_name) and global.has(raw_name))) {
    throw std::invalid_argument(fmt::format(
        "global parameters must hold '{}' or both '{}' and '{}'",
        value_name,
        loc_name,
        raw_name));
  }
  const uint rows = _config.num_clusters;
  const uint cols = _config.dim;

  Eigen::MatrixXd loc(rows, cols);
  Eigen::MatrixXd raw = Eigen::MatrixXd::Zero(rows, cols);
  switch (init_type) {
    case InitType::RANDOM: {
      std::uniform_real_distribution<double> uniform(-2, 2);
      for (uint i = 0; i < loc.size(); i++) {
        *(loc.data() + i) = uniform(gen);
      }
      for (uint i = 0; i < raw.size(); i++) {
        *(raw.data() + i) = uniform(gen);
      }
      break;
    }
    case InitType::ZERO:
      loc.setZero();
      break;
    case InitType::PRIOR:
      loc = _config.prior_scale * util::standard_normal(gen, rows, cols);
      break;
    case InitType::DATA:
      loc = farthest_point_centers(batch.values);
      break;
    default:
      throw std::invalid_argument("unsupported initialization type");
  }

  if (point_estimate) {
    global.at(value_name) = loc;
  } else {
    global.at(loc_name) = loc;
    global.at(raw_name) = raw;
  }
}

GaussianMixtureBackend::WeightedSums GaussianMixtureBackend::weighted_sums(
    const Eigen::MatrixXd& responsibilities,
    const Eigen::MatrixXd& observations,
    uint num_threads) const {
  const uint batch_size = static_cast<uint>(observations.rows());
  const uint num_chunks =
      static_cast<uint>(util::chunk_boundaries(batch_size, num_threads).size()) -
      1;
  std::vector<WeightedSums> partial(num_chunks);
  util::parallel_for_chunks(
      batch_size, num_threads, [&](uint chunk, uint begin, uint end) {
        const auto r = responsibilities.middleRows(begin, end - begin);
        const auto x = observations.middleRows(begin, end - begin);
        WeightedSums& sums = partial[chunk];
        sums.weight = r.colwise().sum().transpose();
        sums.sum = r.transpose() * x;
        sums.sum_sq = r.transpose() * x.rowwise().squaredNorm();
      });

  WeightedSums total{
      Eigen::VectorXd::Zero(_config.num_clusters),
      Eigen::MatrixXd::Zero(_config.num_clusters, _config.dim),
      Eigen::VectorXd::Zero(_config.num_clusters)};
  for (const auto& sums : partial) {
    total.weight += sums.weight;
    total.sum += sums.sum;
    total.sum_sq += sums.sum_sq;
  }
  return total;
}

double GaussianMixtureBackend::expected_log_likelihood(
    const WeightedSums& sums,
    const Eigen::MatrixXd& beta) const {
  const double variance = _config.obs_scale * _config.obs_scale;
  const double log_norm =
      0.5 * _config.dim * std::log(2 * M_PI * variance);
  double result = 0;
  for (uint k = 0; k < _config.num_clusters; k++) {
    double squared = sums.sum_sq(k) - 2 * beta.row(k).dot(sums.sum.row(k)) +
        sums.weight(k) * beta.row(k).squaredNorm();
    result += -sums.weight(k) * log_norm - squared / (2 * variance);
  }
  return result;
}

Eigen::MatrixXd GaussianMixtureBackend::expected_log_likelihood_gradient(
    const WeightedSums& sums,
    const Eigen::MatrixXd& beta) const {
  const double variance = _config.obs_scale * _config.obs_scale;
  return (sums.sum - sums.weight.asDiagonal() * beta) / variance;
}

double GaussianMixtureBackend::local_prior_and_entropy(
    const Eigen::MatrixXd& logits) const {
  distribution::Categorical q(logits);
  Eigen::ArrayXXd log_p = q.log_probs().array();
  const double log_uniform = -std::log(double(_config.num_clusters));
  return (log_p.exp() * (log_uniform - log_p)).sum();
}

void GaussianMixtureBackend::global_factor(
    const ParameterSet& global,
    Eigen::MatrixXd& loc,
    Eigen::MatrixXd& scale) const {
  const std::string value_name = tensor_name(GLOBAL_SITE, "value");
  if (global.has(value_name)) {
    loc = global.at(value_name);
    scale = Eigen::MatrixXd::Zero(loc.rows(), loc.cols());
    return;
  }
  loc = global.at(tensor_name(GLOBAL_SITE, "loc"));
  scale = util::log1pexp(global.at(tensor_name(GLOBAL_SITE, "scale_raw")));
  if (not(scale.minCoeff() > 0)) {
    throw OptimizationDivergedError(
        "the scale of q(" + GLOBAL_SITE + ") is not positive");
  }
}

double GaussianMixtureBackend::log_prior(const Eigen::MatrixXd& beta) const {
  distribution::Normal prior(
      Eigen::MatrixXd::Zero(beta.rows(), beta.cols()), _config.prior_scale);
  return prior.log_prob(beta);
}

Evaluation GaussianMixtureBackend::evaluate(
    InferenceMode mode,
    const inference::Subgraph& subgraph,
    const inference::ScaleTable& scales,
    std::mt19937& gen,
    const inference::StepOptions& options) const {
  if (mode == InferenceMode::LOCAL) {
    return evaluate_local(subgraph, scales, options);
  }
  return evaluate_global(subgraph, scales, gen, options);
}

Evaluation GaussianMixtureBackend::evaluate_local(
    const inference::Subgraph& subgraph,
    const inference::ScaleTable& scales,
    const inference::StepOptions& options) const {
  Eigen::MatrixXd loc, scale;
  global_factor(subgraph.global_params(), loc, scale);
  const Eigen::MatrixXd& logits =
      subgraph.local_params().at(tensor_name(LOCAL_SITE, "logits"));
  const Eigen::MatrixXd x = subgraph.observations(OBSERVED_SITE);
  const double x_scale = scales.get(OBSERVED_SITE);
  const double z_scale = scales.get(LOCAL_SITE);
  const double log_uniform = -std::log(double(_config.num_clusters));
  const uint batch_size = subgraph.batch_size();

  Eigen::MatrixXd grad(logits.rows(), logits.cols());
  const uint num_chunks = static_cast<uint>(
      util::chunk_boundaries(batch_size, options.num_threads).size() - 1);
  std::vector<double> partial(num_chunks, 0.0);
  util::parallel_for_chunks(
      batch_size, options.num_threads, [&](uint chunk, uint begin, uint end) {
        const uint rows = end - begin;
        // payoff divided by z_scale so that the entropy term keeps weight 1
        Eigen::MatrixXd payoff(rows, _config.num_clusters);
        for (uint m = 0; m < rows; m++) {
          for (uint k = 0; k < _config.num_clusters; k++) {
            payoff(m, k) = x_scale / z_scale *
                    distribution::expected_normal_log_prob(
                        x.row(begin + m),
                        loc.row(k),
                        scale.row(k),
                        _config.obs_scale) +
                log_uniform;
          }
        }
        distribution::Categorical q(logits.middleRows(begin, rows));
        Eigen::MatrixXd chunk_grad;
        double objective = q.expected_payoff_with_entropy(payoff, chunk_grad);
        grad.middleRows(begin, rows) = -z_scale * chunk_grad;
        partial[chunk] = -z_scale * objective;
      });

  Evaluation result;
  for (double value : partial) {
    result.value += value;
  }
  if (scale.isZero()) {
    result.value -= log_prior(loc);
  } else {
    result.value += distribution::Normal(loc, scale).kl_divergence(
        distribution::Normal(
            Eigen::MatrixXd::Zero(loc.rows(), loc.cols()),
            _config.prior_scale));
  }
  result.gradient.add(tensor_name(LOCAL_SITE, "logits"), grad);
  return result;
}

Evaluation GaussianMixtureBackend::evaluate_global(
    const inference::Subgraph& subgraph,
    const inference::ScaleTable& scales,
    std::mt19937& gen,
    const inference::StepOptions& options) const {
  const ParameterSet& global = subgraph.global_params();
  const Eigen::MatrixXd& logits =
      subgraph.local_params().at(tensor_name(LOCAL_SITE, "logits"));
  const double z_scale = scales.get(LOCAL_SITE);

  if (global.has(tensor_name(GLOBAL_SITE, "value"))) {
    // q(beta) is a point mass: minimize -log p~ - H(q(z))
    Evaluation log_joint = evaluate_log_joint(subgraph, scales, options);
    Evaluation result;
    result.value = -log_joint.value -
        z_scale * distribution::Categorical(logits).entropy();
    for (const auto& name : log_joint.gradient.names()) {
      result.gradient.add(name, -log_joint.gradient.at(name));
    }
    return result;
  }

  Eigen::MatrixXd loc, scale;
  global_factor(global, loc, scale);
  const double x_scale = scales.get(OBSERVED_SITE);
  const WeightedSums sums = weighted_sums(
      util::softmax_rows(logits),
      subgraph.observations(OBSERVED_SITE),
      options.num_threads);
  const uint num_samples = std::max(options.num_samples, 1u);

  Evaluation result;
  result.value = -z_scale * local_prior_and_entropy(logits);
  Eigen::MatrixXd grad_loc = Eigen::MatrixXd::Zero(loc.rows(), loc.cols());
  Eigen::MatrixXd grad_scale = Eigen::MatrixXd::Zero(loc.rows(), loc.cols());
  for (uint s = 0; s < num_samples; s++) {
    Eigen::MatrixXd eps =
        util::standard_normal(gen, int(loc.rows()), int(loc.cols()));
    Eigen::MatrixXd beta = loc + scale.cwiseProduct(eps);
    result.value -= x_scale * expected_log_likelihood(sums, beta) / num_samples;
    Eigen::MatrixXd grad_beta = -x_scale / num_samples *
        expected_log_likelihood_gradient(sums, beta);
    grad_loc += grad_beta;
    grad_scale += grad_beta.cwiseProduct(eps);
  }

  distribution::Normal q(loc, scale);
  distribution::Normal prior(
      Eigen::MatrixXd::Zero(loc.rows(), loc.cols()), _config.prior_scale);
  result.value += q.kl_divergence(prior);
  q.gradient_kl_divergence(prior, grad_loc, grad_scale);

  // d softplus(raw) / d raw = logistic(raw)
  const Eigen::MatrixXd& raw = global.at(tensor_name(GLOBAL_SITE, "scale_raw"));
  Eigen::MatrixXd grad_raw = grad_scale.cwiseProduct(
      raw.unaryExpr([](double v) { return util::logistic(v); }));
  result.gradient.add(tensor_name(GLOBAL_SITE, "loc"), grad_loc);
  result.gradient.add(tensor_name(GLOBAL_SITE, "scale_raw"), grad_raw);
  return result;
}

Evaluation GaussianMixtureBackend::evaluate_log_joint(
    const inference::Subgraph& subgraph,
    const inference::ScaleTable& scales,
    const inference::StepOptions& options) const {
  const std::string value_name = tensor_name(GLOBAL_SITE, "value");
  const ParameterSet& global = subgraph.global_params();
  if (not global.has(value_name)) {
    throw std::invalid_argument(fmt::format(
        "the log joint needs a point value '{}' of the global site",
        value_name));
  }
  const Eigen::MatrixXd& beta = global.at(value_name);
  const Eigen::MatrixXd& logits =
      subgraph.local_params().at(tensor_name(LOCAL_SITE, "logits"));
  const double x_scale = scales.get(OBSERVED_SITE);
  const double z_scale = scales.get(LOCAL_SITE);
  const WeightedSums sums = weighted_sums(
      util::softmax_rows(logits),
      subgraph.observations(OBSERVED_SITE),
      options.num_threads);

  // every row of the responsibilities sums to one
  const double log_uniform = -std::log(double(_config.num_clusters));
  Evaluation result;
  result.value = log_prior(beta) +
      x_scale * expected_log_likelihood(sums, beta) +
      z_scale * subgraph.batch_size() * log_uniform;
  Eigen::MatrixXd grad = x_scale * expected_log_likelihood_gradient(sums, beta);
  distribution::Normal prior(
      Eigen::MatrixXd::Zero(beta.rows(), beta.cols()), _config.prior_scale);
  prior.gradient_log_prob_value(beta, grad);
  result.gradient.add(value_name, grad);
  return result;
}

} // namespace backend
} // namespace mbvi
