/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#define _USE_MATH_DEFINES
#include <cmath>

#include "mbvi/util.h"

namespace mbvi {
namespace util {

double logistic(double logodds) {
  return 1.0 / (1.0 + std::exp(-logodds));
}

double log_sum_exp(const Eigen::Ref<const Eigen::RowVectorXd>& values) {
  if (values.size() == 0) {
    throw std::invalid_argument("log_sum_exp of an empty row");
  }
  double max = values.maxCoeff();
  return std::log((values.array() - max).exp().sum()) + max;
}

Eigen::MatrixXd softmax_rows(const Eigen::MatrixXd& log_pot) {
  Eigen::MatrixXd probs(log_pot.rows(), log_pot.cols());
  for (Eigen::Index r = 0; r < log_pot.rows(); r++) {
    double logZ = log_sum_exp(log_pot.row(r));
    probs.row(r) = (log_pot.row(r).array() - logZ).exp();
  }
  return probs;
}

double log1pexp(double x) {
  if (x <= -37) {
    return std::exp(x);
  } else if (x <= 18) {
    return std::log1p(std::exp(x));
  } else if (x <= 33.3) {
    return x + std::exp(-x);
  } else {
    return x;
  }
}

Eigen::MatrixXd log1pexp(const Eigen::MatrixXd& x) {
  return x.unaryExpr([](double x) { return log1pexp(x); });
}

Eigen::MatrixXd standard_normal(std::mt19937& gen, int rows, int cols) {
  std::normal_distribution<double> dist(0.0, 1.0);
  Eigen::MatrixXd result(rows, cols);
  for (int c = 0; c < cols; c++) {
    for (int r = 0; r < rows; r++) {
      result(r, c) = dist(gen);
    }
  }
  return result;
}

std::vector<uint> chunk_boundaries(uint n, uint num_chunks) {
  if (num_chunks == 0) {
    num_chunks = 1;
  }
  num_chunks = std::min(num_chunks, std::max(n, 1u));
  std::vector<uint> bounds;
  bounds.reserve(num_chunks + 1);
  uint base = n / num_chunks;
  uint extra = n % num_chunks;
  uint start = 0;
  bounds.push_back(start);
  for (uint i = 0; i < num_chunks; i++) {
    start += base + (i < extra ? 1 : 0);
    bounds.push_back(start);
  }
  return bounds;
}

uint parallel_for_chunks(
    uint n,
    uint num_threads,
    const std::function<void(uint, uint, uint)>& body) {
  std::vector<uint> bounds = chunk_boundaries(n, num_threads);
  uint num_chunks = static_cast<uint>(bounds.size()) - 1;
  if (num_chunks <= 1) {
    if (num_chunks == 1) {
      body(0, bounds[0], bounds[1]);
    }
    return num_chunks;
  }
  std::vector<std::thread> threads;
  std::vector<std::exception_ptr> errors(num_chunks, nullptr);
  for (uint i = 0; i < num_chunks; i++) {
    std::thread worker([&body, &bounds, &errors, i]() {
      try {
        body(i, bounds[i], bounds[i + 1]);
      } catch (...) {
        errors[i] = std::current_exception();
      }
    });
    threads.push_back(std::move(worker));
  }
  for (auto& worker : threads) {
    worker.join();
  }
  for (const auto& e : errors) {
    if (e != nullptr) {
      std::rethrow_exception(e);
    }
  }
  return num_chunks;
}

} // namespace util
} // namespace mbvi
