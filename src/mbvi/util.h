/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#define _USE_MATH_DEFINES
#include <cmath>

#include <sys/types.h>
#include <Eigen/Dense>
#include <algorithm>
#include <exception>
#include <functional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace mbvi {
namespace util {

// compute  1 / (1 + exp(-logodds))
double logistic(double logodds);

/*
Equivalent to log of sum of exponentiations of values,
but more numerically stable.
:param values: a non-empty row of log values
:returns: log sum exp of values
*/
double log_sum_exp(const Eigen::Ref<const Eigen::RowVectorXd>& values);

/*
Given the log potentials of every row, return the normalized distribution
of every row: p(r, i) = exp(log_pot(r, i) - log_sum_exp(log_pot.row(r))).
*/
Eigen::MatrixXd softmax_rows(const Eigen::MatrixXd& log_pot);

/*
Compute `log(1 + exp(x))` with numerical stability.
This is the softplus function used to map unconstrained reals to positive
scales.
See: https://cran.r-project.org/web/packages/Rmpfr/vignettes/log1mexp-note.pdf
:param x:
:returns: log(1 + exp(x))
*/
double log1pexp(double x);

Eigen::MatrixXd log1pexp(const Eigen::MatrixXd& x);

// true iff every coefficient is neither NaN nor infinite
template <typename Derived>
bool all_finite(const Eigen::DenseBase<Derived>& m) {
  return m.allFinite();
}

// Fill a matrix with independent standard normal draws.
Eigen::MatrixXd standard_normal(std::mt19937& gen, int rows, int cols);

/*
Split the half-open range [0, n) into at most num_chunks contiguous chunks
of nearly equal size. Returns the chunk boundaries, so chunk i covers
[bounds[i], bounds[i + 1]).
*/
std::vector<uint> chunk_boundaries(uint n, uint num_chunks);

/*
Run body(chunk, begin, end) for every chunk of chunk_boundaries(n,
num_threads), one thread per chunk. The first exception thrown by any
chunk is rethrown after all threads have been joined.
:returns: the number of chunks
*/
uint parallel_for_chunks(
    uint n,
    uint num_threads,
    const std::function<void(uint, uint, uint)>& body);

} // namespace util
} // namespace mbvi
