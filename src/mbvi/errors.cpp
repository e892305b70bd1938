/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fmt/format.h>

#include "mbvi/errors.h"

namespace mbvi {

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::UNKNOWN_SITE:
      return "UnknownSiteError";
    case ErrorKind::NO_ACTIVE_BATCH:
      return "NoActiveBatchError";
    case ErrorKind::DIMENSION_MISMATCH:
      return "DimensionMismatchError";
    case ErrorKind::SHAPE:
      return "ShapeError";
    case ErrorKind::OPTIMIZATION_DIVERGED:
      return "OptimizationDivergedError";
  }
  return "InferenceError";
}

InferenceError::InferenceError(ErrorKind kind, const std::string& detail)
    : std::runtime_error(detail),
      _kind(kind),
      _detail(detail),
      _message(fmt::format("{}: {}", to_string(kind), detail)) {}

void InferenceError::set_context(uint iteration, InferenceMode mode) {
  _has_context = true;
  _iteration = iteration;
  _mode = mode;
  _message = fmt::format(
      "{} in outer iteration {} ({} step): {}",
      to_string(_kind),
      iteration,
      to_string(mode),
      _detail);
}

UnknownSiteError::UnknownSiteError(const std::string& site)
    : InferenceError(
          ErrorKind::UNKNOWN_SITE,
          fmt::format("site '{}' is not registered", site)),
      site(site) {}

NoActiveBatchError::NoActiveBatchError(const std::string& detail)
    : InferenceError(ErrorKind::NO_ACTIVE_BATCH, detail) {}

DimensionMismatchError::DimensionMismatchError(const std::string& detail)
    : InferenceError(ErrorKind::DIMENSION_MISMATCH, detail) {}

ShapeError::ShapeError(const std::string& detail)
    : InferenceError(ErrorKind::SHAPE, detail) {}

OptimizationDivergedError::OptimizationDivergedError(const std::string& detail)
    : InferenceError(ErrorKind::OPTIMIZATION_DIVERGED, detail) {}

} // namespace mbvi
