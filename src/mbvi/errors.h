/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <stdexcept>
#include <string>

#include "mbvi/types.h"

namespace mbvi {

enum class ErrorKind {
  UNKNOWN_SITE,
  NO_ACTIVE_BATCH,
  DIMENSION_MISMATCH,
  SHAPE,
  OPTIMIZATION_DIVERGED,
};

std::string to_string(ErrorKind kind);

/*
Base class of all errors raised while running inference. Every one of them
is terminal for SubsamplingDriver::run: the driver records the outer
iteration and mode in which the error happened (see set_context) and
rethrows the same object, so callers can catch the concrete type.
*/
class InferenceError : public std::runtime_error {
 public:
  InferenceError(ErrorKind kind, const std::string& detail);

  ErrorKind kind() const {
    return _kind;
  }
  const std::string& detail() const {
    return _detail;
  }
  const char* what() const noexcept override {
    return _message.c_str();
  }

  void set_context(uint iteration, InferenceMode mode);
  bool has_context() const {
    return _has_context;
  }
  uint iteration() const {
    return _iteration;
  }
  InferenceMode mode() const {
    return _mode;
  }

 private:
  ErrorKind _kind;
  std::string _detail;
  std::string _message;
  bool _has_context = false;
  uint _iteration = 0;
  InferenceMode _mode = InferenceMode::LOCAL;
};

// A site was looked up that is not registered for the active subgraph.
class UnknownSiteError : public InferenceError {
 public:
  explicit UnknownSiteError(const std::string& site);
  const std::string site;
};

// Local parameters were requested while no batch is allocated.
class NoActiveBatchError : public InferenceError {
 public:
  explicit NoActiveBatchError(const std::string& detail);
};

// The batch size disagrees between observations and local parameters.
class DimensionMismatchError : public InferenceError {
 public:
  explicit DimensionMismatchError(const std::string& detail);
};

// A parameter or gradient does not have the shape the subgraph declares.
class ShapeError : public InferenceError {
 public:
  explicit ShapeError(const std::string& detail);
};

// The loss, a gradient, or an updated parameter is NaN or infinite.
class OptimizationDivergedError : public InferenceError {
 public:
  explicit OptimizationDivergedError(const std::string& detail);
};

} // namespace mbvi
