/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <sys/types.h>
#include <string>

namespace mbvi {

// Where a site lives relative to the data plate.
enum class SiteKind {
  UNKNOWN = 0,
  // one instance shared by the whole data set
  GLOBAL,
  // one latent instance per data index
  LOCAL,
  // one observed instance per data index
  OBSERVED,
};

// The variational family used to approximate a latent site.
enum class VariationalFamily {
  UNKNOWN = 0,
  // no variational factor (observed sites)
  NONE,
  // mean-field Normal(loc, softplus(scale_raw))
  NORMAL,
  // Categorical(softmax(logits))
  CATEGORICAL,
  // a point value tracked by a sampler; see distribution::Empirical
  EMPIRICAL,
};

// Which block of parameters an inference step updates.
enum class InferenceMode { LOCAL, GLOBAL };

enum class InitType { RANDOM, ZERO, PRIOR, DATA };

enum class SamplingScheme {
  // independent uniform draws, with replacement across and within batches
  WITH_REPLACEMENT,
  // every index once per epoch, in shuffled order
  SHUFFLED_EPOCHS,
};

enum class OptimizerType { SGD, ADAM };

// How local parameters are stored between batches.
enum class LocalBacking {
  // fresh parameters for every batch, O(M) memory
  EPHEMERAL,
  // a dense table over all N data indices; batches read and write rows
  PERSISTENT,
};

std::string to_string(SiteKind kind);
std::string to_string(VariationalFamily family);
std::string to_string(InferenceMode mode);

} // namespace mbvi
