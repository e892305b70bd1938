/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <numeric>
#include <stdexcept>

#include <fmt/format.h>

#include "mbvi/data/data_source.h"

namespace mbvi {
namespace data {

IndexSampler::IndexSampler(uint n, SamplingScheme scheme, uint seed)
    : _n(n), _scheme(scheme), _gen(seed) {
  if (n == 0) {
    throw std::invalid_argument("cannot sample from an empty data set");
  }
}

void IndexSampler::reshuffle() {
  if (_permutation.size() != _n) {
    _permutation.resize(_n);
    std::iota(_permutation.begin(), _permutation.end(), 0u);
  }
  std::shuffle(_permutation.begin(), _permutation.end(), _gen);
  _cursor = 0;
  _epoch++;
}

std::vector<uint> IndexSampler::next(uint batch_size) {
  if (batch_size == 0 or batch_size > _n) {
    throw std::invalid_argument(fmt::format(
        "batch size {} must be between 1 and the data set size {}",
        batch_size,
        _n));
  }
  std::vector<uint> indices;
  indices.reserve(batch_size);
  if (_scheme == SamplingScheme::WITH_REPLACEMENT) {
    std::uniform_int_distribution<uint> uniform(0, _n - 1);
    for (uint m = 0; m < batch_size; m++) {
      indices.push_back(uniform(_gen));
    }
    return indices;
  }
  if (_permutation.empty() or _cursor + batch_size > _n) {
    reshuffle();
  }
  indices.insert(
      indices.end(),
      _permutation.begin() + _cursor,
      _permutation.begin() + _cursor + batch_size);
  _cursor += batch_size;
  return indices;
}

} // namespace data
} // namespace mbvi
