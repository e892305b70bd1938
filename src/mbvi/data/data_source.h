/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <random>
#include <vector>

#include "mbvi/data/batch.h"
#include "mbvi/types.h"

namespace mbvi {
namespace data {

// Where minibatches come from. The data set has size() observations of
// dim() values each.
class DataSource {
 public:
  virtual uint size() const = 0;
  virtual uint dim() const = 0;
  // Draw the next batch of batch_size indices according to the source's
  // sampling scheme, together with their observations.
  virtual Batch next_batch(uint batch_size) = 0;
  // Fetch the observations at the given indices.
  virtual Batch get(const std::vector<uint>& indices) const = 0;
  virtual ~DataSource() {}
};

/*
Draws batches of indices from [0, n).
WITH_REPLACEMENT: every index of every batch is an independent uniform
draw, so a batch may contain duplicates.
SHUFFLED_EPOCHS: indices are visited in a random permutation; a batch never
straddles two epochs, so the tail of a permutation shorter than the batch
size is dropped and a new permutation is drawn.
*/
class IndexSampler {
 public:
  IndexSampler(uint n, SamplingScheme scheme, uint seed);
  std::vector<uint> next(uint batch_size);
  uint epoch() const {
    return _epoch;
  }
  SamplingScheme scheme() const {
    return _scheme;
  }

 private:
  void reshuffle();

  uint _n;
  SamplingScheme _scheme;
  std::mt19937 _gen;
  std::vector<uint> _permutation;
  uint _cursor = 0;
  uint _epoch = 0;
};

} // namespace data
} // namespace mbvi
