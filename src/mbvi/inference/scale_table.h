/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "mbvi/model/model.h"

namespace mbvi {
namespace inference {

/*
Per-site multiplier applied to the log-probability contribution of the
site when only a minibatch of its plate is observed. For a plate of N data
points subsampled M at a time the factor is N / M, which makes the scaled
batch sum an unbiased estimate of the full-data sum; sites that are not
subsampled keep a factor of 1.
*/
class ScaleTable {
 public:
  ScaleTable() {}

  // The table for a model whose plate of size dataset_size is observed
  // batch_size points at a time.
  static ScaleTable
  for_subsample(const model::Model& model, uint dataset_size, uint batch_size);

  // throws std::invalid_argument unless factor is finite and positive
  void set(const std::string& site, double factor);
  // throws UnknownSiteError
  double get(const std::string& site) const;
  bool contains(const std::string& site) const;
  uint size() const {
    return static_cast<uint>(_factors.size());
  }
  std::vector<std::string> sites() const;
  std::string to_string() const;

 private:
  std::map<std::string, double> _factors;
};

} // namespace inference
} // namespace mbvi
