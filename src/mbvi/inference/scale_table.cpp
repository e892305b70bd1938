/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

#include "mbvi/errors.h"
#include "mbvi/inference/scale_table.h"

namespace mbvi {
namespace inference {

ScaleTable ScaleTable::for_subsample(
    const model::Model& model,
    uint dataset_size,
    uint batch_size) {
  if (batch_size == 0 or batch_size > dataset_size) {
    throw std::invalid_argument(fmt::format(
        "batch size {} must be between 1 and the data set size {}",
        batch_size,
        dataset_size));
  }
  double factor =
      static_cast<double>(dataset_size) / static_cast<double>(batch_size);
  ScaleTable table;
  for (const model::Site& site : model.sites()) {
    table.set(site.name, site.is_subsampled() ? factor : 1.0);
  }
  return table;
}

void ScaleTable::set(const std::string& site, double factor) {
  if (not std::isfinite(factor) or factor <= 0) {
    throw std::invalid_argument(fmt::format(
        "scale factor for site '{}' must be positive and finite, got {}",
        site,
        factor));
  }
  _factors[site] = factor;
}

double ScaleTable::get(const std::string& site) const {
  auto it = _factors.find(site);
  if (it == _factors.end()) {
    throw UnknownSiteError(site);
  }
  return it->second;
}

bool ScaleTable::contains(const std::string& site) const {
  return _factors.find(site) != _factors.end();
}

std::vector<std::string> ScaleTable::sites() const {
  std::vector<std::string> result;
  result.reserve(_factors.size());
  for (const auto& entry : _factors) {
    result.push_back(entry.first);
  }
  return result;
}

std::string ScaleTable::to_string() const {
  std::string result;
  for (const auto& entry : _factors) {
    result += fmt::format("{}: {}\n", entry.first, entry.second);
  }
  return result;
}

} // namespace inference
} // namespace mbvi
