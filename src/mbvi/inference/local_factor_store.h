/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "mbvi/inference/parameter_set.h"
#include "mbvi/model/model.h"
#include "mbvi/types.h"

namespace mbvi {
namespace inference {

// One local tensor: `cols` values per batch element, initialized to
// `default_value`.
struct LocalTensorSpec {
  std::string name;
  uint cols;
  double default_value;
};

/*
The local tensors of a model: "<site>.logits" for CATEGORICAL local sites,
"<site>.loc" and "<site>.scale_raw" for NORMAL local sites. All default
to zero, i.e. uniform categoricals and Normal(0, softplus(0)).
*/
std::vector<LocalTensorSpec> local_layout(const model::Model& model);

/*
Owns the variational parameters of the local sites restricted to the
active batch. Row m of every local tensor belongs to batch element m.
*/
class LocalFactorStore {
 public:
  explicit LocalFactorStore(std::vector<LocalTensorSpec> layout);
  virtual ~LocalFactorStore() {}

  /*
  Make the parameters for the given batch the active ones, resetting any
  batch that is still active.
  :returns: the live parameters, one row per batch index
  */
  virtual ParameterSet& allocate(const std::vector<uint>& batch_indices) = 0;
  // Release the active parameters. A no-op when nothing is active.
  virtual void reset() = 0;
  // Number of parameter values currently held by the store.
  virtual uint num_parameters() const = 0;
  virtual LocalBacking backing() const = 0;

  // throws NoActiveBatchError
  ParameterSet& current();
  const ParameterSet& current() const;
  // throws NoActiveBatchError
  const std::vector<uint>& batch_indices() const;
  bool active() const {
    return _active;
  }
  const std::vector<LocalTensorSpec>& layout() const {
    return _layout;
  }

 protected:
  ParameterSet default_parameters(uint rows) const;

  std::vector<LocalTensorSpec> _layout;
  ParameterSet _current;
  std::vector<uint> _indices;
  bool _active = false;
};

/*
Every allocate() produces freshly initialized parameters, whatever earlier
batches did, and reset() discards them. Memory is O(M) and does not depend
on the data set size.
*/
class EphemeralLocalFactorStore : public LocalFactorStore {
 public:
  explicit EphemeralLocalFactorStore(std::vector<LocalTensorSpec> layout);
  ParameterSet& allocate(const std::vector<uint>& batch_indices) override;
  void reset() override;
  uint num_parameters() const override;
  LocalBacking backing() const override {
    return LocalBacking::EPHEMERAL;
  }
};

/*
Keeps a dense table with one row per data index. allocate() gathers the
rows of the batch into the active parameters and reset() scatters them
back, so a data point's local parameters survive until it is sampled
again. When a batch contains an index more than once, the last occurrence
is the one written back.
*/
class PersistentLocalFactorStore : public LocalFactorStore {
 public:
  PersistentLocalFactorStore(
      std::vector<LocalTensorSpec> layout,
      uint dataset_size);
  ParameterSet& allocate(const std::vector<uint>& batch_indices) override;
  void reset() override;
  uint num_parameters() const override;
  LocalBacking backing() const override {
    return LocalBacking::PERSISTENT;
  }
  // the stored parameters of one data index
  Eigen::RowVectorXd row(const std::string& tensor, uint index) const;

 private:
  uint _dataset_size;
  ParameterSet _table;
};

std::unique_ptr<LocalFactorStore> make_local_factor_store(
    LocalBacking backing,
    const model::Model& model,
    uint dataset_size);

/*
Allocates local parameters for a batch on construction and resets the
store on destruction, so the local parameters of a batch never outlive it,
whichever way the scope is left.
*/
class LocalScope {
 public:
  LocalScope(LocalFactorStore& store, const std::vector<uint>& batch_indices)
      : store(store), _params(store.allocate(batch_indices)) {}
  ~LocalScope() {
    store.reset();
  }
  LocalScope(const LocalScope&) = delete;
  LocalScope& operator=(const LocalScope&) = delete;

  ParameterSet& params() {
    return _params;
  }

 private:
  LocalFactorStore& store;
  ParameterSet& _params;
};

} // namespace inference
} // namespace mbvi
