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

#include "mbvi/data/batch.h"
#include "mbvi/inference/parameter_set.h"
#include "mbvi/model/model.h"
#include "mbvi/types.h"

namespace mbvi {
namespace inference {

struct TensorShape {
  uint rows;
  uint cols;
};

/*
The global tensors of a model: "<site>.loc" and "<site>.scale_raw" for
NORMAL global sites, "<site>.value" for EMPIRICAL global sites. Each has
the shape of its site.
*/
std::map<std::string, TensorShape> global_layout(const model::Model& model);

// A site of the subgraph. Global sites have one instance, sites on the
// data plate have one instance per batch element.
struct BoundSite {
  const model::Site* site;
  uint instances;
  // names of the variational tensors bound to the site (empty for the
  // observed sites of the p-joint)
  std::vector<std::string> tensors;
  // first column of the site's observations within Batch::values
  uint column = 0;
};

/*
A model restricted to one minibatch: the global sites, and the local and
observed sites at the batch indices, together with the parameters they
are bound to. The p-joint holds every site of the restriction with the
observed sites bound to the batch rows; the q-joint holds the latent
sites bound to their variational tensors.

A Subgraph does not own anything. The model, the batch and both parameter
sets must outlive it.
*/
class Subgraph {
 public:
  const model::Model& model() const {
    return *_model;
  }
  const data::Batch& batch() const {
    return *_batch;
  }
  uint batch_size() const {
    return _batch->size();
  }

  const std::vector<BoundSite>& p_joint() const {
    return _p_joint;
  }
  const std::vector<BoundSite>& q_joint() const {
    return _q_joint;
  }

  ParameterSet& params(InferenceMode mode) const {
    return mode == InferenceMode::GLOBAL ? *_global : *_local;
  }
  ParameterSet& global_params() const {
    return *_global;
  }
  ParameterSet& local_params() const {
    return *_local;
  }

  /*
  The observations of an observed site: batch_size() rows of the site's
  per-instance size.
  :param site: name of an observed site
  :returns: the rows of Batch::values belonging to the site
  */
  Eigen::MatrixXd observations(const std::string& site) const;
  // throws UnknownSiteError if the site is not part of the subgraph
  const BoundSite& bound_site(const std::string& site) const;

  // the declared shape of every tensor of the given block
  const std::map<std::string, TensorShape>& shapes(InferenceMode mode) const {
    return mode == InferenceMode::GLOBAL ? _global_shapes : _local_shapes;
  }
  /*
  Check that `params` has exactly the tensors and shapes declared for the
  given block. Used for both parameters and gradients.
  :param what: how the tensors are referred to in the error message
  :throws ShapeError:
  */
  void check_shapes(
      InferenceMode mode,
      const ParameterSet& params,
      const std::string& what) const;
  // number of parameter values of the given block
  uint num_parameters(InferenceMode mode) const;

 private:
  friend class SubgraphBinder;
  Subgraph() {}

  const model::Model* _model = nullptr;
  const data::Batch* _batch = nullptr;
  ParameterSet* _global = nullptr;
  ParameterSet* _local = nullptr;
  std::vector<BoundSite> _p_joint;
  std::vector<BoundSite> _q_joint;
  std::map<std::string, TensorShape> _global_shapes;
  std::map<std::string, TensorShape> _local_shapes;
};

/*
Builds the Subgraph of a model for one batch. Binding is pure: nothing is
retained between calls.
*/
class SubgraphBinder {
 public:
  /*
  :param model: the full model
  :param batch: the active batch
  :param global: the global variational parameters
  :param local: the local variational parameters of the batch
  :throws DimensionMismatchError: if the number of batch indices, the
  number of observation rows and the number of rows of the local tensors
  disagree, or if the observation width does not match the observed sites
  */
  Subgraph bind(
      const model::Model& model,
      const data::Batch& batch,
      ParameterSet& global,
      ParameterSet& local) const;
};

} // namespace inference
} // namespace mbvi
