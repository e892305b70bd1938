/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <atomic>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "mbvi/data/data_source.h"
#include "mbvi/inference/backend.h"
#include "mbvi/inference/inference_step.h"
#include "mbvi/inference/local_factor_store.h"
#include "mbvi/inference/optimizer.h"
#include "mbvi/inference/parameter_set.h"
#include "mbvi/inference/scale_table.h"
#include "mbvi/inference/subgraph.h"
#include "mbvi/model/model.h"
#include "mbvi/profiler.h"
#include "mbvi/types.h"

namespace mbvi {
namespace inference {

struct DriverConfig {
  // N used for the N/M scale factors; 0 means the size of the data source
  uint dataset_size;
  uint seed;
  uint num_threads;
  // Monte Carlo samples of the global latent values per global step
  uint num_samples;
  InitType init_type;
  // number of observations drawn for data-dependent initialization
  uint init_batch_size;
  LocalBacking local_backing;
  // show a progress bar over the outer iterations on std::cout
  bool verbose;
  // print the loss of every global step on std::cout
  bool print_progress;
  bool collect_performance_data;
  OptimizerConfig global_optimizer;
  OptimizerConfig local_optimizer;

  DriverConfig(
      uint dataset_size = 0,
      uint seed = 5123401,
      uint num_threads = 1,
      uint num_samples = 1,
      InitType init_type = InitType::RANDOM,
      uint init_batch_size = 1024,
      LocalBacking local_backing = LocalBacking::EPHEMERAL,
      bool verbose = false,
      bool print_progress = false,
      bool collect_performance_data = false,
      OptimizerConfig global_optimizer =
          OptimizerConfig(OptimizerType::ADAM, 0.1, 0.9, 100),
      OptimizerConfig local_optimizer =
          OptimizerConfig(OptimizerType::ADAM, 1.0))
      : dataset_size(dataset_size),
        seed(seed),
        num_threads(num_threads),
        num_samples(num_samples),
        init_type(init_type),
        init_batch_size(init_batch_size),
        local_backing(local_backing),
        verbose(verbose),
        print_progress(print_progress),
        collect_performance_data(collect_performance_data),
        global_optimizer(global_optimizer),
        local_optimizer(local_optimizer) {}
};

struct RunResult {
  uint iterations_completed = 0;
  // true if request_stop() ended the run before all iterations were done
  bool stopped_early = false;
  // the loss of every global step, in order
  std::vector<double> losses;
};

/*
Stochastic variational inference over minibatches. Every outer iteration
draws a batch of M data points, allocates local factors for it, refines
them with K local steps while the global parameters are held fixed, makes
exactly one global step while the local factors are held fixed, and then
releases the local factors. The log-probability terms of the subsampled
sites are scaled by N/M.

The global parameters live in a GlobalParamsCell owned by the caller.
Several drivers may share one cell from different threads: each global
step holds the cell's mutex, and the local steps work on a snapshot.
*/
class SubsamplingDriver {
 public:
  // A driver that runs KLqp steps configured by config.
  SubsamplingDriver(
      const model::Model& model,
      const GradientBackend& backend,
      data::DataSource& data_source,
      GlobalParamsCell& cell,
      const DriverConfig& config = DriverConfig());
  // A driver that runs the given inference step, which must outlive it.
  SubsamplingDriver(
      const model::Model& model,
      const GradientBackend& backend,
      data::DataSource& data_source,
      GlobalParamsCell& cell,
      InferenceStep& step,
      const DriverConfig& config = DriverConfig());

  /*
  (Re)initialize the global parameters in the cell, replacing whatever it
  holds.
  :param init_type: how the backend chooses the starting values
  */
  void initialize(InitType init_type);
  void initialize();
  /*
  Initialize the global parameters with config.init_type unless the cell
  already holds some. The check and the write happen under the cell's
  mutex, so of several drivers sharing an empty cell exactly one installs
  its parameters.
  :returns: true if this driver initialized the cell
  */
  bool initialize_if_empty();

  /*
  Run the outer loop. The global parameters are initialized with
  config.init_type first if the cell is still empty (see
  initialize_if_empty).
  :param num_outer_iters: number of batches T
  :param local_iters_per_outer: number of local steps K per batch
  :param batch_size: batch size M, 1 <= M <= N
  :returns: what was done; see RunResult
  :throws InferenceError: the first error of any step, annotated with the
  outer iteration (counting from 1) and the mode it happened in
  */
  RunResult
  run(uint num_outer_iters, uint local_iters_per_outer, uint batch_size);

  // Ask a running run() to return after the current outer iteration. A
  // request made while no run is in progress stops the next run before its
  // first iteration.
  void request_stop() {
    stop_requested = true;
  }

  uint dataset_size() const;
  const DriverConfig& config() const {
    return _config;
  }
  LocalFactorStore& local_store() {
    return *store;
  }
  InferenceStep& inference_step() {
    return *step;
  }
  std::string performance_report() const {
    return _performance_report;
  }

 private:
  // Closes a run, normally or by an exception.
  struct RunCleanup {
    explicit RunCleanup(SubsamplingDriver& driver) : driver(driver) {}
    ~RunCleanup();
    SubsamplingDriver& driver;
  };

  ParameterSet initial_parameters(InitType init_type);
  StepResult run_iteration(
      uint local_iters_per_outer,
      uint batch_size,
      const ScaleTable& scales,
      const StepOptions& options,
      InferenceMode& mode);
  void pd_begin(ProfilerEvent kind);
  void pd_finish(ProfilerEvent kind);
  void produce_performance_report(
      uint num_outer_iters,
      uint local_iters_per_outer,
      uint batch_size,
      const RunResult& result);

  const model::Model& model;
  const GradientBackend& backend;
  data::DataSource& data_source;
  GlobalParamsCell& cell;
  DriverConfig _config;
  std::unique_ptr<InferenceStep> owned_step;
  InferenceStep* step;
  std::unique_ptr<LocalFactorStore> store;
  SubgraphBinder binder;
  std::mt19937 gen;
  std::atomic<bool> stop_requested{false};
  ProfilerData profiler_data;
  std::string _performance_report;
};

} // namespace inference
} // namespace mbvi
