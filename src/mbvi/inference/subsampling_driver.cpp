/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <boost/iostreams/device/null.hpp>
#include <boost/iostreams/stream.hpp>
#include <boost/progress.hpp>
#include <algorithm>
#include <iostream>
#include <stdexcept>

#include <fmt/format.h>

#include "mbvi/errors.h"
#include "mbvi/inference/subsampling_driver.h"

namespace mbvi {
namespace inference {

SubsamplingDriver::SubsamplingDriver(
    const model::Model& model,
    const GradientBackend& backend,
    data::DataSource& data_source,
    GlobalParamsCell& cell,
    const DriverConfig& config)
    : model(model),
      backend(backend),
      data_source(data_source),
      cell(cell),
      _config(config),
      owned_step(std::make_unique<KLqpStep>(
          backend,
          config.global_optimizer,
          config.local_optimizer,
          config.seed + 1)),
      step(owned_step.get()),
      store(make_local_factor_store(
          config.local_backing,
          model,
          data_source.size())),
      gen(config.seed) {
  if (config.num_threads == 0) {
    throw std::invalid_argument("num_threads must be positive");
  }
  if (config.num_samples == 0) {
    throw std::invalid_argument("num_samples must be positive");
  }
}

SubsamplingDriver::SubsamplingDriver(
    const model::Model& model,
    const GradientBackend& backend,
    data::DataSource& data_source,
    GlobalParamsCell& cell,
    InferenceStep& step,
    const DriverConfig& config)
    : model(model),
      backend(backend),
      data_source(data_source),
      cell(cell),
      _config(config),
      step(&step),
      store(make_local_factor_store(
          config.local_backing,
          model,
          data_source.size())),
      gen(config.seed) {
  if (config.num_threads == 0) {
    throw std::invalid_argument("num_threads must be positive");
  }
  if (config.num_samples == 0) {
    throw std::invalid_argument("num_samples must be positive");
  }
}

uint SubsamplingDriver::dataset_size() const {
  return _config.dataset_size > 0 ? _config.dataset_size : data_source.size();
}

void SubsamplingDriver::pd_begin(ProfilerEvent kind) {
  if (_config.collect_performance_data) {
    profiler_data.begin(kind);
  }
}

void SubsamplingDriver::pd_finish(ProfilerEvent kind) {
  if (_config.collect_performance_data) {
    profiler_data.finish(kind);
  }
}

void SubsamplingDriver::initialize() {
  initialize(_config.init_type);
}

ParameterSet SubsamplingDriver::initial_parameters(InitType init_type) {
  ParameterSet params;
  for (const auto& entry : global_layout(model)) {
    params.add(
        entry.first,
        Eigen::MatrixXd::Zero(entry.second.rows, entry.second.cols));
  }
  data::Batch batch;
  if (init_type == InitType::DATA) {
    batch = data_source.next_batch(
        std::min(_config.init_batch_size, data_source.size()));
  }
  backend.initialize_global(params, init_type, gen, batch);
  if (not params.all_finite()) {
    throw OptimizationDivergedError(
        "initialization produced non-finite global parameters");
  }
  return params;
}

void SubsamplingDriver::initialize(InitType init_type) {
  pd_begin(ProfilerEvent::INITIALIZE);
  ParameterSet params = initial_parameters(init_type);
  {
    std::lock_guard<std::mutex> lock(cell.mutex);
    cell.params = std::move(params);
  }
  pd_finish(ProfilerEvent::INITIALIZE);
}

bool SubsamplingDriver::initialize_if_empty() {
  {
    std::lock_guard<std::mutex> lock(cell.mutex);
    if (not cell.params.empty()) {
      return false;
    }
  }
  pd_begin(ProfilerEvent::INITIALIZE);
  ParameterSet params = initial_parameters(_config.init_type);
  bool installed = false;
  {
    // another driver sharing the cell may have initialized it meanwhile
    std::lock_guard<std::mutex> lock(cell.mutex);
    if (cell.params.empty()) {
      cell.params = std::move(params);
      installed = true;
    }
  }
  pd_finish(ProfilerEvent::INITIALIZE);
  return installed;
}

StepResult SubsamplingDriver::run_iteration(
    uint local_iters_per_outer,
    uint batch_size,
    const ScaleTable& scales,
    const StepOptions& options,
    InferenceMode& mode) {
  mode = InferenceMode::LOCAL;
  pd_begin(ProfilerEvent::NEXT_BATCH);
  const data::Batch batch = data_source.next_batch(batch_size);
  pd_finish(ProfilerEvent::NEXT_BATCH);

  StepResult result;
  {
    pd_begin(ProfilerEvent::ALLOCATE_LOCALS);
    LocalScope scope(*store, batch.indices);
    step->begin_batch();
    // the global parameters are read-only during the local steps
    ParameterSet global_snapshot = cell.snapshot();
    pd_finish(ProfilerEvent::ALLOCATE_LOCALS);

    for (uint k = 0; k < local_iters_per_outer; k++) {
      pd_begin(ProfilerEvent::BIND_SUBGRAPH);
      Subgraph subgraph =
          binder.bind(model, batch, global_snapshot, scope.params());
      pd_finish(ProfilerEvent::BIND_SUBGRAPH);
      pd_begin(ProfilerEvent::LOCAL_STEP);
      step->update(InferenceMode::LOCAL, subgraph, scales, options);
      pd_finish(ProfilerEvent::LOCAL_STEP);
    }

    mode = InferenceMode::GLOBAL;
    pd_begin(ProfilerEvent::GLOBAL_STEP);
    {
      std::lock_guard<std::mutex> lock(cell.mutex);
      Subgraph subgraph =
          binder.bind(model, batch, cell.params, scope.params());
      result = step->update(InferenceMode::GLOBAL, subgraph, scales, options);
    }
    pd_finish(ProfilerEvent::GLOBAL_STEP);
    pd_begin(ProfilerEvent::RESET_LOCALS);
  }
  pd_finish(ProfilerEvent::RESET_LOCALS);
  return result;
}

RunResult SubsamplingDriver::run(
    uint num_outer_iters,
    uint local_iters_per_outer,
    uint batch_size) {
  const ScaleTable scales =
      ScaleTable::for_subsample(model, dataset_size(), batch_size);
  if (batch_size > data_source.size()) {
    throw std::invalid_argument(fmt::format(
        "batch size {} exceeds the {} observations of the data source",
        batch_size,
        data_source.size()));
  }
  if (_config.collect_performance_data) {
    profiler_data.clear();
  }
  pd_begin(ProfilerEvent::RUN);
  RunResult result;
  {
    // however run() is left, the stop request is used up and the RUN
    // event is closed
    RunCleanup cleanup(*this);
    initialize_if_empty();

    boost::iostreams::stream<boost::iostreams::null_sink> nullOstream(
        (boost::iostreams::null_sink()));
    boost::progress_display show_progress(
        num_outer_iters, _config.verbose ? std::cout : nullOstream);
    const StepOptions options(_config.num_threads, _config.num_samples);
    result.losses.reserve(num_outer_iters);

    // outer iterations are numbered from 1 in errors and progress output
    for (uint t = 1; t <= num_outer_iters; t++) {
      if (stop_requested) {
        result.stopped_early = true;
        break;
      }
      pd_begin(ProfilerEvent::OUTER_ITERATION);
      InferenceMode mode = InferenceMode::LOCAL;
      StepResult step_result;
      try {
        step_result = run_iteration(
            local_iters_per_outer, batch_size, scales, options, mode);
      } catch (InferenceError& e) {
        e.set_context(t, mode);
        throw;
      }
      pd_finish(ProfilerEvent::OUTER_ITERATION);
      result.losses.push_back(step_result.loss);
      result.iterations_completed++;
      if (_config.print_progress) {
        std::cout << fmt::format(
            "iteration: {} loss: {} grad_norm: {}\n",
            t,
            step_result.loss,
            step_result.grad_norm);
      }
      ++show_progress;
    }
  }
  produce_performance_report(
      num_outer_iters, local_iters_per_outer, batch_size, result);
  return result;
}

SubsamplingDriver::RunCleanup::~RunCleanup() {
  driver.stop_requested = false;
  driver.pd_finish(ProfilerEvent::RUN);
}

} // namespace inference
} // namespace mbvi
