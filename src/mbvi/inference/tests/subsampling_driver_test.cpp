/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <chrono>
#include <cmath>
#include <exception>
#include <functional>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "mbvi/backend/gaussian_mixture.h"
#include "mbvi/data/in_memory_source.h"
#include "mbvi/data/synthetic_mixture_source.h"
#include "mbvi/errors.h"
#include "mbvi/inference/subsampling_driver.h"
#include "mbvi/inference/tests/mixture_util_test.h"
#include "mbvi/util.h"

using namespace mbvi;
using namespace inference;

namespace {

DriverConfig data_init_config(uint num_threads = 1) {
  DriverConfig config;
  config.init_type = InitType::DATA;
  config.num_threads = num_threads;
  return config;
}

data::SyntheticMixtureConfig three_clusters(uint size, uint seed = 11) {
  return data::SyntheticMixtureConfig(
      size, three_cluster_means(), 1.0, {}, seed);
}

// Forwards to another source. The first next_batch blocks until released.
class GatedDataSource : public data::DataSource {
 public:
  explicit GatedDataSource(data::DataSource& inner) : inner(inner) {}
  uint size() const override {
    return inner.size();
  }
  uint dim() const override {
    return inner.dim();
  }
  data::Batch next_batch(uint batch_size) override {
    if (calls++ == 0) {
      entered.set_value();
      release.get_future().wait();
    }
    return inner.next_batch(batch_size);
  }
  data::Batch get(const std::vector<uint>& indices) const override {
    return inner.get(indices);
  }

  std::promise<void> entered;
  std::promise<void> release;

 private:
  data::DataSource& inner;
  uint calls = 0;
};

// Forwards to another source and throws std::out_of_range on the
// fail_on_call-th next_batch after the counter was last reset.
class FailingDataSource : public data::DataSource {
 public:
  explicit FailingDataSource(data::DataSource& inner) : inner(inner) {}
  uint size() const override {
    return inner.size();
  }
  uint dim() const override {
    return inner.dim();
  }
  data::Batch next_batch(uint batch_size) override {
    if (fail_on_call > 0 and ++calls == fail_on_call) {
      if (before_failure) {
        before_failure();
      }
      throw std::out_of_range("data source exhausted");
    }
    return inner.next_batch(batch_size);
  }
  data::Batch get(const std::vector<uint>& indices) const override {
    return inner.get(indices);
  }

  uint fail_on_call = 0;
  uint calls = 0;
  std::function<void()> before_failure;

 private:
  data::DataSource& inner;
};

} // namespace

TEST(testdriver, recovers_cluster_means) {
  const Eigen::MatrixXd means = five_cluster_means();
  backend::GaussianMixtureConfig mixture(5, 2, 10.0, 1.0);
  model::Model model = backend::build_gaussian_mixture_model(mixture);
  backend::GaussianMixtureBackend backend(mixture);
  data::SyntheticMixtureSource source(
      data::SyntheticMixtureConfig(10000000, means, 1.0));
  GlobalParamsCell cell;
  SubsamplingDriver driver(model, backend, source, cell, data_init_config());

  driver.initialize();
  const double initial =
      max_nearest_distance(means, cell.snapshot().at("beta.loc"));
  RunResult result = driver.run(1000, 10, 128);
  EXPECT_EQ(result.iterations_completed, 1000u);
  EXPECT_FALSE(result.stopped_early);
  EXPECT_EQ(result.losses.size(), 1000u);

  const Eigen::MatrixXd loc = cell.snapshot().at("beta.loc");
  ASSERT_TRUE(loc.allFinite());
  EXPECT_LT(max_nearest_distance(means, loc), 0.5);
  EXPECT_LT(max_nearest_distance(loc, means), 0.5);
  EXPECT_LT(max_nearest_distance(means, loc), initial);
  // the posterior of the means is sharp with ten million observations
  EXPECT_LT(
      util::log1pexp(cell.snapshot().at("beta.scale_raw")).maxCoeff(), 0.1);
}

TEST(testdriver, failure_leaves_globals_untouched) {
  backend::GaussianMixtureConfig mixture(3, 2);
  model::Model model = backend::build_gaussian_mixture_model(mixture);
  backend::GaussianMixtureBackend backend(mixture);
  FaultyBackend faulty(backend, InferenceMode::GLOBAL, 5);
  data::SyntheticMixtureSource source(three_clusters(1000));
  GlobalParamsCell cell;
  SubsamplingDriver driver(model, faulty, source, cell, data_init_config());

  RunResult first = driver.run(4, 2, 16);
  EXPECT_EQ(first.iterations_completed, 4u);
  const ParameterSet before = cell.snapshot();

  try {
    driver.run(3, 2, 16);
    FAIL() << "the fifth global step should have diverged";
  } catch (const OptimizationDivergedError& e) {
    EXPECT_TRUE(e.has_context());
    EXPECT_EQ(e.iteration(), 1u);
    EXPECT_EQ(e.mode(), InferenceMode::GLOBAL);
    std::string message = e.what();
    EXPECT_NE(message.find("outer iteration 1 "), std::string::npos);
    EXPECT_NE(message.find("GLOBAL"), std::string::npos);
  }
  const ParameterSet after = cell.snapshot();
  for (const auto& name : before.names()) {
    EXPECT_TRUE((before.at(name).array() == after.at(name).array()).all())
        << name;
  }
  EXPECT_FALSE(driver.local_store().active());
}

TEST(testdriver, local_failure_is_annotated) {
  backend::GaussianMixtureConfig mixture(3, 2);
  model::Model model = backend::build_gaussian_mixture_model(mixture);
  backend::GaussianMixtureBackend backend(mixture);
  // the seventh local step is the first of the fourth iteration
  FaultyBackend faulty(backend, InferenceMode::LOCAL, 7);
  data::SyntheticMixtureSource source(three_clusters(1000));
  GlobalParamsCell cell;
  SubsamplingDriver driver(model, faulty, source, cell, data_init_config());
  driver.initialize();

  try {
    driver.run(5, 2, 16);
    FAIL() << "the seventh local step should have diverged";
  } catch (const InferenceError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::OPTIMIZATION_DIVERGED);
    EXPECT_EQ(e.iteration(), 4u);
    EXPECT_EQ(e.mode(), InferenceMode::LOCAL);
  }
  EXPECT_FALSE(driver.local_store().active());
  EXPECT_TRUE(cell.snapshot().all_finite());
}

TEST(testdriver, stop_before_run) {
  backend::GaussianMixtureConfig mixture(3, 2);
  model::Model model = backend::build_gaussian_mixture_model(mixture);
  backend::GaussianMixtureBackend backend(mixture);
  data::SyntheticMixtureSource source(three_clusters(1000));
  GlobalParamsCell cell;
  SubsamplingDriver driver(model, backend, source, cell, data_init_config());

  driver.request_stop();
  RunResult stopped = driver.run(10, 2, 16);
  EXPECT_EQ(stopped.iterations_completed, 0u);
  EXPECT_TRUE(stopped.stopped_early);
  EXPECT_TRUE(stopped.losses.empty());

  // the request is used up
  RunResult next = driver.run(3, 2, 16);
  EXPECT_EQ(next.iterations_completed, 3u);
  EXPECT_FALSE(next.stopped_early);
}

TEST(testdriver, stop_from_another_thread) {
  backend::GaussianMixtureConfig mixture(3, 2);
  model::Model model = backend::build_gaussian_mixture_model(mixture);
  backend::GaussianMixtureBackend backend(mixture);
  data::SyntheticMixtureSource source(three_clusters(1000));
  GlobalParamsCell cell;
  SubsamplingDriver driver(model, backend, source, cell, data_init_config());
  driver.initialize();

  std::thread stopper([&driver]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    driver.request_stop();
  });
  RunResult result = driver.run(10000000, 1, 8);
  stopper.join();
  EXPECT_TRUE(result.stopped_early);
  EXPECT_LT(result.iterations_completed, 10000000u);
  EXPECT_EQ(result.losses.size(), result.iterations_completed);
  EXPECT_FALSE(driver.local_store().active());
}

TEST(testdriver, invalid_arguments) {
  backend::GaussianMixtureConfig mixture(3, 2);
  model::Model model = backend::build_gaussian_mixture_model(mixture);
  backend::GaussianMixtureBackend backend(mixture);
  data::SyntheticMixtureSource source(three_clusters(100));
  GlobalParamsCell cell;
  SubsamplingDriver driver(model, backend, source, cell, data_init_config());
  EXPECT_THROW(driver.run(1, 1, 101), std::invalid_argument);
  EXPECT_THROW(driver.run(1, 1, 0), std::invalid_argument);
  EXPECT_TRUE(cell.snapshot().empty());

  DriverConfig no_threads = data_init_config(0);
  EXPECT_THROW(
      (SubsamplingDriver(model, backend, source, cell, no_threads)),
      std::invalid_argument);
}

TEST(testdriver, drivers_share_globals) {
  backend::GaussianMixtureConfig mixture(3, 2);
  model::Model model = backend::build_gaussian_mixture_model(mixture);
  backend::GaussianMixtureBackend backend(mixture);
  GlobalParamsCell cell;
  {
    data::SyntheticMixtureSource source(three_clusters(100000));
    SubsamplingDriver(model, backend, source, cell, data_init_config())
        .initialize();
  }

  const uint num_drivers = 3;
  std::vector<std::exception_ptr> errors(num_drivers);
  std::vector<RunResult> results(num_drivers);
  std::vector<std::thread> threads;
  for (uint i = 0; i < num_drivers; i++) {
    threads.push_back(std::thread([&, i]() {
      try {
        data::SyntheticMixtureSource source(three_clusters(100000));
        DriverConfig config = data_init_config();
        config.seed = 100 + i;
        SubsamplingDriver driver(model, backend, source, cell, config);
        results[i] = driver.run(50, 3, 32);
      } catch (...) {
        errors[i] = std::current_exception();
      }
    }));
  }
  for (auto& thread : threads) {
    thread.join();
  }
  for (uint i = 0; i < num_drivers; i++) {
    EXPECT_FALSE(errors[i]) << "driver " << i << " failed";
    EXPECT_EQ(results[i].iterations_completed, 50u);
  }
  const ParameterSet params = cell.snapshot();
  EXPECT_TRUE(params.all_finite());
  EXPECT_EQ(params.num_tensors(), 2u);
  EXPECT_EQ(params.at("beta.loc").rows(), 3);
  EXPECT_EQ(params.at("beta.loc").cols(), 2);
}

TEST(testdriver, late_initialization_keeps_trained_globals) {
  backend::GaussianMixtureConfig mixture(3, 2);
  model::Model model = backend::build_gaussian_mixture_model(mixture);
  backend::GaussianMixtureBackend backend(mixture);
  GlobalParamsCell cell;

  // driver b finds the cell empty and stalls while drawing its
  // initialization batch
  data::SyntheticMixtureSource slow_inner(three_clusters(100000, 5));
  GatedDataSource slow(slow_inner);
  std::future<void> entered = slow.entered.get_future();
  DriverConfig config_b = data_init_config();
  config_b.seed = 7;
  SubsamplingDriver driver_b(model, backend, slow, cell, config_b);
  std::exception_ptr error_b;
  RunResult result_b;
  std::thread thread_b([&]() {
    try {
      result_b = driver_b.run(0, 1, 16);
    } catch (...) {
      error_b = std::current_exception();
    }
  });
  entered.wait();

  data::SyntheticMixtureSource source_a(three_clusters(100000));
  SubsamplingDriver driver_a(
      model, backend, source_a, cell, data_init_config());
  RunResult result_a = driver_a.run(200, 2, 32);
  EXPECT_EQ(result_a.iterations_completed, 200u);
  const ParameterSet trained = cell.snapshot();

  slow.release.set_value();
  thread_b.join();
  EXPECT_FALSE(error_b);
  EXPECT_EQ(result_b.iterations_completed, 0u);

  const ParameterSet after = cell.snapshot();
  ASSERT_EQ(after.num_tensors(), trained.num_tensors());
  for (const auto& name : trained.names()) {
    EXPECT_TRUE((trained.at(name).array() == after.at(name).array()).all())
        << name;
  }
  // an occupied cell is left alone
  EXPECT_FALSE(driver_b.initialize_if_empty());
}

TEST(testdriver, other_exceptions_end_the_run) {
  backend::GaussianMixtureConfig mixture(3, 2);
  model::Model model = backend::build_gaussian_mixture_model(mixture);
  backend::GaussianMixtureBackend backend(mixture);
  data::SyntheticMixtureSource inner(three_clusters(1000));
  FailingDataSource source(inner);
  GlobalParamsCell cell;
  DriverConfig config = data_init_config();
  config.collect_performance_data = true;
  SubsamplingDriver driver(model, backend, source, cell, config);
  driver.initialize();

  source.fail_on_call = 2;
  source.before_failure = [&driver]() { driver.request_stop(); };
  EXPECT_THROW(driver.run(5, 1, 16), std::out_of_range);
  EXPECT_FALSE(driver.local_store().active());

  // the stop request made during the failed run does not carry over
  source.fail_on_call = 0;
  RunResult result = driver.run(2, 1, 16);
  EXPECT_EQ(result.iterations_completed, 2u);
  EXPECT_FALSE(result.stopped_early);
  EXPECT_NE(
      driver.performance_report().find("\"iterations_completed\" : 2"),
      std::string::npos);
}

TEST(testdriver, threads_do_not_change_results) {
  backend::GaussianMixtureConfig mixture(3, 2);
  model::Model model = backend::build_gaussian_mixture_model(mixture);
  backend::GaussianMixtureBackend backend(mixture);
  std::vector<ParameterSet> finals;
  for (uint num_threads : {1u, 4u}) {
    data::SyntheticMixtureSource source(three_clusters(100000));
    GlobalParamsCell cell;
    SubsamplingDriver driver(
        model, backend, source, cell, data_init_config(num_threads));
    driver.run(10, 3, 64);
    finals.push_back(cell.snapshot());
  }
  for (const auto& name : finals[0].names()) {
    EXPECT_TRUE(finals[0].at(name).isApprox(finals[1].at(name), 1e-6))
        << name;
  }
}

TEST(testdriver, performance_report) {
  backend::GaussianMixtureConfig mixture(3, 2);
  model::Model model = backend::build_gaussian_mixture_model(mixture);
  backend::GaussianMixtureBackend backend(mixture);
  data::SyntheticMixtureSource source(three_clusters(1000));
  GlobalParamsCell cell;
  DriverConfig config = data_init_config();
  config.collect_performance_data = true;
  SubsamplingDriver driver(model, backend, source, cell, config);
  driver.run(3, 2, 16);
  std::string report = driver.performance_report();
  EXPECT_NE(report.find("\"profiler_data\""), std::string::npos);
  EXPECT_NE(report.find("global_step"), std::string::npos);
  EXPECT_NE(report.find("reset_locals"), std::string::npos);
  EXPECT_NE(report.find("\"iterations_completed\" : 3"), std::string::npos);

  SubsamplingDriver quiet(model, backend, source, cell, data_init_config());
  quiet.run(1, 1, 16);
  EXPECT_TRUE(quiet.performance_report().empty());
}

TEST(testdriver, persistent_local_factors) {
  backend::GaussianMixtureConfig mixture(3, 2);
  model::Model model = backend::build_gaussian_mixture_model(mixture);
  backend::GaussianMixtureBackend backend(mixture);
  data::InMemoryDataSource source(
      sample_mixture(three_cluster_means(), 40, 5),
      SamplingScheme::SHUFFLED_EPOCHS);
  GlobalParamsCell cell;
  DriverConfig config = data_init_config();
  config.local_backing = LocalBacking::PERSISTENT;
  SubsamplingDriver driver(model, backend, source, cell, config);
  EXPECT_EQ(driver.local_store().backing(), LocalBacking::PERSISTENT);

  // one epoch visits every data point once
  RunResult result = driver.run(4, 5, 10);
  EXPECT_EQ(result.iterations_completed, 4u);
  EXPECT_FALSE(driver.local_store().active());
  const auto& store =
      dynamic_cast<const PersistentLocalFactorStore&>(driver.local_store());
  for (uint n = 0; n < 40; n++) {
    EXPECT_GT(store.row("z.logits", n).cwiseAbs().maxCoeff(), 0.0) << n;
  }
}
