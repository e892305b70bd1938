/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include "mbvi/backend/gaussian_mixture.h"
#include "mbvi/data/in_memory_source.h"
#include "mbvi/inference/inference_step.h"
#include "mbvi/inference/subsampling_driver.h"
#include "mbvi/inference/tests/mixture_util_test.h"

using namespace mbvi;
using namespace inference;

TEST(testsgld, mixture_means) {
  const Eigen::MatrixXd means = three_cluster_means();
  backend::GaussianMixtureConfig mixture(3, 2, 10.0, 1.0);
  model::Model model = backend::build_gaussian_mixture_model(
      mixture, VariationalFamily::EMPIRICAL);
  backend::GaussianMixtureBackend backend(mixture);
  data::InMemoryDataSource source(sample_mixture(means, 1000, 23));
  GlobalParamsCell cell;

  SGLDStep sgld(
      backend,
      SGLDConfig(0.003, 0.55, 1000),
      OptimizerConfig(OptimizerType::ADAM, 1.0));
  DriverConfig config;
  config.init_type = InitType::DATA;
  SubsamplingDriver driver(model, backend, source, cell, sgld, config);
  EXPECT_EQ(&driver.inference_step(), &sgld);

  RunResult result = driver.run(2000, 5, 50);
  EXPECT_EQ(result.iterations_completed, 2000u);
  EXPECT_EQ(sgld.num_steps(), 2000u);
  EXPECT_LT(sgld.step_size(), 0.003);

  const distribution::Empirical& samples = sgld.samples("beta.value");
  EXPECT_EQ(samples.num_recorded(), 2000u);
  EXPECT_EQ(samples.size(), 1000u);
  const Eigen::MatrixXd posterior_mean = samples.mean(100);
  ASSERT_TRUE(posterior_mean.allFinite());
  EXPECT_LT(max_nearest_distance(means, posterior_mean), 0.5);
  EXPECT_LT(max_nearest_distance(posterior_mean, means), 0.5);
  // the chain keeps moving
  EXPECT_GT(samples.variance(100).maxCoeff(), 0.0);
}
