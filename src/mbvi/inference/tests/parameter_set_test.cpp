/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <limits>
#include <stdexcept>

#include <gtest/gtest.h>

#include "mbvi/errors.h"
#include "mbvi/inference/parameter_set.h"

using namespace mbvi;
using namespace inference;

TEST(testinference, parameter_set_flatten) {
  EXPECT_EQ(tensor_name("beta", "loc"), "beta.loc");

  ParameterSet params;
  EXPECT_TRUE(params.empty());
  Eigen::MatrixXd a(2, 2);
  a << 1, 2, 3, 4;
  Eigen::MatrixXd b(1, 1);
  b << 5;
  params.add("b.second", b);
  params.add("a.first", a);
  EXPECT_THROW(params.add("a.first", a), std::invalid_argument);
  EXPECT_EQ(params.num_tensors(), 2);
  EXPECT_EQ(params.size(), 5);
  EXPECT_TRUE(params.has("a.first"));
  EXPECT_FALSE(params.has("c"));
  EXPECT_THROW(params.at("c"), std::out_of_range);
  EXPECT_EQ(params.names(), std::vector<std::string>({"b.second", "a.first"}));

  // insertion order, column-major within a tensor
  Eigen::VectorXd flat;
  params.get_flattened(flat);
  Eigen::VectorXd expected(5);
  expected << 5, 1, 3, 2, 4;
  EXPECT_EQ(flat, expected);

  flat *= 2;
  params.set_flattened(flat);
  EXPECT_EQ(params.at("a.first")(0, 1), 4);
  EXPECT_EQ(params.at("b.second")(0, 0), 10);
  EXPECT_THROW(params.set_flattened(Eigen::VectorXd::Zero(4)), ShapeError);
  // a rejected write changes nothing
  EXPECT_EQ(params.at("b.second")(0, 0), 10);

  EXPECT_TRUE(params.all_finite());
  params.at("a.first")(1, 1) = std::numeric_limits<double>::quiet_NaN();
  EXPECT_FALSE(params.all_finite());
  params.set_zero();
  EXPECT_TRUE(params.all_finite());
  EXPECT_EQ(params.at("a.first").sum(), 0);
  params.clear();
  EXPECT_TRUE(params.empty());
  EXPECT_EQ(params.size(), 0);
}

TEST(testinference, global_params_cell_snapshot) {
  GlobalParamsCell cell;
  cell.params.add("beta.loc", Eigen::MatrixXd::Ones(2, 2));
  ParameterSet copy = cell.snapshot();
  cell.params.at("beta.loc")(0, 0) = 7;
  // the snapshot is a copy
  EXPECT_EQ(copy.at("beta.loc")(0, 0), 1);
  EXPECT_EQ(cell.snapshot().at("beta.loc")(0, 0), 7);
}
