/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <chrono>
#include <stack>
#include <string>
#include <vector>

namespace mbvi {

enum class ProfilerEvent {
  RUN,
  INITIALIZE,
  OUTER_ITERATION,
  NEXT_BATCH,
  ALLOCATE_LOCALS,
  BIND_SUBGRAPH,
  LOCAL_STEP,
  GLOBAL_STEP,
  RESET_LOCALS,
};

std::string to_string(ProfilerEvent kind);

struct Event {
  bool begin;
  ProfilerEvent kind;
  std::chrono::high_resolution_clock::time_point timestamp;
};

struct ProfilerData {
  std::vector<Event> events;
  std::stack<ProfilerEvent> in_flight;
  ProfilerData();
  void begin(ProfilerEvent kind);
  void finish(ProfilerEvent kind);
  void clear();
};

} // namespace mbvi
