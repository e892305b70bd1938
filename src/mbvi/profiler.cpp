/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "mbvi/profiler.h"

using namespace std::chrono;

namespace mbvi {

std::string to_string(ProfilerEvent kind) {
  switch (kind) {
    case ProfilerEvent::RUN:
      return "run";
    case ProfilerEvent::INITIALIZE:
      return "initialize";
    case ProfilerEvent::OUTER_ITERATION:
      return "outer_iteration";
    case ProfilerEvent::NEXT_BATCH:
      return "next_batch";
    case ProfilerEvent::ALLOCATE_LOCALS:
      return "allocate_locals";
    case ProfilerEvent::BIND_SUBGRAPH:
      return "bind_subgraph";
    case ProfilerEvent::LOCAL_STEP:
      return "local_step";
    case ProfilerEvent::GLOBAL_STEP:
      return "global_step";
    case ProfilerEvent::RESET_LOCALS:
      return "reset_locals";
  }
  return std::to_string(static_cast<int>(kind));
}

ProfilerData::ProfilerData() {}

void ProfilerData::begin(ProfilerEvent kind) {
  auto t = high_resolution_clock::now();
  events.push_back({true, kind, t});
  in_flight.push(kind);
}

void ProfilerData::finish(ProfilerEvent kind) {
  auto t = high_resolution_clock::now();
  while (!in_flight.empty()) {
    ProfilerEvent top = in_flight.top();
    in_flight.pop();
    events.push_back({false, top, t});
    if (top == kind) {
      break;
    }
  }
}

void ProfilerData::clear() {
  events.clear();
  in_flight = std::stack<ProfilerEvent>();
}

} // namespace mbvi
