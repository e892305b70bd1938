/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stack>
#include <string>

#include "mbvi/inference/subsampling_driver.h"

using namespace std::chrono;

namespace mbvi {
namespace inference {

class JSON {
 public:
  std::string str() {
    return os.str();
  }

  void start_object() {
    os << "{\n";
    needs_comma.push(false);
  }

  void end_object() {
    os << "\n}";
    needs_comma.pop();
  }

  void start_array() {
    os << "[\n";
    needs_comma.push(false);
  }

  void end_array() {
    os << "\n]";
    needs_comma.pop();
  }

  void text(std::string v) {
    os << "\"" << v << "\"";
  }

  void boolean(bool v) {
    os << (v ? "true" : "false");
  }

  void date(system_clock::time_point v) {
    auto t = system_clock::to_time_t(v);
    struct tm lt;
    localtime_r(&t, &lt);
    os << "\"" << std::put_time(&lt, "%Y-%m-%d %H:%M:%S") << "\"";
  }

  void ticks(high_resolution_clock::time_point v) {
    number(static_cast<long>(v.time_since_epoch().count()));
  }

  void number(long v) {
    os << v;
  }

  void real(double v) {
    os << std::setprecision(17) << v;
  }

  void member(std::string name) {
    comma();
    os << "\"" << name << "\" : ";
  }

  void boolean(std::string name, bool v) {
    member(name);
    boolean(v);
  }

  void text(std::string name, std::string v) {
    member(name);
    text(v);
  }

  void date(std::string name, system_clock::time_point v) {
    member(name);
    date(v);
  }

  void ticks(std::string name, high_resolution_clock::time_point v) {
    member(name);
    ticks(v);
  }

  void number(std::string name, long v) {
    member(name);
    number(v);
  }

  void real(std::string name, double v) {
    member(name);
    real(v);
  }

  void comma() {
    if (needs_comma.top()) {
      os << ",\n";
    } else {
      needs_comma.pop();
      needs_comma.push(true);
    }
  }

 private:
  std::ostringstream os;
  std::stack<bool> needs_comma;
};

void SubsamplingDriver::produce_performance_report(
    uint num_outer_iters,
    uint local_iters_per_outer,
    uint batch_size,
    const RunResult& result) {
  _performance_report = "";
  if (!_config.collect_performance_data) {
    return;
  }
  JSON js;
  js.start_object();
  js.text("title", "mbvi subsampling performance report");
  js.date("generated_at", system_clock::now());
  js.number("num_outer_iters", static_cast<long>(num_outer_iters));
  js.number("local_iters_per_outer", static_cast<long>(local_iters_per_outer));
  js.number("batch_size", static_cast<long>(batch_size));
  js.number("dataset_size", static_cast<long>(dataset_size()));
  js.number("seed", static_cast<long>(_config.seed));
  js.number("num_threads", static_cast<long>(_config.num_threads));
  js.text(
      "local_backing",
      _config.local_backing == LocalBacking::PERSISTENT ? "persistent"
                                                        : "ephemeral");
  js.number(
      "global_site_count",
      static_cast<long>(model.sites_of_kind(SiteKind::GLOBAL).size()));
  js.number(
      "local_site_count",
      static_cast<long>(model.sites_of_kind(SiteKind::LOCAL).size()));
  js.number(
      "observed_site_count",
      static_cast<long>(model.sites_of_kind(SiteKind::OBSERVED).size()));
  js.number(
      "iterations_completed", static_cast<long>(result.iterations_completed));
  js.boolean("stopped_early", result.stopped_early);
  if (!result.losses.empty()) {
    js.real("final_loss", result.losses.back());
  }

  js.member("profiler_data");
  js.start_array();
  for (auto e : profiler_data.events) {
    js.comma();
    js.start_object();
    js.boolean("begin", e.begin);
    js.text("kind", to_string(e.kind));
    js.ticks("timestamp", e.timestamp);
    js.end_object();
  }
  js.end_array();
  js.end_object();
  _performance_report = js.str();
}

} // namespace inference
} // namespace mbvi
