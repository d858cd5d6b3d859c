/*
 *   This program is free software; you can redistribute it and/or modify
 *   it under the terms of the GNU General Public License as published by
 *   the Free Software Foundation; version 3.
 *
 *   This program is distributed in the hope that it will be useful,
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *   GNU General Public License for more details.
 *
 *   You should have received a copy of the GNU General Public License along
 *   with this program; if not, write to the Free Software Foundation, Inc.,
 *   51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */

#include <unistd.h>

#include <cstdio>
#include <string>
#include <vector>

#include "../src/bench/BenchmarkDriver.h"
#include "../src/bench/Reporter.h"
#include "../src/codec/RaptorQCodec.h"
#include "../src/rqharness_spdlog.h"

// Measures the encode / decode throughput of the codec on one CPU core for a
// fixed table of payload sizes and prints one row per size.

struct Options {
  // skip all cases with more data than this, 0 = no limit
  std::size_t max_data_size = 0;
  // only run the case with this label, empty = all
  std::string label;
  bool enable_debug = false;
};

static bool should_run(const rqharness::BenchCase &bench_case,
                       const Options &options) {
  if (options.max_data_size != 0 &&
      bench_case.data_size > options.max_data_size) {
    return false;
  }
  if (!options.label.empty() && options.label != bench_case.label) {
    return false;
  }
  return true;
}

int main(int argc, char *const *argv) {
  Options options{};
  int opt;
  while ((opt = getopt(argc, argv, "s:l:d")) != -1) {
    switch (opt) {
      case 's':
        try {
          options.max_data_size = std::stoull(optarg);
        } catch (const std::exception &e) {
          fprintf(stderr, "Invalid max_data_size %s (%s)\n", optarg, e.what());
          return 1;
        }
        break;
      case 'l':
        options.label = optarg;
        break;
      case 'd':
        options.enable_debug = true;
        break;
      default: /* '?' */
        fprintf(stderr,
                "Usage: %s [-s max_data_size] [-l label e.g. \"64 KB\"] [-d "
                "debug logging]\n",
                argv[0]);
        return 1;
    }
  }
  rqharness::log::set_debug_enabled(options.enable_debug);
  const rqharness::RaptorQCodec codec{};
  const rqharness::BenchmarkDriver driver(codec);
  rqharness::reporter::print_preamble(codec.name());
  rqharness::reporter::print_header();
  int n_cases = 0;
  try {
    for (const auto &bench_case : rqharness::BENCH_CASES) {
      if (!should_run(bench_case, options)) continue;
      const auto result = driver.run_case(bench_case);
      rqharness::reporter::print_row(result);
      n_cases++;
    }
  } catch (const std::exception &e) {
    // CorrectnessError, or a codec rejecting its input
    rqharness::log::get_default()->critical("{}", e.what());
    return 1;
  }
  if (n_cases == 0) {
    rqharness::log::get_default()->warn("No benchmark case selected");
  }
  return 0;
}
