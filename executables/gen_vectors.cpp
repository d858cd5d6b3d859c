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
#include <filesystem>
#include <string>

#include "../src/codec/RaptorQCodec.h"
#include "../src/rqharness_spdlog.h"
#include "../src/vectors/VectorGenerator.h"
#include "../src/vectors/VectorSpecs.hpp"

// Writes the deterministic RQ01 interop test vectors, or checks existing ones
// (-c) by decoding them and comparing them against a fresh regeneration.

struct Options {
  std::string output_dir = "test/fixtures/interop";
  bool check_only = false;
  bool enable_debug = false;
};

static int generate_all(const rqharness::Codec &codec,
                        const Options &options) {
  std::filesystem::create_directories(options.output_dir);
  for (const auto &spec : rqharness::VECTOR_SPECS) {
    rqharness::write_vector(codec, spec, options.output_dir);
  }
  rqharness::log::get_default()->info("Wrote {} vectors to {}",
                                      rqharness::VECTOR_SPECS.size(),
                                      options.output_dir);
  return 0;
}

static int check_all(const rqharness::Codec &codec, const Options &options) {
  int n_failed = 0;
  for (const auto &spec : rqharness::VECTOR_SPECS) {
    const auto result = rqharness::check_vector(codec, spec, options.output_dir);
    if (result.ok()) {
      rqharness::log::get_default()->info("{}: OK", spec.name);
      continue;
    }
    n_failed++;
    if (!result.error.empty()) {
      rqharness::log::get_default()->error("{}: {}", spec.name, result.error);
    } else {
      rqharness::log::get_default()->error(
          "{}: {} decodes={} identical={}", spec.name, result.path,
          result.decodes, result.identical_to_regeneration);
    }
  }
  if (n_failed > 0) {
    rqharness::log::get_default()->error("{}/{} vectors failed", n_failed,
                                         rqharness::VECTOR_SPECS.size());
    return 1;
  }
  return 0;
}

int main(int argc, char *const *argv) {
  Options options{};
  int opt;
  while ((opt = getopt(argc, argv, "o:cd")) != -1) {
    switch (opt) {
      case 'o':
        options.output_dir = optarg;
        break;
      case 'c':
        options.check_only = true;
        break;
      case 'd':
        options.enable_debug = true;
        break;
      default: /* '?' */
        fprintf(stderr,
                "Usage: %s [-o output_dir] [-c check existing vectors] [-d "
                "debug logging]\n",
                argv[0]);
        return 1;
    }
  }
  rqharness::log::set_debug_enabled(options.enable_debug);
  const rqharness::RaptorQCodec codec{};
  rqharness::log::get_default()->debug("Codec: {}", codec.name());
  try {
    if (options.check_only) {
      return check_all(codec, options);
    }
    return generate_all(codec, options);
  } catch (const std::exception &e) {
    // FixtureIOError, filesystem_error, or a codec rejecting its input
    rqharness::log::get_default()->critical("{}", e.what());
    return 1;
  }
}
