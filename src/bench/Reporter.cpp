#include "Reporter.h"

#include <fmt/format.h>

#include <iostream>

namespace rqharness::reporter {

std::string format_preamble(const std::string &codec_name) {
  return fmt::format(
      "rqharness benchmark ({})\n"
      "Loss: {}%, Warmup: 3 (1 for >=1MB), Iterations: 11 (5 for >=1MB)\n",
      codec_name, DECODE_LOSS_PCT);
}

std::string format_header() {
  return fmt::format("{:<11}| {:<7}| {:<12}| {:<12}\n", "Size", "T",
                     "Encode MB/s", "Decode MB/s") +
         fmt::format("{:-<11}|{:-<8}|{:-<13}|{:-<12}\n", "", "", "", "");
}

std::string format_row(const BenchResult &result) {
  return fmt::format("{:<11}| {:<7}| {:<12.1f}| {:<12.1f}\n",
                     result.bench_case.label, result.bench_case.symbol_size,
                     result.encode_mbps, result.decode_mbps);
}

void print_preamble(const std::string &codec_name) {
  std::cout << format_preamble(codec_name) << std::endl;
}

void print_header() { std::cout << format_header() << std::flush; }

void print_row(const BenchResult &result) {
  std::cout << format_row(result) << std::flush;
}

}  // namespace rqharness::reporter
