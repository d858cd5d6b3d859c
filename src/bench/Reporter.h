#ifndef RQHARNESS_REPORTER_H
#define RQHARNESS_REPORTER_H

#include <string>

#include "BenchmarkDriver.h"

// Fixed width console table:
// Size       | T      | Encode MB/s | Decode MB/s
namespace rqharness::reporter {

std::string format_preamble(const std::string &codec_name);
// header and separator line
std::string format_header();
std::string format_row(const BenchResult &result);

void print_preamble(const std::string &codec_name);
void print_header();
void print_row(const BenchResult &result);

}  // namespace rqharness::reporter

#endif  // RQHARNESS_REPORTER_H
