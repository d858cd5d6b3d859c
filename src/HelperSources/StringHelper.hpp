//
// Created by Constantin on 09.10.2017.
//

#ifndef RQHARNESS_STRINGHELPER_H
#define RQHARNESS_STRINGHELPER_H

#include <fmt/format.h>

#include <cstdint>
#include <sstream>
#include <string>

class StringHelper {
 public:
  static std::string bytes_as_string_hex(const uint8_t* data,
                                         std::size_t data_len) {
    std::stringstream ss;
    ss << "[";
    for (std::size_t i = 0; i < data_len; i++) {
      ss << fmt::format("0x{:02x}", data[i]);
      if (i != data_len - 1) {
        ss << ",";
      }
    }
    ss << "]";
    return ss.str();
  }
};

#endif  // RQHARNESS_STRINGHELPER_H
